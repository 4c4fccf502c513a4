/*
 * 설명: 레이팅 대상 모델(참가자) 등록부와 URL 슬러그 발급을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/entrant_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace arena {

class LedgerRepository;

struct Entrant {
  std::string id;
  std::string name;
  std::string provider;
  std::string slug;
  bool active{true};
  std::chrono::system_clock::time_point created_at{};
};

// "Gemini 2.0 Flash" -> "gemini-2-0-flash"
std::string MakeSlug(const std::string& name);
// 엔트런트 ID의 SHA-256 앞부분을 hex로 돌려준다.
std::string SlugSuffix(const std::string& entrant_id, std::size_t hex_length);

class EntrantRegistry {
 public:
  // repository가 nullptr이면 메모리에만 보관한다.
  explicit EntrantRegistry(std::shared_ptr<LedgerRepository> repository = nullptr);

  Entrant Register(const std::string& id, const std::string& name, const std::string& provider, bool active = true);
  void Restore(const std::vector<Entrant>& entrants);
  Entrant SetActive(const std::string& id, bool active);

  std::optional<Entrant> Find(const std::string& id) const;
  std::optional<Entrant> FindBySlug(const std::string& slug) const;
  bool Contains(const std::string& id) const;
  std::vector<Entrant> List(bool active_only) const;
  std::size_t Size() const;

 private:
  std::string AssignSlug(const std::string& id, const std::string& name) const;

  std::shared_ptr<LedgerRepository> repository_;
  std::unordered_map<std::string, Entrant> entrants_;
  std::unordered_map<std::string, std::string> slug_index_;
  mutable std::shared_mutex mutex_;
};

}  // namespace arena
