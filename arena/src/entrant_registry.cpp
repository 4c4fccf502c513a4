/*
 * 설명: 참가자 등록, 슬러그 충돌 회피, 활성 상태 변경을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/entrant_registry_test.cpp
 */
#include "arena/entrant_registry.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>

#include <openssl/evp.h>

#include "arena/ledger_repository.hpp"
#include "arena/rating_error.hpp"

namespace arena {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}
}  // namespace

std::string MakeSlug(const std::string& name) {
  std::string slug;
  slug.reserve(name.size());
  bool pending_dash = false;
  for (unsigned char ch : name) {
    char lower = static_cast<char>(std::tolower(ch));
    bool keep = (lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9');
    if (!keep) {
      pending_dash = true;
      continue;
    }
    if (pending_dash && !slug.empty()) {
      slug.push_back('-');
    }
    pending_dash = false;
    slug.push_back(lower);
  }
  return slug;
}

std::string SlugSuffix(const std::string& entrant_id, std::size_t hex_length) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(entrant_id.data(), entrant_id.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 계산 실패");
  }
  std::string hex = BytesToHex(digest, digest_len);
  return hex.substr(0, std::min(hex_length, hex.size()));
}

EntrantRegistry::EntrantRegistry(std::shared_ptr<LedgerRepository> repository) : repository_(std::move(repository)) {}

Entrant EntrantRegistry::Register(const std::string& id, const std::string& name, const std::string& provider,
                                  bool active) {
  if (id.empty() || name.empty()) {
    throw RatingException(RatingError::kInvalidArgument, "id와 name은 비어 있을 수 없습니다");
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (entrants_.count(id) > 0) {
    throw RatingException(RatingError::kDuplicateEntrant, "이미 등록된 참가자입니다: " + id);
  }
  // 원장 시각과 같은 마이크로초 정밀도로 맞춘다.
  auto created_at = std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
  Entrant entrant{id, name, provider, AssignSlug(id, name), active, created_at};
  if (repository_ && !repository_->SaveEntrant(entrant)) {
    throw RatingException(RatingError::kDuplicateEntrant, "저장소에 이미 존재하는 참가자입니다: " + id);
  }
  slug_index_[entrant.slug] = id;
  entrants_[id] = entrant;
  return entrant;
}

void EntrantRegistry::Restore(const std::vector<Entrant>& entrants) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entrants_.clear();
  slug_index_.clear();
  for (const auto& entrant : entrants) {
    slug_index_[entrant.slug] = entrant.id;
    entrants_[entrant.id] = entrant;
  }
}

Entrant EntrantRegistry::SetActive(const std::string& id, bool active) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = entrants_.find(id);
  if (it == entrants_.end()) {
    throw RatingException(RatingError::kUnknownEntrant, "등록되지 않은 참가자입니다: " + id);
  }
  if (repository_) {
    repository_->UpdateEntrantActive(id, active);
  }
  it->second.active = active;
  return it->second;
}

std::optional<Entrant> EntrantRegistry::Find(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = entrants_.find(id);
  if (it == entrants_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Entrant> EntrantRegistry::FindBySlug(const std::string& slug) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = slug_index_.find(slug);
  if (it == slug_index_.end()) {
    return std::nullopt;
  }
  return entrants_.at(it->second);
}

bool EntrantRegistry::Contains(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entrants_.count(id) > 0;
}

std::vector<Entrant> EntrantRegistry::List(bool active_only) const {
  std::vector<Entrant> result;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    result.reserve(entrants_.size());
    for (const auto& [id, entrant] : entrants_) {
      if (active_only && !entrant.active) {
        continue;
      }
      result.push_back(entrant);
    }
  }
  std::sort(result.begin(), result.end(), [](const Entrant& lhs, const Entrant& rhs) { return lhs.id < rhs.id; });
  return result;
}

std::size_t EntrantRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entrants_.size();
}

std::string EntrantRegistry::AssignSlug(const std::string& id, const std::string& name) const {
  std::string base = MakeSlug(name);
  if (!base.empty() && slug_index_.count(base) == 0) {
    return base;
  }
  // 같은 이름이 이미 있으면 ID 해시를 붙이고, 그래도 겹치면 해시를 늘린다.
  for (std::size_t len = 6; len <= 64; len += 2) {
    std::string suffix = SlugSuffix(id, len);
    std::string candidate = base.empty() ? suffix : base + "-" + suffix;
    if (slug_index_.count(candidate) == 0) {
      return candidate;
    }
  }
  std::string fallback = base.empty() ? SlugSuffix(id, 64) : base + "-" + SlugSuffix(id, 64);
  for (std::size_t n = 2;; ++n) {
    std::string candidate = fallback + "-" + std::to_string(n);
    if (slug_index_.count(candidate) == 0) {
      return candidate;
    }
  }
}

}  // namespace arena
