/*
 * 설명: 토론 결과 수집, 보정, 투영 재구축을 원자적으로 수행하는 레이팅 엔진의 단일 진입점.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_service_test.cpp, arena/tests/unit/rating_concurrency_test.cpp,
 *         arena/tests/it/ledger_persistence_it_test.cpp
 */
#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "arena/entrant_registry.hpp"
#include "arena/ledger_repository.hpp"
#include "arena/observability.hpp"
#include "arena/rating_ledger.hpp"
#include "arena/rating_math.hpp"
#include "arena/rating_store.hpp"

namespace arena {

struct RatingSettings {
  int base_rating{1500};
  int k_factor{32};
  std::size_t recent_capacity{10};
};

struct AppendResult {
  RatingEvent event;
  // false면 이미 반영된 토론이며 event는 기존 기록이다.
  bool created;
};

// 같은 시점에 읽은 원장과 투영. 집계 쿼리가 서로 어긋나지 않게 한다.
struct LedgerView {
  std::shared_ptr<const EventLog> events;
  std::unordered_map<std::string, RatingSnapshot> snapshots;
  int base_rating;

  const RatingSnapshot* Find(const std::string& entrant_id) const;
};

struct RebuildReport {
  std::size_t events_applied{0};
  std::size_t entrants{0};
  // 재구축 전 투영과 값이 달랐던 참가자.
  std::vector<std::string> diverged;
  // 새 k로 다시 계산되어 값이 바뀐 이벤트 수.
  std::size_t recomputed{0};
  int k_factor{0};
  long elapsed_ms{0};
};

class RatingService {
 public:
  RatingService(const RatingSettings& settings, std::shared_ptr<EntrantRegistry> registry,
                std::shared_ptr<LedgerRepository> repository = nullptr,
                std::shared_ptr<Observability> observability = nullptr);

  // 저장소의 참가자/원장을 읽어 메모리 상태를 다시 만든다.
  void LoadFromRepository();

  Entrant RegisterEntrant(const std::string& id, const std::string& name, const std::string& provider,
                          bool active = true);

  AppendResult AppendEvent(const std::string& debate_id, const std::string& entrant_a, const std::string& entrant_b,
                           Outcome outcome);
  RatingEvent ReverseEvent(std::uint64_t event_id);
  // 원장 전체를 결과(outcome)와 순서만으로 다시 계산해 원장과 투영을 교체한다.
  // k_factor를 주면 이후 수집도 그 k를 쓴다. 값이 바뀐 이벤트는 저장소에도 다시 기록한다.
  RebuildReport RebuildFromLedger(std::optional<int> k_factor = std::nullopt);

  RatingSnapshot GetCurrent(const std::string& entrant_id) const;
  EventRange ListEvents(const std::string& entrant_id, std::optional<Clock::time_point> since = std::nullopt) const;
  EventRange AllEvents() const;
  std::vector<RatingEvent> RecentEvents(const std::string& entrant_id, std::size_t limit) const;
  std::optional<RatingEvent> FindEvent(std::uint64_t event_id) const;
  std::optional<RatingEvent> FindByDebate(const std::string& debate_id) const;
  LedgerView View() const;

  std::size_t EventCount() const;
  bool IsRebuilding() const { return rebuilding_.load(); }
  int KFactor() const { return k_factor_.load(); }
  RatingSettings Settings() const;
  std::shared_ptr<EntrantRegistry> Registry() const { return registry_; }

  // 테스트용. 계산된 이벤트를 검증 직전에 변조한다.
  void SetComputeInjector(const std::function<void(RatingEvent&)>& injector);

 private:
  static constexpr std::size_t kStripeCount = 64;

  class PairLock;
  class DebateReservation;

  void RequireEntrant(const std::string& entrant_id) const;
  void VerifyComputed(const RatingEvent& event, int k_factor) const;
  std::vector<RatingEvent> RecomputeEvents(const EventLog& events, const RatingMath& math, RatingStore& store) const;
  std::size_t PersistRecomputed(const EventLog& before, const std::vector<RatingEvent>& after);
  void StampEvent(RatingEvent& event);
  void Publish(const RatingEvent& event);
  nlohmann::json EventFields(const RatingEvent& event) const;

  RatingSettings settings_;
  // 수집 중에는 ingest_gate_ 공유 락으로, 변경은 배타 락 안에서만 한다.
  std::atomic<int> k_factor_;
  std::shared_ptr<EntrantRegistry> registry_;
  std::shared_ptr<LedgerRepository> repository_;
  std::shared_ptr<Observability> observability_;

  RatingLedger ledger_;
  RatingStore store_;
  // ledger_ + store_ 보호. 이벤트 하나의 반영은 이 락 안에서 한 번에 보인다.
  mutable std::shared_mutex state_mutex_;
  // 수집/보정은 공유, 재구축은 배타.
  std::shared_mutex ingest_gate_;
  std::array<std::mutex, kStripeCount> entrant_stripes_;

  std::mutex sequence_mutex_;
  std::uint64_t next_event_id_{1};
  Clock::time_point last_timestamp_{};

  std::mutex inflight_mutex_;
  std::unordered_set<std::string> inflight_debates_;

  std::atomic<bool> rebuilding_{false};
  std::function<void(RatingEvent&)> compute_injector_;
};

}  // namespace arena
