/*
 * 설명: 결과 수집과 보정을 "계산 → 저장소 커밋 → 메모리 반영" 순서로 원자적으로 수행한다.
 *       같은 참가자를 건드리는 요청은 참가자 스트라이프 락으로 직렬화하고, 서로 다른 쌍은 병렬로 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_service_test.cpp, arena/tests/unit/rating_concurrency_test.cpp,
 *         arena/tests/it/ledger_persistence_it_test.cpp
 */
#include "arena/rating_service.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <utility>

#include "arena/rating_error.hpp"

namespace arena {

class RatingService::PairLock {
 public:
  PairLock(std::array<std::mutex, kStripeCount>& stripes, const std::string& entrant_a, const std::string& entrant_b) {
    std::size_t first = std::hash<std::string>{}(entrant_a) % kStripeCount;
    std::size_t second = std::hash<std::string>{}(entrant_b) % kStripeCount;
    if (first > second) {
      std::swap(first, second);
    }
    // 항상 작은 인덱스부터 잠가 교착을 막는다.
    first_ = std::unique_lock<std::mutex>(stripes[first]);
    if (second != first) {
      second_ = std::unique_lock<std::mutex>(stripes[second]);
    }
  }

 private:
  std::unique_lock<std::mutex> first_;
  std::unique_lock<std::mutex> second_;
};

class RatingService::DebateReservation {
 public:
  DebateReservation(std::mutex& mutex, std::unordered_set<std::string>& inflight, const std::string& debate_id)
      : mutex_(mutex), inflight_(inflight), debate_id_(debate_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_ = inflight_.insert(debate_id_).second;
  }

  ~DebateReservation() {
    if (!reserved_) {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    inflight_.erase(debate_id_);
  }

  DebateReservation(const DebateReservation&) = delete;
  DebateReservation& operator=(const DebateReservation&) = delete;

  bool reserved() const { return reserved_; }

 private:
  std::mutex& mutex_;
  std::unordered_set<std::string>& inflight_;
  std::string debate_id_;
  bool reserved_{false};
};

const RatingSnapshot* LedgerView::Find(const std::string& entrant_id) const {
  auto it = snapshots.find(entrant_id);
  return it == snapshots.end() ? nullptr : &it->second;
}

RatingService::RatingService(const RatingSettings& settings, std::shared_ptr<EntrantRegistry> registry,
                             std::shared_ptr<LedgerRepository> repository,
                             std::shared_ptr<Observability> observability)
    : settings_(settings),
      k_factor_(settings.k_factor),
      registry_(std::move(registry)),
      repository_(std::move(repository)),
      observability_(observability ? std::move(observability) : std::make_shared<Observability>(LogLevel::kWarn)),
      store_(settings.base_rating, settings.recent_capacity) {
  if (!registry_) {
    registry_ = std::make_shared<EntrantRegistry>(repository_);
  }
}

void RatingService::LoadFromRepository() {
  if (!repository_) {
    return;
  }
  std::unique_lock<std::shared_mutex> gate(ingest_gate_);
  repository_->EnsureSchema();
  registry_->Restore(repository_->LoadEntrants());

  auto loaded = repository_->LoadEvents();
  const int k = k_factor_.load();
  // 설정된 k와 다른 k로 계산된 이벤트가 있으면 전체 원장을 현재 k로 다시 계산한다.
  bool stale = std::any_of(loaded.begin(), loaded.end(), [k](const RatingEvent& event) { return event.k_factor != k; });
  RatingLedger ledger;
  RatingStore store(settings_.base_rating, settings_.recent_capacity);
  std::size_t rewritten = 0;
  try {
    if (stale) {
      auto recomputed = RecomputeEvents(loaded, RatingMath(k), store);
      rewritten = PersistRecomputed(loaded, recomputed);
      ledger.Restore(std::move(recomputed));
    } else {
      for (const auto& event : loaded) {
        VerifyComputed(event, k);
      }
      ledger.Restore(std::move(loaded));
      store.RebuildFromLedger(*ledger.Events());
    }
  } catch (const RatingException& ex) {
    observability_->LogEvent(LogLevel::kError, "ledger.load_failed", {{"reason", ex.what()}});
    throw;
  }
  if (stale) {
    observability_->LogEvent(LogLevel::kWarn, "ledger.recomputed",
                             {{"events", ledger.Size()}, {"rewritten", rewritten}, {"kFactor", k}});
  }

  std::uint64_t last_id = ledger.LastEventId();
  auto events = ledger.Events();
  Clock::time_point last_ts = events->empty() ? Clock::time_point{} : events->back().occurred_at;
  std::size_t event_count = events->size();
  {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    ledger_ = std::move(ledger);
    store_ = std::move(store);
  }
  {
    std::lock_guard<std::mutex> lock(sequence_mutex_);
    next_event_id_ = last_id + 1;
    last_timestamp_ = last_ts;
  }
  observability_->LogEvent(LogLevel::kInfo, "ledger.loaded",
                           {{"events", event_count}, {"entrants", registry_->Size()}});
}

Entrant RatingService::RegisterEntrant(const std::string& id, const std::string& name, const std::string& provider,
                                       bool active) {
  Entrant entrant = registry_->Register(id, name, provider, active);
  observability_->LogEvent(LogLevel::kInfo, "entrant.registered",
                           {{"entrantId", entrant.id}, {"slug", entrant.slug}, {"provider", entrant.provider}});
  return entrant;
}

AppendResult RatingService::AppendEvent(const std::string& debate_id, const std::string& entrant_a,
                                        const std::string& entrant_b, Outcome outcome) {
  if (debate_id.empty()) {
    throw RatingException(RatingError::kInvalidArgument, "debateId가 비어 있습니다");
  }
  if (entrant_a == entrant_b) {
    throw RatingException(RatingError::kInvalidArgument, "같은 참가자끼리는 토론 결과를 기록할 수 없습니다");
  }
  RequireEntrant(entrant_a);
  RequireEntrant(entrant_b);

  std::shared_lock<std::shared_mutex> gate(ingest_gate_);
  PairLock pair(entrant_stripes_, entrant_a, entrant_b);

  std::optional<RatingEvent> existing;
  {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    existing = ledger_.FindByDebate(debate_id);
  }
  if (existing) {
    if (!existing->IsBetween(entrant_a, entrant_b)) {
      throw RatingException(RatingError::kDuplicateEvent, "다른 참가자 쌍으로 이미 반영된 토론입니다: " + debate_id);
    }
    observability_->LogEvent(LogLevel::kWarn, "rating.duplicate", EventFields(*existing));
    return AppendResult{*existing, false};
  }

  DebateReservation reservation(inflight_mutex_, inflight_debates_, debate_id);
  if (!reservation.reserved()) {
    throw RatingException(RatingError::kDuplicateEvent, "같은 토론이 다른 요청에서 처리 중입니다: " + debate_id);
  }

  RatingEvent event;
  event.debate_id = debate_id;
  event.entrant_a = entrant_a;
  event.entrant_b = entrant_b;
  event.outcome = outcome;
  {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    event.a_before = store_.GetCurrent(entrant_a).rating;
    event.b_before = store_.GetCurrent(entrant_b).rating;
  }
  // 게이트를 공유로 잡고 있는 동안 k는 바뀌지 않는다.
  const int k = k_factor_.load();
  // B의 변화량은 A의 부호 반대로 정해 반올림 오차와 무관하게 합이 0이 되게 한다.
  int delta_a = RatingMath(k).Delta(event.a_before, event.b_before, RatingMath::ScoreFor(outcome, Side::kA));
  event.a_after = event.a_before + delta_a;
  event.b_after = event.b_before - delta_a;
  event.k_factor = k;
  if (compute_injector_) {
    compute_injector_(event);
  }
  VerifyComputed(event, k);
  StampEvent(event);

  if (repository_ && !repository_->SaveEvent(event)) {
    throw RatingException(RatingError::kDuplicateEvent, "저장소에 이미 반영된 토론입니다: " + debate_id);
  }
  Publish(event);
  observability_->LogEvent(LogLevel::kInfo, "rating.applied", EventFields(event));
  return AppendResult{event, true};
}

RatingEvent RatingService::ReverseEvent(std::uint64_t event_id) {
  std::shared_lock<std::shared_mutex> gate(ingest_gate_);
  std::optional<RatingEvent> original;
  {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    original = ledger_.Find(event_id);
  }
  if (!original) {
    throw RatingException(RatingError::kEventNotFound, "이벤트를 찾을 수 없습니다: " + std::to_string(event_id));
  }
  if (original->IsReversal()) {
    throw RatingException(RatingError::kNotReversible,
                          "보정 이벤트는 다시 보정할 수 없습니다: " + std::to_string(event_id));
  }

  PairLock pair(entrant_stripes_, original->entrant_a, original->entrant_b);
  RatingEvent event;
  event.debate_id = original->debate_id;
  event.entrant_a = original->entrant_a;
  event.entrant_b = original->entrant_b;
  event.outcome = original->outcome;
  event.reverses_event_id = event_id;
  event.k_factor = original->k_factor;
  {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    if (ledger_.ReversalOf(event_id)) {
      throw RatingException(RatingError::kAlreadyReversed, "이미 보정된 이벤트입니다: " + std::to_string(event_id));
    }
    event.a_before = store_.GetCurrent(event.entrant_a).rating;
    event.b_before = store_.GetCurrent(event.entrant_b).rating;
  }
  event.a_after = event.a_before - original->DeltaA();
  event.b_after = event.b_before - original->DeltaB();
  VerifyComputed(event, event.k_factor);
  StampEvent(event);

  if (repository_ && !repository_->SaveEvent(event)) {
    throw RatingException(RatingError::kAlreadyReversed,
                          "저장소에 이미 보정이 기록되어 있습니다: " + std::to_string(event_id));
  }
  Publish(event);
  observability_->LogEvent(LogLevel::kWarn, "rating.reversed", EventFields(event));
  return event;
}

RebuildReport RatingService::RebuildFromLedger(std::optional<int> k_factor) {
  auto started = std::chrono::steady_clock::now();
  const int k = k_factor.value_or(k_factor_.load());
  if (k <= 0) {
    throw RatingException(RatingError::kInvalidArgument, "k는 양수여야 합니다: " + std::to_string(k));
  }
  std::unique_lock<std::shared_mutex> gate(ingest_gate_);
  rebuilding_.store(true);
  struct RebuildFlagReset {
    std::atomic<bool>& flag;
    ~RebuildFlagReset() { flag.store(false); }
  } flag_reset{rebuilding_};

  std::shared_ptr<const EventLog> events;
  std::vector<RatingSnapshot> previous;
  {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    events = ledger_.Events();
    previous = store_.All();
  }

  RatingLedger ledger;
  RatingStore rebuilt(settings_.base_rating, settings_.recent_capacity);
  RebuildReport report;
  try {
    auto recomputed = RecomputeEvents(*events, RatingMath(k), rebuilt);
    // 저장소 반영이 실패하면 메모리 상태는 그대로 둔다.
    report.recomputed = PersistRecomputed(*events, recomputed);
    ledger.Restore(std::move(recomputed));
  } catch (const RatingException& ex) {
    observability_->LogEvent(LogLevel::kError, "store.rebuild_failed", {{"reason", ex.what()}});
    throw;
  }

  report.events_applied = events->size();
  report.entrants = rebuilt.Size();
  report.k_factor = k;
  std::unordered_set<std::string> seen;
  for (const auto& old : previous) {
    seen.insert(old.entrant_id);
    RatingSnapshot fresh = rebuilt.GetCurrent(old.entrant_id);
    if (fresh.rating != old.rating || fresh.wins != old.wins || fresh.losses != old.losses ||
        fresh.draws != old.draws) {
      report.diverged.push_back(old.entrant_id);
    }
  }
  for (const auto& fresh : rebuilt.All()) {
    if (seen.count(fresh.entrant_id) == 0) {
      report.diverged.push_back(fresh.entrant_id);
    }
  }
  std::sort(report.diverged.begin(), report.diverged.end());

  {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    ledger_ = std::move(ledger);
    store_ = std::move(rebuilt);
  }
  k_factor_.store(k);
  report.elapsed_ms = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
  observability_->LogEvent(report.diverged.empty() ? LogLevel::kInfo : LogLevel::kWarn, "store.rebuilt",
                           {{"events", report.events_applied},
                            {"entrants", report.entrants},
                            {"diverged", report.diverged},
                            {"recomputed", report.recomputed},
                            {"kFactor", k},
                            {"elapsedMs", report.elapsed_ms}});
  return report;
}

std::vector<RatingEvent> RatingService::RecomputeEvents(const EventLog& events, const RatingMath& math,
                                                        RatingStore& store) const {
  std::unordered_map<std::uint64_t, RatingEvent> by_id;
  std::vector<RatingEvent> result;
  result.reserve(events.size());
  for (const auto& original : events) {
    RatingEvent event = original;
    event.a_before = store.GetCurrent(event.entrant_a).rating;
    event.b_before = store.GetCurrent(event.entrant_b).rating;
    if (original.IsReversal()) {
      auto target = by_id.find(original.reverses_event_id);
      if (target == by_id.end()) {
        throw RatingException(RatingError::kInvariantViolation,
                              "보정 대상보다 먼저 기록된 보정 이벤트입니다: " + std::to_string(original.event_id));
      }
      event.a_after = event.a_before - target->second.DeltaA();
      event.b_after = event.b_before - target->second.DeltaB();
      event.k_factor = target->second.k_factor;
    } else {
      int delta_a = math.Delta(event.a_before, event.b_before, RatingMath::ScoreFor(event.outcome, Side::kA));
      event.a_after = event.a_before + delta_a;
      event.b_after = event.b_before - delta_a;
      event.k_factor = math.KFactor();
    }
    VerifyComputed(event, event.k_factor);
    store.ApplyEvent(event);
    by_id[event.event_id] = event;
    result.push_back(std::move(event));
  }
  return result;
}

std::size_t RatingService::PersistRecomputed(const EventLog& before, const std::vector<RatingEvent>& after) {
  std::vector<RatingEvent> changed;
  for (std::size_t i = 0; i < after.size(); ++i) {
    const auto& old = before[i];
    const auto& fresh = after[i];
    if (old.a_before != fresh.a_before || old.b_before != fresh.b_before || old.a_after != fresh.a_after ||
        old.b_after != fresh.b_after || old.k_factor != fresh.k_factor) {
      changed.push_back(fresh);
    }
  }
  if (repository_) {
    repository_->RewriteEvents(changed);
  }
  return changed.size();
}

RatingSnapshot RatingService::GetCurrent(const std::string& entrant_id) const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return store_.GetCurrent(entrant_id);
}

EventRange RatingService::ListEvents(const std::string& entrant_id, std::optional<Clock::time_point> since) const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return EventRange(ledger_.Events(), entrant_id, since);
}

EventRange RatingService::AllEvents() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return EventRange(ledger_.Events(), std::string());
}

std::vector<RatingEvent> RatingService::RecentEvents(const std::string& entrant_id, std::size_t limit) const {
  std::shared_ptr<const EventLog> events;
  {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    events = ledger_.Events();
  }
  std::vector<RatingEvent> recent;
  for (auto it = events->rbegin(); it != events->rend() && recent.size() < limit; ++it) {
    if (it->Touches(entrant_id)) {
      recent.push_back(*it);
    }
  }
  return recent;
}

std::optional<RatingEvent> RatingService::FindEvent(std::uint64_t event_id) const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return ledger_.Find(event_id);
}

std::optional<RatingEvent> RatingService::FindByDebate(const std::string& debate_id) const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return ledger_.FindByDebate(debate_id);
}

LedgerView RatingService::View() const {
  LedgerView view;
  view.base_rating = settings_.base_rating;
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  view.events = ledger_.Events();
  for (auto& snapshot : store_.All()) {
    std::string id = snapshot.entrant_id;
    view.snapshots.emplace(std::move(id), std::move(snapshot));
  }
  return view;
}

std::size_t RatingService::EventCount() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return ledger_.Size();
}

void RatingService::RequireEntrant(const std::string& entrant_id) const {
  if (!registry_->Contains(entrant_id)) {
    throw RatingException(RatingError::kUnknownEntrant, "등록되지 않은 참가자입니다: " + entrant_id);
  }
}

RatingSettings RatingService::Settings() const {
  RatingSettings settings = settings_;
  settings.k_factor = k_factor_.load();
  return settings;
}

void RatingService::SetComputeInjector(const std::function<void(RatingEvent&)>& injector) {
  compute_injector_ = injector;
}

void RatingService::VerifyComputed(const RatingEvent& event, int k) const {
  bool zero_sum = event.DeltaA() + event.DeltaB() == 0;
  bool bounded = std::abs(event.DeltaA()) <= k && std::abs(event.DeltaB()) <= k;
  if (zero_sum && bounded) {
    return;
  }
  auto fields = EventFields(event);
  fields["zeroSum"] = zero_sum;
  fields["bounded"] = bounded;
  fields["kFactor"] = k;
  observability_->LogEvent(LogLevel::kError, "rating.invariant_violation", fields);
  throw RatingException(RatingError::kInvariantViolation,
                        "레이팅 불변식 위반 (debate " + event.debate_id + "): zero_sum=" + (zero_sum ? "1" : "0") +
                            ", bounded=" + (bounded ? "1" : "0"));
}

void RatingService::StampEvent(RatingEvent& event) {
  std::lock_guard<std::mutex> lock(sequence_mutex_);
  event.event_id = next_event_id_++;
  // 원장 시각은 단조 증가해야 하므로 시계가 뒤로 가면 직전 시각 + 1us를 쓴다.
  // 저장소가 마이크로초 단위로 보관하므로 메모리 원장도 같은 정밀도를 쓴다.
  Clock::time_point now = std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
  if (now <= last_timestamp_) {
    now = last_timestamp_ + std::chrono::microseconds(1);
  }
  last_timestamp_ = now;
  event.occurred_at = now;
}

void RatingService::Publish(const RatingEvent& event) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  try {
    ledger_.CheckAppendable(event);
    store_.ApplyEvent(event);
    ledger_.Append(event);
  } catch (const RatingException& ex) {
    // 저장소에는 이미 커밋된 상태라 재구축이 필요하다.
    observability_->LogEvent(LogLevel::kError, "ledger.publish_failed",
                             {{"eventId", event.event_id}, {"debateId", event.debate_id}, {"reason", ex.what()}});
    throw;
  }
}

nlohmann::json RatingService::EventFields(const RatingEvent& event) const {
  return nlohmann::json{{"eventId", event.event_id},
                        {"debateId", event.debate_id},
                        {"entrantA", event.entrant_a},
                        {"entrantB", event.entrant_b},
                        {"outcome", ToString(event.outcome)},
                        {"aBefore", event.a_before},
                        {"aAfter", event.a_after},
                        {"bBefore", event.b_before},
                        {"bAfter", event.b_after},
                        {"reversesEventId", event.reverses_event_id},
                        {"kFactor", event.k_factor}};
}

}  // namespace arena
