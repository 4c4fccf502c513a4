/*
 * 설명: 원장 이벤트를 한 번씩 순서대로 적용해 현재 레이팅/전적/최근 결과를 유지한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_store_test.cpp
 */
#include "arena/rating_store.hpp"

#include <algorithm>

#include "arena/rating_error.hpp"

namespace arena {

namespace {
void Decrement(int& counter, const std::string& entrant_id) {
  if (counter <= 0) {
    throw RatingException(RatingError::kInvariantViolation, "보정할 전적이 없습니다: " + entrant_id);
  }
  --counter;
}
}  // namespace

RatingStore::RatingStore(int base_rating, std::size_t recent_capacity)
    : base_rating_(base_rating), recent_capacity_(recent_capacity) {}

RatingSnapshot RatingStore::GetCurrent(const std::string& entrant_id) const {
  auto it = snapshots_.find(entrant_id);
  if (it == snapshots_.end()) {
    return Baseline(entrant_id);
  }
  return it->second;
}

void RatingStore::ApplyEvent(const RatingEvent& event) {
  if (event.entrant_a == event.entrant_b) {
    throw RatingException(RatingError::kInvalidArgument, "같은 참가자끼리의 이벤트는 적용할 수 없습니다");
  }
  RatingSnapshot a = GetCurrent(event.entrant_a);
  RatingSnapshot b = GetCurrent(event.entrant_b);
  if (event.event_id <= a.last_event_id || event.event_id <= b.last_event_id) {
    throw RatingException(RatingError::kOutOfOrderEvent,
                          "이미 적용되었거나 순서가 어긋난 이벤트입니다: " + std::to_string(event.event_id));
  }
  if (a.rating != event.a_before || b.rating != event.b_before) {
    throw RatingException(RatingError::kInvariantViolation,
                          "이벤트의 이전 레이팅이 투영과 다릅니다: " + std::to_string(event.event_id));
  }
  if (event.DeltaA() + event.DeltaB() != 0) {
    throw RatingException(RatingError::kInvariantViolation,
                          "제로섬이 깨진 이벤트입니다: " + std::to_string(event.event_id));
  }

  ApplySide(a, event);
  ApplySide(b, event);
  snapshots_[event.entrant_a] = std::move(a);
  snapshots_[event.entrant_b] = std::move(b);
}

void RatingStore::RebuildFromLedger(const std::vector<RatingEvent>& events) {
  Clear();
  for (const auto& event : events) {
    ApplyEvent(event);
  }
}

void RatingStore::Clear() { snapshots_.clear(); }

std::vector<RatingSnapshot> RatingStore::All() const {
  std::vector<RatingSnapshot> result;
  result.reserve(snapshots_.size());
  for (const auto& entry : snapshots_) {
    result.push_back(entry.second);
  }
  return result;
}

RatingSnapshot RatingStore::Baseline(const std::string& entrant_id) const {
  RatingSnapshot snapshot;
  snapshot.entrant_id = entrant_id;
  snapshot.rating = base_rating_;
  return snapshot;
}

void RatingStore::ApplySide(RatingSnapshot& snapshot, const RatingEvent& event) const {
  const std::string& id = snapshot.entrant_id;
  EntrantResult result = event.ResultFor(id);
  snapshot.rating = event.RatingAfter(id);
  snapshot.last_event_id = event.event_id;

  if (event.IsReversal()) {
    switch (result) {
      case EntrantResult::kWin:
        Decrement(snapshot.wins, id);
        break;
      case EntrantResult::kLoss:
        Decrement(snapshot.losses, id);
        break;
      case EntrantResult::kDraw:
        Decrement(snapshot.draws, id);
        break;
    }
    auto it = std::find_if(snapshot.recent.begin(), snapshot.recent.end(),
                           [&](const RecentOutcome& o) { return o.event_id == event.reverses_event_id; });
    if (it != snapshot.recent.end()) {
      snapshot.recent.erase(it);
    }
    return;
  }

  switch (result) {
    case EntrantResult::kWin:
      ++snapshot.wins;
      break;
    case EntrantResult::kLoss:
      ++snapshot.losses;
      break;
    case EntrantResult::kDraw:
      ++snapshot.draws;
      break;
  }
  snapshot.recent.push_back(RecentOutcome{event.event_id, result, event.DeltaFor(id)});
  while (snapshot.recent.size() > recent_capacity_) {
    snapshot.recent.pop_front();
  }
}

}  // namespace arena
