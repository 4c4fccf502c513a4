/*
 * 설명: append-only 원장. 읽기 스냅샷을 보호하기 위해 쓰기 시 복사(copy-on-write)한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_ledger_test.cpp
 */
#include "arena/rating_ledger.hpp"

#include <algorithm>

#include "arena/rating_error.hpp"

namespace arena {

namespace {
bool LedgerOrder(const RatingEvent& lhs, const RatingEvent& rhs) {
  if (lhs.occurred_at != rhs.occurred_at) {
    return lhs.occurred_at < rhs.occurred_at;
  }
  return lhs.event_id < rhs.event_id;
}
}  // namespace

EventRange::Iterator::Iterator(const EventRange* range, std::size_t index) : range_(range), index_(index) {
  SkipUnmatched();
}

EventRange::Iterator& EventRange::Iterator::operator++() {
  ++index_;
  SkipUnmatched();
  return *this;
}

EventRange::Iterator EventRange::Iterator::operator++(int) {
  Iterator copy = *this;
  ++(*this);
  return copy;
}

void EventRange::Iterator::SkipUnmatched() {
  const auto& events = *range_->events_;
  while (index_ < events.size() && !range_->Matches(events[index_])) {
    ++index_;
  }
}

EventRange::EventRange(std::shared_ptr<const EventLog> events, std::string entrant_id,
                       std::optional<Clock::time_point> since)
    : events_(std::move(events)), entrant_id_(std::move(entrant_id)), since_(since) {}

std::vector<RatingEvent> EventRange::ToVector() const { return std::vector<RatingEvent>(begin(), end()); }

bool EventRange::Matches(const RatingEvent& event) const {
  if (!entrant_id_.empty() && !event.Touches(entrant_id_)) {
    return false;
  }
  if (since_ && event.occurred_at < *since_) {
    return false;
  }
  return true;
}

RatingLedger::RatingLedger() : events_(std::make_shared<EventLog>()) {}

void RatingLedger::CheckAppendable(const RatingEvent& event) const {
  if (event.event_id == 0) {
    throw RatingException(RatingError::kInvalidArgument, "이벤트 ID는 0일 수 없습니다");
  }
  if (Find(event.event_id)) {
    throw RatingException(RatingError::kOutOfOrderEvent,
                          "이미 기록된 이벤트 ID입니다: " + std::to_string(event.event_id));
  }
  if (event.IsReversal()) {
    auto original = Find(event.reverses_event_id);
    if (!original) {
      throw RatingException(RatingError::kEventNotFound,
                            "보정 대상 이벤트가 없습니다: " + std::to_string(event.reverses_event_id));
    }
    if (original->IsReversal()) {
      throw RatingException(RatingError::kNotReversible,
                            "보정 이벤트는 다시 보정할 수 없습니다: " + std::to_string(original->event_id));
    }
    if (reversal_index_.count(event.reverses_event_id) > 0) {
      throw RatingException(RatingError::kAlreadyReversed,
                            "이미 보정된 이벤트입니다: " + std::to_string(event.reverses_event_id));
    }
    return;
  }
  if (debate_index_.count(event.debate_id) > 0) {
    throw RatingException(RatingError::kDuplicateEvent, "이미 반영된 토론입니다: " + event.debate_id);
  }
}

void RatingLedger::Append(const RatingEvent& event) {
  CheckAppendable(event);
  EventLog& log = Writable();
  auto pos = std::upper_bound(log.begin(), log.end(), event, LedgerOrder);
  bool after_prev = pos == log.begin() || std::prev(pos)->event_id < event.event_id;
  bool before_next = pos == log.end() || event.event_id < pos->event_id;
  if (!after_prev || !before_next) {
    throw RatingException(RatingError::kOutOfOrderEvent,
                          "시간 순서와 ID 순서가 어긋나는 이벤트입니다: " + std::to_string(event.event_id));
  }
  log.insert(pos, event);
  Index(event);
}

void RatingLedger::Restore(std::vector<RatingEvent> events) {
  std::stable_sort(events.begin(), events.end(), LedgerOrder);
  for (std::size_t i = 1; i < events.size(); ++i) {
    if (events[i].event_id <= events[i - 1].event_id) {
      throw RatingException(RatingError::kInvariantViolation,
                            "원장의 시간 순서와 ID 순서가 어긋납니다: " + std::to_string(events[i].event_id));
    }
  }
  events_ = std::make_shared<EventLog>();
  debate_index_.clear();
  reversal_index_.clear();
  for (const auto& event : events) {
    CheckAppendable(event);
    events_->push_back(event);
    Index(event);
  }
}

std::optional<RatingEvent> RatingLedger::Find(std::uint64_t event_id) const {
  // 시간과 ID가 함께 증가하므로 ID로 이진 탐색할 수 있다.
  auto it = std::lower_bound(events_->begin(), events_->end(), event_id,
                             [](const RatingEvent& e, std::uint64_t id) { return e.event_id < id; });
  if (it == events_->end() || it->event_id != event_id) {
    return std::nullopt;
  }
  return *it;
}

std::optional<RatingEvent> RatingLedger::FindByDebate(const std::string& debate_id) const {
  auto it = debate_index_.find(debate_id);
  if (it == debate_index_.end()) {
    return std::nullopt;
  }
  return Find(it->second);
}

std::optional<std::uint64_t> RatingLedger::ReversalOf(std::uint64_t event_id) const {
  auto it = reversal_index_.find(event_id);
  if (it == reversal_index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::uint64_t RatingLedger::LastEventId() const {
  std::uint64_t last = 0;
  for (const auto& event : *events_) {
    last = std::max(last, event.event_id);
  }
  return last;
}

EventLog& RatingLedger::Writable() {
  // 읽기 뷰가 현재 벡터를 잡고 있으면 복사본에 쓴다.
  if (events_.use_count() > 1) {
    events_ = std::make_shared<EventLog>(*events_);
  }
  return *events_;
}

void RatingLedger::Index(const RatingEvent& event) {
  if (event.IsReversal()) {
    reversal_index_[event.reverses_event_id] = event.event_id;
  } else {
    debate_index_[event.debate_id] = event.event_id;
  }
}

}  // namespace arena
