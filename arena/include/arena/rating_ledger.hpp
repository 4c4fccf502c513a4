/*
 * 설명: 레이팅 이벤트의 append-only 원장과 지연 평가 이벤트 뷰를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_ledger_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "arena/rating_event.hpp"

namespace arena {

using EventLog = std::vector<RatingEvent>;

// 호출 시점 원장의 스냅샷을 붙잡고 있는 재시작 가능한 뷰. 순회할 때 필터링한다.
class EventRange {
 public:
  class Iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = RatingEvent;
    using difference_type = std::ptrdiff_t;
    using pointer = const RatingEvent*;
    using reference = const RatingEvent&;

    Iterator(const EventRange* range, std::size_t index);
    reference operator*() const { return (*range_->events_)[index_]; }
    pointer operator->() const { return &(*range_->events_)[index_]; }
    Iterator& operator++();
    Iterator operator++(int);
    bool operator==(const Iterator& other) const { return index_ == other.index_; }
    bool operator!=(const Iterator& other) const { return index_ != other.index_; }

   private:
    void SkipUnmatched();

    const EventRange* range_;
    std::size_t index_;
  };

  EventRange(std::shared_ptr<const EventLog> events, std::string entrant_id,
             std::optional<Clock::time_point> since = std::nullopt);

  Iterator begin() const { return Iterator(this, 0); }
  Iterator end() const { return Iterator(this, events_->size()); }
  bool empty() const { return begin() == end(); }
  std::vector<RatingEvent> ToVector() const;

 private:
  bool Matches(const RatingEvent& event) const;

  std::shared_ptr<const EventLog> events_;
  // 비어 있으면 전체 이벤트.
  std::string entrant_id_;
  std::optional<Clock::time_point> since_;
};

// 동기화는 RatingService가 담당한다. 이벤트는 (occurred_at, event_id) 오름차순으로 유지된다.
class RatingLedger {
 public:
  RatingLedger();

  // debate_id 중복 / 보정 중복을 검사한다. 실패 시 RatingException.
  void CheckAppendable(const RatingEvent& event) const;
  void Append(const RatingEvent& event);
  void Restore(std::vector<RatingEvent> events);

  std::shared_ptr<const EventLog> Events() const { return events_; }
  std::optional<RatingEvent> Find(std::uint64_t event_id) const;
  std::optional<RatingEvent> FindByDebate(const std::string& debate_id) const;
  std::optional<std::uint64_t> ReversalOf(std::uint64_t event_id) const;
  std::uint64_t LastEventId() const;
  std::size_t Size() const { return events_->size(); }

 private:
  EventLog& Writable();
  void Index(const RatingEvent& event);

  std::shared_ptr<EventLog> events_;
  std::unordered_map<std::string, std::uint64_t> debate_index_;
  std::unordered_map<std::uint64_t, std::uint64_t> reversal_index_;
};

}  // namespace arena
