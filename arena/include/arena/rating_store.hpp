/*
 * 설명: 원장을 접어(fold) 만든 참가자별 현재 레이팅 투영을 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_store_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

#include "arena/rating_event.hpp"

namespace arena {

struct RecentOutcome {
  std::uint64_t event_id;
  EntrantResult result;
  int delta;
};

struct RatingSnapshot {
  std::string entrant_id;
  int rating{0};
  int wins{0};
  int losses{0};
  int draws{0};
  std::deque<RecentOutcome> recent;
  std::uint64_t last_event_id{0};

  int debates() const { return wins + losses + draws; }
  int decided() const { return wins + losses; }
};

// 동기화는 소유자(RatingService)가 담당한다.
class RatingStore {
 public:
  RatingStore(int base_rating, std::size_t recent_capacity);

  RatingSnapshot GetCurrent(const std::string& entrant_id) const;
  void ApplyEvent(const RatingEvent& event);
  void RebuildFromLedger(const std::vector<RatingEvent>& events);
  void Clear();

  std::vector<RatingSnapshot> All() const;
  std::size_t Size() const { return snapshots_.size(); }
  int BaseRating() const { return base_rating_; }
  std::size_t RecentCapacity() const { return recent_capacity_; }

 private:
  RatingSnapshot Baseline(const std::string& entrant_id) const;
  void ApplySide(RatingSnapshot& snapshot, const RatingEvent& event) const;

  int base_rating_;
  std::size_t recent_capacity_;
  std::unordered_map<std::string, RatingSnapshot> snapshots_;
};

}  // namespace arena
