/*
 * 설명: 순위 정렬(레이팅 내림차순 → 경기 수 오름차순 → ID), 최근 N경기 추세, 상대 전적 집계를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/standings_test.cpp
 */
#include "arena/standings.hpp"

#include <algorithm>
#include <map>
#include <unordered_set>
#include <utility>

namespace arena {

namespace {
std::unordered_set<std::uint64_t> ReversedIds(const EventLog& events) {
  std::unordered_set<std::uint64_t> reversed;
  for (const auto& event : events) {
    if (event.IsReversal()) {
      reversed.insert(event.reverses_event_id);
    }
  }
  return reversed;
}

void CountResult(HeadToHeadRecord& record, EntrantResult result) {
  switch (result) {
    case EntrantResult::kWin:
      ++record.wins;
      break;
    case EntrantResult::kLoss:
      ++record.losses;
      break;
    case EntrantResult::kDraw:
      ++record.draws;
      break;
  }
}
}  // namespace

int SumRecentDeltas(const EventLog& events, const std::string& entrant_id, std::size_t window_size) {
  int sum = 0;
  std::size_t counted = 0;
  for (auto it = events.rbegin(); it != events.rend() && counted < window_size; ++it) {
    if (!it->Touches(entrant_id)) {
      continue;
    }
    sum += it->DeltaFor(entrant_id);
    ++counted;
  }
  return sum;
}

HeadToHeadRecord CountHeadToHead(const EventLog& events, const std::string& entrant_a, const std::string& entrant_b) {
  HeadToHeadRecord record;
  record.entrant_id = entrant_a;
  record.opponent_id = entrant_b;
  if (entrant_a == entrant_b) {
    return record;
  }
  auto reversed = ReversedIds(events);
  for (const auto& event : events) {
    if (event.IsReversal() || reversed.count(event.event_id) > 0 || !event.IsBetween(entrant_a, entrant_b)) {
      continue;
    }
    CountResult(record, event.ResultFor(entrant_a));
  }
  return record;
}

StandingsAggregator::StandingsAggregator(std::shared_ptr<const RatingService> service, std::size_t trend_window)
    : service_(std::move(service)), trend_window_(trend_window) {}

std::vector<Standing> StandingsAggregator::RankedStandings(bool active_only) const {
  return RankedStandings(service_->View(), active_only, trend_window_);
}

std::vector<Standing> StandingsAggregator::RankedStandings(const LedgerView& view, bool active_only,
                                                           std::size_t window_size) const {
  std::vector<Standing> standings;
  for (auto& entrant : service_->Registry()->List(active_only)) {
    Standing row;
    const RatingSnapshot* snapshot = view.Find(entrant.id);
    if (snapshot) {
      row.snapshot = *snapshot;
    } else {
      row.snapshot.entrant_id = entrant.id;
      row.snapshot.rating = view.base_rating;
    }
    row.trend = SumRecentDeltas(*view.events, entrant.id, window_size);
    if (row.snapshot.decided() > 0) {
      row.win_rate_percent = 100.0 * row.snapshot.wins / row.snapshot.decided();
    }
    row.entrant = std::move(entrant);
    standings.push_back(std::move(row));
  }

  std::sort(standings.begin(), standings.end(), [](const Standing& lhs, const Standing& rhs) {
    if (lhs.snapshot.rating != rhs.snapshot.rating) {
      return lhs.snapshot.rating > rhs.snapshot.rating;
    }
    if (lhs.snapshot.debates() != rhs.snapshot.debates()) {
      return lhs.snapshot.debates() < rhs.snapshot.debates();
    }
    return lhs.entrant.id < rhs.entrant.id;
  });
  for (std::size_t i = 0; i < standings.size(); ++i) {
    standings[i].rank = static_cast<int>(i + 1);
  }
  return standings;
}

int StandingsAggregator::Trend(const std::string& entrant_id, std::size_t window_size) const {
  return Trend(service_->View(), entrant_id, window_size);
}

int StandingsAggregator::Trend(const LedgerView& view, const std::string& entrant_id, std::size_t window_size) const {
  return SumRecentDeltas(*view.events, entrant_id, window_size);
}

HeadToHeadRecord StandingsAggregator::HeadToHead(const std::string& entrant_a, const std::string& entrant_b) const {
  LedgerView view = service_->View();
  return CountHeadToHead(*view.events, entrant_a, entrant_b);
}

std::vector<HeadToHeadRecord> StandingsAggregator::HeadToHeadTable(const std::string& entrant_id) const {
  return HeadToHeadTable(service_->View(), entrant_id);
}

std::vector<HeadToHeadRecord> StandingsAggregator::HeadToHeadTable(const LedgerView& view,
                                                                   const std::string& entrant_id) const {
  auto reversed = ReversedIds(*view.events);
  std::map<std::string, HeadToHeadRecord> by_opponent;
  for (const auto& event : *view.events) {
    if (event.IsReversal() || reversed.count(event.event_id) > 0 || !event.Touches(entrant_id)) {
      continue;
    }
    const std::string& opponent = event.OpponentOf(entrant_id);
    auto& record = by_opponent[opponent];
    record.entrant_id = entrant_id;
    record.opponent_id = opponent;
    CountResult(record, event.ResultFor(entrant_id));
  }

  std::vector<HeadToHeadRecord> table;
  table.reserve(by_opponent.size());
  for (auto& entry : by_opponent) {
    table.push_back(std::move(entry.second));
  }
  std::stable_sort(table.begin(), table.end(), [](const HeadToHeadRecord& lhs, const HeadToHeadRecord& rhs) {
    if (lhs.total() != rhs.total()) {
      return lhs.total() > rhs.total();
    }
    if (lhs.win_rate() != rhs.win_rate()) {
      return lhs.win_rate() > rhs.win_rate();
    }
    return lhs.opponent_id < rhs.opponent_id;
  });
  return table;
}

}  // namespace arena
