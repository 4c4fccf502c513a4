/*
 * 설명: 레이팅 투영과 원장을 읽어 순위표, 추세, 상대 전적을 집계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/standings_test.cpp, arena/tests/e2e/standings_api_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "arena/entrant_registry.hpp"
#include "arena/rating_service.hpp"

namespace arena {

struct Standing {
  int rank{0};
  Entrant entrant;
  RatingSnapshot snapshot;
  int trend{0};
  // 승패가 난 경기가 없으면 비어 있다.
  std::optional<double> win_rate_percent;
};

// entrant_id 관점의 전적. 무승부는 승률 분모에서 빠진다.
struct HeadToHeadRecord {
  std::string entrant_id;
  std::string opponent_id;
  int wins{0};
  int losses{0};
  int draws{0};

  int decided() const { return wins + losses; }
  int total() const { return wins + losses + draws; }
  double win_rate() const { return decided() == 0 ? 0.0 : static_cast<double>(wins) / decided(); }
};

// 같은 LedgerView에서 계산하므로 순위와 추세가 서로 다른 시점을 보지 않는다.
int SumRecentDeltas(const EventLog& events, const std::string& entrant_id, std::size_t window_size);
HeadToHeadRecord CountHeadToHead(const EventLog& events, const std::string& entrant_a, const std::string& entrant_b);

class StandingsAggregator {
 public:
  StandingsAggregator(std::shared_ptr<const RatingService> service, std::size_t trend_window);

  std::vector<Standing> RankedStandings(bool active_only = true) const;
  int Trend(const std::string& entrant_id, std::size_t window_size) const;
  int Trend(const std::string& entrant_id) const { return Trend(entrant_id, trend_window_); }
  HeadToHeadRecord HeadToHead(const std::string& entrant_a, const std::string& entrant_b) const;
  std::vector<HeadToHeadRecord> HeadToHeadTable(const std::string& entrant_id) const;

  // 한 응답에 여러 집계를 담을 때는 호출자가 잡은 하나의 view로 계산한다.
  std::vector<Standing> RankedStandings(const LedgerView& view, bool active_only, std::size_t window_size) const;
  int Trend(const LedgerView& view, const std::string& entrant_id, std::size_t window_size) const;
  std::vector<HeadToHeadRecord> HeadToHeadTable(const LedgerView& view, const std::string& entrant_id) const;

  std::size_t TrendWindow() const { return trend_window_; }

 private:
  std::shared_ptr<const RatingService> service_;
  std::size_t trend_window_;
};

}  // namespace arena
