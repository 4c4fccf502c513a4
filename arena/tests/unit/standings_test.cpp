#include <memory>

#include <gtest/gtest.h>

#include "arena/rating_service.hpp"
#include "arena/standings.hpp"

namespace {

class StandingsFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    service_ = std::make_shared<arena::RatingService>(arena::RatingSettings{1500, 32, 10},
                                                      std::make_shared<arena::EntrantRegistry>());
    for (const char* id : {"a", "b", "c", "e", "f"}) {
      service_->RegisterEntrant(id, std::string("Model ") + id, "p");
    }
    service_->RegisterEntrant("d", "Retired", "p", false);
    standings_ = std::make_unique<arena::StandingsAggregator>(service_, 10);
  }

  std::shared_ptr<arena::RatingService> service_;
  std::unique_ptr<arena::StandingsAggregator> standings_;
};

TEST_F(StandingsFixture, RanksByRatingThenFewerDebatesThenId) {
  service_->AppendEvent("d1", "a", "b", arena::Outcome::kAWins);
  service_->AppendEvent("d2", "f", "e", arena::Outcome::kDraw);

  auto rows = standings_->RankedStandings();
  ASSERT_EQ(rows.size(), 5u);
  EXPECT_EQ(rows[0].entrant.id, "a");
  EXPECT_EQ(rows[1].entrant.id, "c");
  EXPECT_EQ(rows[2].entrant.id, "e");
  EXPECT_EQ(rows[3].entrant.id, "f");
  EXPECT_EQ(rows[4].entrant.id, "b");
  for (std::size_t i = 0; i < rows.size(); ++i) {
    EXPECT_EQ(rows[i].rank, static_cast<int>(i + 1));
  }
  EXPECT_EQ(rows[2].snapshot.rating, rows[3].snapshot.rating);
}

TEST_F(StandingsFixture, InactiveEntrantsAreFilteredByDefault) {
  auto active = standings_->RankedStandings();
  auto all = standings_->RankedStandings(false);
  EXPECT_EQ(active.size(), 5u);
  ASSERT_EQ(all.size(), 6u);
  bool found_retired = false;
  for (const auto& row : all) {
    found_retired = found_retired || row.entrant.id == "d";
  }
  EXPECT_TRUE(found_retired);
}

TEST_F(StandingsFixture, RankingIsDeterministic) {
  service_->AppendEvent("d1", "c", "e", arena::Outcome::kBWins);
  service_->AppendEvent("d2", "a", "f", arena::Outcome::kDraw);
  auto first = standings_->RankedStandings();
  auto second = standings_->RankedStandings();
  ASSERT_EQ(first.size(), second.size());
  for (std::size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].entrant.id, second[i].entrant.id);
  }
}

TEST_F(StandingsFixture, RowCarriesTrendAndWinRate) {
  service_->AppendEvent("d1", "a", "b", arena::Outcome::kAWins);
  auto rows = standings_->RankedStandings();
  ASSERT_EQ(rows[0].entrant.id, "a");
  EXPECT_EQ(rows[0].trend, 16);
  ASSERT_TRUE(rows[0].win_rate_percent.has_value());
  EXPECT_DOUBLE_EQ(*rows[0].win_rate_percent, 100.0);
  EXPECT_FALSE(rows[1].win_rate_percent.has_value());
}

TEST_F(StandingsFixture, TrendSumsPartialWindow) {
  auto first = service_->AppendEvent("d1", "a", "b", arena::Outcome::kAWins).event;
  auto second = service_->AppendEvent("d2", "a", "c", arena::Outcome::kBWins).event;
  EXPECT_EQ(standings_->Trend("a", 10), first.DeltaA() + second.DeltaA());
  EXPECT_EQ(standings_->Trend("a", 1), second.DeltaA());
  EXPECT_EQ(standings_->Trend("a", 0), 0);
  EXPECT_EQ(standings_->Trend("e", 5), 0);
  EXPECT_EQ(standings_->Trend("nobody"), 0);
}

TEST_F(StandingsFixture, HeadToHeadExcludesDrawsFromWinRate) {
  service_->AppendEvent("d1", "a", "b", arena::Outcome::kAWins);
  service_->AppendEvent("d2", "b", "a", arena::Outcome::kBWins);
  service_->AppendEvent("d3", "a", "b", arena::Outcome::kBWins);

  auto a_view = standings_->HeadToHead("a", "b");
  EXPECT_EQ(a_view.wins, 2);
  EXPECT_EQ(a_view.losses, 1);
  EXPECT_NEAR(a_view.win_rate(), 2.0 / 3.0, 1e-9);
  auto b_view = standings_->HeadToHead("b", "a");
  EXPECT_NEAR(b_view.win_rate(), 1.0 / 3.0, 1e-9);

  service_->AppendEvent("d4", "a", "b", arena::Outcome::kDraw);
  a_view = standings_->HeadToHead("a", "b");
  EXPECT_EQ(a_view.draws, 1);
  EXPECT_EQ(a_view.total(), 4);
  EXPECT_NEAR(a_view.win_rate(), 2.0 / 3.0, 1e-9);
}

TEST_F(StandingsFixture, HeadToHeadWithoutDecidedGamesIsZero) {
  EXPECT_DOUBLE_EQ(standings_->HeadToHead("a", "b").win_rate(), 0.0);
  service_->AppendEvent("d1", "a", "b", arena::Outcome::kDraw);
  auto record = standings_->HeadToHead("a", "b");
  EXPECT_EQ(record.total(), 1);
  EXPECT_DOUBLE_EQ(record.win_rate(), 0.0);
  EXPECT_EQ(standings_->HeadToHead("a", "a").total(), 0);
}

TEST_F(StandingsFixture, ReversedDebatesDropOutOfHeadToHead) {
  auto event = service_->AppendEvent("d1", "a", "b", arena::Outcome::kAWins).event;
  service_->AppendEvent("d2", "a", "b", arena::Outcome::kBWins);
  service_->ReverseEvent(event.event_id);
  auto record = standings_->HeadToHead("a", "b");
  EXPECT_EQ(record.wins, 0);
  EXPECT_EQ(record.losses, 1);
}

TEST_F(StandingsFixture, HeadToHeadTableOrdersByGamesThenWinRate) {
  service_->AppendEvent("d1", "a", "c", arena::Outcome::kAWins);
  service_->AppendEvent("d2", "a", "b", arena::Outcome::kBWins);
  service_->AppendEvent("d3", "b", "a", arena::Outcome::kAWins);
  service_->AppendEvent("d4", "e", "a", arena::Outcome::kBWins);

  auto table = standings_->HeadToHeadTable("a");
  ASSERT_EQ(table.size(), 3u);
  EXPECT_EQ(table[0].opponent_id, "b");
  EXPECT_EQ(table[0].losses, 2);
  // c, e 모두 1전 1승이므로 ID 순.
  EXPECT_EQ(table[1].opponent_id, "c");
  EXPECT_EQ(table[2].opponent_id, "e");
  EXPECT_TRUE(standings_->HeadToHeadTable("f").empty());
}

TEST_F(StandingsFixture, AggregatesFromOneViewIgnoreLaterEvents) {
  service_->AppendEvent("d1", "a", "b", arena::Outcome::kAWins);
  arena::LedgerView view = service_->View();

  service_->AppendEvent("d2", "b", "a", arena::Outcome::kAWins);
  service_->AppendEvent("d3", "b", "c", arena::Outcome::kAWins);

  auto rows = standings_->RankedStandings(view, true, 10);
  ASSERT_FALSE(rows.empty());
  EXPECT_EQ(rows[0].entrant.id, "a");
  EXPECT_EQ(rows[0].snapshot.rating, 1516);
  EXPECT_EQ(rows[0].trend, 16);
  EXPECT_EQ(standings_->Trend(view, "b", 10), -16);
  auto table = standings_->HeadToHeadTable(view, "b");
  ASSERT_EQ(table.size(), 1u);
  EXPECT_EQ(table[0].losses, 1);
  EXPECT_EQ(table[0].wins, 0);

  // 새 view는 이후 이벤트를 본다.
  EXPECT_EQ(standings_->Trend("b", 10), standings_->Trend(service_->View(), "b", 10));
  EXPECT_NE(standings_->Trend("b", 10), -16);
  EXPECT_EQ(standings_->HeadToHeadTable("b").size(), 2u);
}

TEST_F(StandingsFixture, TrendWindowOverridesDefault) {
  service_->AppendEvent("d1", "a", "b", arena::Outcome::kAWins);
  service_->AppendEvent("d2", "a", "c", arena::Outcome::kAWins);
  auto view = service_->View();
  int last_only = standings_->Trend(view, "a", 1);
  EXPECT_EQ(last_only, service_->FindByDebate("d2")->DeltaA());
  auto rows = standings_->RankedStandings(view, true, 1);
  EXPECT_EQ(rows[0].trend, last_only);
  EXPECT_EQ(standings_->RankedStandings(view, true, 10)[0].trend, 16 + last_only);
}

}  // namespace
