#include <chrono>
#include <functional>

#include <gtest/gtest.h>

#include "arena/rating_error.hpp"
#include "arena/rating_ledger.hpp"

namespace {

arena::Clock::time_point At(int seconds) { return arena::Clock::time_point(std::chrono::seconds(1700000000 + seconds)); }

arena::RatingEvent MakeEvent(std::uint64_t id, const std::string& debate, const std::string& a, const std::string& b,
                             int seconds, std::uint64_t reverses = 0) {
  arena::RatingEvent event;
  event.event_id = id;
  event.debate_id = debate;
  event.entrant_a = a;
  event.entrant_b = b;
  event.outcome = arena::Outcome::kAWins;
  event.a_before = 1500;
  event.a_after = 1516;
  event.b_before = 1500;
  event.b_after = 1484;
  event.occurred_at = At(seconds);
  event.reverses_event_id = reverses;
  return event;
}

arena::RatingError ErrorOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const arena::RatingException& ex) {
    return ex.error;
  }
  ADD_FAILURE() << "RatingException이 발생하지 않았습니다";
  return arena::RatingError::kInvalidArgument;
}

TEST(RatingLedgerTest, AppendKeepsOrderAndIndexes) {
  arena::RatingLedger ledger;
  ledger.Append(MakeEvent(1, "d1", "a", "b", 1));
  ledger.Append(MakeEvent(2, "d2", "b", "c", 2));
  EXPECT_EQ(ledger.Size(), 2u);
  EXPECT_EQ(ledger.LastEventId(), 2u);
  ASSERT_TRUE(ledger.Find(2).has_value());
  EXPECT_EQ(ledger.Find(2)->debate_id, "d2");
  EXPECT_FALSE(ledger.Find(3).has_value());
  ASSERT_TRUE(ledger.FindByDebate("d1").has_value());
  EXPECT_EQ(ledger.FindByDebate("d1")->event_id, 1u);
}

TEST(RatingLedgerTest, DuplicateDebateIsRejected) {
  arena::RatingLedger ledger;
  ledger.Append(MakeEvent(1, "d1", "a", "b", 1));
  EXPECT_EQ(ErrorOf([&] { ledger.Append(MakeEvent(2, "d1", "a", "b", 2)); }), arena::RatingError::kDuplicateEvent);
  EXPECT_EQ(ErrorOf([&] { ledger.Append(MakeEvent(1, "d9", "a", "b", 3)); }), arena::RatingError::kOutOfOrderEvent);
  EXPECT_EQ(ledger.Size(), 1u);
}

TEST(RatingLedgerTest, ReversalRules) {
  arena::RatingLedger ledger;
  ledger.Append(MakeEvent(1, "d1", "a", "b", 1));
  EXPECT_EQ(ErrorOf([&] { ledger.Append(MakeEvent(2, "d1", "a", "b", 2, 7)); }), arena::RatingError::kEventNotFound);
  ledger.Append(MakeEvent(2, "d1", "a", "b", 2, 1));
  ASSERT_TRUE(ledger.ReversalOf(1).has_value());
  EXPECT_EQ(*ledger.ReversalOf(1), 2u);
  EXPECT_EQ(ErrorOf([&] { ledger.Append(MakeEvent(3, "d1", "a", "b", 3, 1)); }), arena::RatingError::kAlreadyReversed);
  EXPECT_EQ(ErrorOf([&] { ledger.Append(MakeEvent(3, "d1", "a", "b", 3, 2)); }), arena::RatingError::kNotReversible);
}

TEST(RatingLedgerTest, IdOrderMustFollowTimeOrder) {
  arena::RatingLedger ledger;
  ledger.Append(MakeEvent(5, "d5", "a", "b", 10));
  EXPECT_EQ(ErrorOf([&] { ledger.Append(MakeEvent(6, "d6", "a", "b", 5)); }), arena::RatingError::kOutOfOrderEvent);
  // 먼저 발급된 ID가 늦게 도착해도 시간 순서가 맞으면 제자리에 들어간다.
  ledger.Append(MakeEvent(4, "d4", "c", "d", 9));
  auto events = ledger.Events();
  ASSERT_EQ(events->size(), 2u);
  EXPECT_EQ((*events)[0].event_id, 4u);
  EXPECT_EQ((*events)[1].event_id, 5u);
}

TEST(RatingLedgerTest, RangeFiltersByEntrantAndSince) {
  arena::RatingLedger ledger;
  ledger.Append(MakeEvent(1, "d1", "a", "b", 1));
  ledger.Append(MakeEvent(2, "d2", "b", "c", 2));
  ledger.Append(MakeEvent(3, "d3", "a", "c", 3));

  arena::EventRange for_a(ledger.Events(), "a");
  auto a_events = for_a.ToVector();
  ASSERT_EQ(a_events.size(), 2u);
  EXPECT_EQ(a_events[0].event_id, 1u);
  EXPECT_EQ(a_events[1].event_id, 3u);

  arena::EventRange since(ledger.Events(), "c", At(3));
  auto c_events = since.ToVector();
  ASSERT_EQ(c_events.size(), 1u);
  EXPECT_EQ(c_events[0].event_id, 3u);

  EXPECT_TRUE(arena::EventRange(ledger.Events(), "nobody").empty());
  EXPECT_EQ(arena::EventRange(ledger.Events(), "").ToVector().size(), 3u);
}

TEST(RatingLedgerTest, RangeIsSnapshotAndRestartable) {
  arena::RatingLedger ledger;
  ledger.Append(MakeEvent(1, "d1", "a", "b", 1));
  arena::EventRange range(ledger.Events(), "a");
  ledger.Append(MakeEvent(2, "d2", "a", "c", 2));

  std::size_t first_pass = 0;
  for (const auto& event : range) {
    (void)event;
    ++first_pass;
  }
  std::size_t second_pass = 0;
  for (auto it = range.begin(); it != range.end(); ++it) {
    ++second_pass;
  }
  EXPECT_EQ(first_pass, 1u);
  EXPECT_EQ(second_pass, 1u);
  EXPECT_EQ(arena::EventRange(ledger.Events(), "a").ToVector().size(), 2u);
}

TEST(RatingLedgerTest, RestoreSortsAndRebuildsIndexes) {
  arena::RatingLedger ledger;
  ledger.Restore({MakeEvent(2, "d1", "a", "b", 2, 1), MakeEvent(1, "d1", "a", "b", 1)});
  EXPECT_EQ(ledger.Size(), 2u);
  EXPECT_EQ((*ledger.Events())[0].event_id, 1u);
  EXPECT_TRUE(ledger.ReversalOf(1).has_value());
  EXPECT_EQ(ledger.FindByDebate("d1")->event_id, 1u);

  arena::RatingLedger broken;
  EXPECT_EQ(ErrorOf([&] { broken.Restore({MakeEvent(2, "d2", "a", "b", 1), MakeEvent(1, "d1", "a", "b", 2)}); }),
            arena::RatingError::kInvariantViolation);
}

}  // namespace
