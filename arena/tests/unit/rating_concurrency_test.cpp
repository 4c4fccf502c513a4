#include <atomic>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "arena/rating_error.hpp"
#include "arena/rating_service.hpp"

namespace {

constexpr int kBaseRating = 1500;
const std::vector<std::string> kEntrants{"e0", "e1", "e2", "e3", "e4", "e5"};

std::shared_ptr<arena::RatingService> BuildService() {
  auto service = std::make_shared<arena::RatingService>(arena::RatingSettings{kBaseRating, 32, 10},
                                                        std::make_shared<arena::EntrantRegistry>());
  for (const auto& id : kEntrants) {
    service->RegisterEntrant(id, "Model " + id, "p");
  }
  return service;
}

long TotalRating(const arena::LedgerView& view) {
  long total = 0;
  for (const auto& id : kEntrants) {
    const auto* snapshot = view.Find(id);
    total += snapshot ? snapshot->rating : view.base_rating;
  }
  return total;
}

TEST(RatingConcurrencyTest, ParallelAppendsConserveTotalRating) {
  auto service = BuildService();
  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([service, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        const auto& a = kEntrants[(t + i) % kEntrants.size()];
        const auto& b = kEntrants[(t + 2 * i + 1) % kEntrants.size()];
        if (a == b) {
          continue;
        }
        auto outcome = static_cast<arena::Outcome>((t * 7 + i) % 3);
        service->AppendEvent("t" + std::to_string(t) + "-" + std::to_string(i), a, b, outcome);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  auto view = service->View();
  EXPECT_EQ(TotalRating(view), kBaseRating * static_cast<long>(kEntrants.size()));
  for (const auto& event : *view.events) {
    EXPECT_EQ(event.DeltaA() + event.DeltaB(), 0);
    EXPECT_LE(std::abs(event.DeltaA()), 32);
  }
  auto report = service->RebuildFromLedger();
  EXPECT_TRUE(report.diverged.empty());
  EXPECT_EQ(report.events_applied, view.events->size());
}

TEST(RatingConcurrencyTest, SameDebateFromManyThreadsIsAppliedOnce) {
  auto service = BuildService();
  std::atomic<int> created{0};
  std::atomic<int> replayed{0};
  std::atomic<int> conflicts{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&]() {
      try {
        auto result = service->AppendEvent("shared-debate", "e0", "e1", arena::Outcome::kAWins);
        (result.created ? created : replayed).fetch_add(1);
      } catch (const arena::RatingException& ex) {
        EXPECT_EQ(ex.error, arena::RatingError::kDuplicateEvent);
        conflicts.fetch_add(1);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  EXPECT_EQ(created.load(), 1);
  EXPECT_EQ(created.load() + replayed.load() + conflicts.load(), 8);
  EXPECT_EQ(service->EventCount(), 1u);
  EXPECT_EQ(service->GetCurrent("e0").rating, 1516);
}

TEST(RatingConcurrencyTest, ReadersNeverSeeHalfAppliedEvents) {
  auto service = BuildService();
  std::atomic<bool> done{false};
  std::atomic<int> bad_views{0};
  std::thread reader([&]() {
    while (!done.load()) {
      auto view = service->View();
      if (TotalRating(view) != kBaseRating * static_cast<long>(kEntrants.size())) {
        bad_views.fetch_add(1);
      }
    }
  });
  for (int i = 0; i < 200; ++i) {
    const auto& a = kEntrants[i % kEntrants.size()];
    const auto& b = kEntrants[(i + 1) % kEntrants.size()];
    service->AppendEvent("r" + std::to_string(i), a, b, arena::Outcome::kAWins);
  }
  done = true;
  reader.join();
  EXPECT_EQ(bad_views.load(), 0);
}

TEST(RatingConcurrencyTest, RebuildWhileAppendingStaysConsistent) {
  auto service = BuildService();
  std::atomic<bool> done{false};
  std::thread rebuilder([&]() {
    while (!done.load()) {
      service->RebuildFromLedger();
    }
  });
  for (int i = 0; i < 100; ++i) {
    service->AppendEvent("x" + std::to_string(i), kEntrants[i % 3], kEntrants[3 + i % 3], arena::Outcome::kBWins);
  }
  done = true;
  rebuilder.join();
  EXPECT_EQ(service->EventCount(), 100u);
  EXPECT_TRUE(service->RebuildFromLedger().diverged.empty());
  EXPECT_EQ(TotalRating(service->View()), kBaseRating * static_cast<long>(kEntrants.size()));
}

}  // namespace
