#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "arena/config.hpp"

namespace {

TEST(ConfigTest, DefaultsWithoutEnvironment) {
  for (const char* key : {"SERVER_PORT", "DB_HOST", "ARENA_BASE_RATING", "ARENA_K_FACTOR", "ARENA_RECENT_WINDOW",
                          "ARENA_TREND_WINDOW", "OPS_TOKEN"}) {
    unsetenv(key);
  }
  auto cfg = arena::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_TRUE(cfg.db_host.empty());
  EXPECT_EQ(cfg.base_rating, 1500);
  EXPECT_EQ(cfg.k_factor, 32);
  EXPECT_EQ(cfg.recent_window, 10u);
  EXPECT_EQ(cfg.trend_window, 10u);
  EXPECT_TRUE(cfg.ops_token.empty());
  EXPECT_NO_THROW(arena::ValidateConfig(cfg));
}

TEST(ConfigTest, ReadsRatingConstantsFromEnvironment) {
  setenv("ARENA_K_FACTOR", "24", 1);
  setenv("ARENA_BASE_RATING", "1200", 1);
  setenv("ARENA_TREND_WINDOW", "5", 1);
  auto cfg = arena::LoadConfigFromEnv();
  EXPECT_EQ(cfg.k_factor, 24);
  EXPECT_EQ(cfg.base_rating, 1200);
  EXPECT_EQ(cfg.trend_window, 5u);
  unsetenv("ARENA_K_FACTOR");
  unsetenv("ARENA_BASE_RATING");
  unsetenv("ARENA_TREND_WINDOW");
}

TEST(ConfigTest, ValidateRejectsBadConstants) {
  arena::AppConfig cfg;
  cfg.k_factor = 0;
  EXPECT_THROW(arena::ValidateConfig(cfg), std::invalid_argument);
  cfg = arena::AppConfig{};
  cfg.base_rating = -1;
  EXPECT_THROW(arena::ValidateConfig(cfg), std::invalid_argument);
  cfg = arena::AppConfig{};
  cfg.recent_window = 0;
  EXPECT_THROW(arena::ValidateConfig(cfg), std::invalid_argument);
  cfg = arena::AppConfig{};
  cfg.trend_window = 0;
  EXPECT_THROW(arena::ValidateConfig(cfg), std::invalid_argument);
}

}  // namespace
