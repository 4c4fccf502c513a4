/*
 * 설명: 환경 변수에서 설정을 읽고 레이팅 상수 범위를 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/config_test.cpp
 */
#include "arena/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace arena {

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.db_host = get_env("DB_HOST", "");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "arena");
  cfg.db_password = get_env("DB_PASSWORD", "arena_pass");
  cfg.db_name = get_env("DB_NAME", "arena_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ops_token = get_env("OPS_TOKEN", "");
  cfg.base_rating = std::stoi(get_env("ARENA_BASE_RATING", "1500"));
  cfg.k_factor = std::stoi(get_env("ARENA_K_FACTOR", "32"));
  cfg.recent_window = static_cast<std::size_t>(std::stoul(get_env("ARENA_RECENT_WINDOW", "10")));
  cfg.trend_window = static_cast<std::size_t>(std::stoul(get_env("ARENA_TREND_WINDOW", "10")));
  return cfg;
}

void ValidateConfig(const AppConfig& config) {
  if (config.k_factor <= 0) {
    throw std::invalid_argument("ARENA_K_FACTOR는 양수여야 합니다");
  }
  if (config.base_rating <= 0) {
    throw std::invalid_argument("ARENA_BASE_RATING은 양수여야 합니다");
  }
  if (config.recent_window == 0) {
    throw std::invalid_argument("ARENA_RECENT_WINDOW는 1 이상이어야 합니다");
  }
  if (config.trend_window == 0) {
    throw std::invalid_argument("ARENA_TREND_WINDOW는 1 이상이어야 합니다");
  }
  if (config.port == 0) {
    throw std::invalid_argument("SERVER_PORT가 올바르지 않습니다");
  }
}

}  // namespace arena
