/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/config_test.cpp, arena/tests/e2e/standings_api_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace arena {

struct AppConfig {
  unsigned short port{8080};
  // 비어 있으면 DB 없이 메모리 원장만 사용한다.
  std::string db_host;
  unsigned short db_port{3306};
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level{"info"};
  std::string ops_token;
  int base_rating{1500};
  int k_factor{32};
  std::size_t recent_window{10};
  std::size_t trend_window{10};
};

AppConfig LoadConfigFromEnv();
// 잘못된 값이면 std::invalid_argument.
void ValidateConfig(const AppConfig& config);

}  // namespace arena
