/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행하고, SIGINT/SIGTERM을 받으면 종료한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/e2e/standings_api_test.cpp
 */
#include <csignal>
#include <iostream>
#include <stdexcept>

#include <boost/asio/signal_set.hpp>

#include "arena/app.hpp"

int main() {
  using namespace arena;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
    ValidateConfig(config);
  } catch (const std::exception& ex) {
    std::cerr << "설정 오류: " << ex.what() << "\n";
    return 1;
  }
  ServerApp app(config);

  // 핸들러는 워커 스레드에서 돌 수 있으므로 io_context만 멈추고 정리는 Run() 반환 뒤에 한다.
  boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
  signals.async_wait([&app](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    std::cout << "시그널 " << signal_number << " 수신, 종료합니다\n";
    app.GetContext().stop();
  });

  app.Run();
  app.Stop();
  return 0;
}
