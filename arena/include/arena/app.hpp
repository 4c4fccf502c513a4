/*
 * 설명: 서버 전체 수명주기와 레이팅 엔진 구성 요소의 조립을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/e2e/standings_api_test.cpp, arena/tests/e2e/ops_api_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "arena/config.hpp"
#include "arena/db_client.hpp"
#include "arena/entrant_registry.hpp"
#include "arena/history_series.hpp"
#include "arena/ledger_repository.hpp"
#include "arena/observability.hpp"
#include "arena/rating_service.hpp"
#include "arena/standings.hpp"

namespace arena {

class Listener;

// HTTP 핸들러가 공유하는 서비스 묶음.
struct ServiceBundle {
  AppConfig config;
  std::shared_ptr<RatingService> rating_service;
  std::shared_ptr<StandingsAggregator> standings;
  std::shared_ptr<HistorySeries> history;
  std::shared_ptr<Observability> observability;
};

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<RatingService> GetRatingService() { return rating_service_; }
  std::shared_ptr<StandingsAggregator> GetStandings() { return standings_; }
  std::shared_ptr<HistorySeries> GetHistory() { return history_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }
  bool IsRunning() const { return running_.load(); }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<LedgerRepository> repository_;
  std::shared_ptr<EntrantRegistry> registry_;
  std::shared_ptr<RatingService> rating_service_;
  std::shared_ptr<StandingsAggregator> standings_;
  std::shared_ptr<HistorySeries> history_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace arena
