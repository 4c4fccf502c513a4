/*
 * 설명: 서버 수명주기와 리스닝 스레드를 관리한다. DB가 설정되어 있으면 시작 시 원장을 적재한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/e2e/standings_api_test.cpp, arena/tests/e2e/ops_api_test.cpp
 */
#include "arena/app.hpp"

#include <algorithm>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "arena/http_session.hpp"

namespace arena {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<const ServiceBundle> services)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), services_(std::move(services)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->services_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const ServiceBundle> services_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  ValidateConfig(config_);
  observability_ = std::make_shared<Observability>(ParseLogLevel(config_.log_level));
  if (!config_.db_host.empty()) {
    DbConfig db_config{config_.db_host, config_.db_port, config_.db_user, config_.db_password, config_.db_name};
    db_client_ = std::make_shared<MariaDbClient>(db_config);
    repository_ = std::make_shared<LedgerRepository>(db_client_);
  }
  registry_ = std::make_shared<EntrantRegistry>(repository_);
  RatingSettings settings{config_.base_rating, config_.k_factor, config_.recent_window};
  rating_service_ = std::make_shared<RatingService>(settings, registry_, repository_, observability_);
  standings_ = std::make_shared<StandingsAggregator>(rating_service_, config_.trend_window);
  history_ = std::make_shared<HistorySeries>(rating_service_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    if (repository_) {
      rating_service_->LoadFromRepository();
    }
    auto services = std::make_shared<ServiceBundle>(
        ServiceBundle{config_, rating_service_, standings_, history_, observability_});
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, services);
    listener_->Run();
    running_ = true;
    observability_->LogEvent(LogLevel::kInfo, "server.started",
                             {{"port", config_.port}, {"persistent", static_cast<bool>(repository_)}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  running_ = false;
}

}  // namespace arena
