/*
 * 설명: HTTP 연결을 처리하고 순위/참가자/이력 조회, 결과 수집, 운영 엔드포인트를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/e2e/standings_api_test.cpp, arena/tests/e2e/ops_api_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "arena/app.hpp"

namespace arena {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ServiceBundle> services);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void Route(const std::string& path, const std::unordered_map<std::string, std::string>& params,
             Response& res);

  void HandleStandings(const std::unordered_map<std::string, std::string>& params, Response& res);
  void HandleEntrantDetail(const std::string& entrant_id, const std::unordered_map<std::string, std::string>& params,
                           Response& res);
  void HandleEntrantHistory(const std::string& entrant_id, Response& res);
  void HandleEntrantEvents(const std::string& entrant_id, const std::unordered_map<std::string, std::string>& params,
                           Response& res);
  void HandleHeadToHead(const std::unordered_map<std::string, std::string>& params, Response& res);
  void HandleAllHistory(const std::unordered_map<std::string, std::string>& params, Response& res);
  void HandleRegisterEntrant(Response& res);
  void HandleDebateResult(Response& res);
  void HandleReverse(const std::string& event_id_text, Response& res);
  void HandleSetActive(const std::string& entrant_id, Response& res);
  void HandleRebuild(Response& res);
  void HandleOpsStatus(Response& res);
  void HandleMetrics(Response& res);

  bool CheckOpsToken() const;
  nlohmann::json ParseBodyObject() const;
  void Reply(Response& res, boost::beast::http::status status, const nlohmann::json& envelope) const;
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<const ServiceBundle> services_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<std::string> log_entrant_id_;
  std::optional<std::string> log_debate_id_;
};

}  // namespace arena
