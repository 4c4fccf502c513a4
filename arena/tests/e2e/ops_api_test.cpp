#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "arena/app.hpp"

namespace {

namespace http = boost::beast::http;

constexpr const char* kOpsToken = "ops-token";

struct SimpleHttpResponse {
  http::status status;
  nlohmann::json body;
};

class OpsApiFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.port = 18092;
    config_.db_host = "";
    config_.log_level = "error";
    config_.ops_token = kOpsToken;
    app_ = std::make_unique<arena::ServerApp>(config_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(400));

    Register("a", "Alpha");
    Register("b", "Beta");
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  SimpleHttpResponse Send(http::verb verb, const std::string& target, const std::string& body, const char* token) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(config_.port)));

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "localhost");
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (token != nullptr) {
      req.set("X-Ops-Token", token);
    }
    if (!body.empty()) {
      req.set(http::field::content_type, "application/json");
      req.body() = body;
    }
    req.prepare_payload();
    http::write(stream, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse Get(const std::string& target, const char* token = nullptr) {
    return Send(http::verb::get, target, "", token);
  }

  SimpleHttpResponse Ops(const std::string& target, const nlohmann::json& body = nlohmann::json::object(),
                         const char* token = kOpsToken) {
    return Send(http::verb::post, target, body.dump(), token);
  }

  void Register(const std::string& id, const std::string& name) {
    nlohmann::json body{{"id", id}, {"name", name}};
    ASSERT_EQ(Send(http::verb::post, "/api/entrants", body.dump(), nullptr).status, http::status::created);
  }

  std::uint64_t PostResult(const std::string& debate, const std::string& outcome) {
    nlohmann::json body{{"debateId", debate}, {"entrantA", "a"}, {"entrantB", "b"}, {"outcome", outcome}};
    auto res = Send(http::verb::post, "/api/debates/results", body.dump(), nullptr);
    EXPECT_EQ(res.status, http::status::created);
    return res.body["data"]["event"]["eventId"].get<std::uint64_t>();
  }

  arena::AppConfig config_{};
  std::unique_ptr<arena::ServerApp> app_;
  std::thread server_thread_;
};

TEST_F(OpsApiFixture, OpsRoutesRequireToken) {
  auto missing = Get("/ops/status");
  EXPECT_EQ(missing.status, http::status::unauthorized);
  EXPECT_EQ(missing.body["error"]["code"], "unauthorized");

  EXPECT_EQ(Get("/ops/status", "wrong-token").status, http::status::unauthorized);
  EXPECT_EQ(Ops("/ops/rebuild", nlohmann::json::object(), nullptr).status, http::status::unauthorized);

  auto ok = Get("/ops/status", kOpsToken);
  ASSERT_EQ(ok.status, http::status::ok);
  EXPECT_EQ(ok.body["data"]["entrants"], 2);
  EXPECT_EQ(ok.body["data"]["events"], 0);
  EXPECT_FALSE(ok.body["data"]["persistent"].get<bool>());
  EXPECT_FALSE(ok.body["data"]["rebuilding"].get<bool>());
}

TEST_F(OpsApiFixture, ReverseRestoresRatingsOnce) {
  auto event_id = PostResult("d1", "a_wins");

  auto reversed = Ops("/ops/events/" + std::to_string(event_id) + "/reverse");
  ASSERT_EQ(reversed.status, http::status::created);
  EXPECT_EQ(reversed.body["data"]["reversesEventId"], event_id);
  EXPECT_EQ(reversed.body["data"]["aBefore"], 1516);
  EXPECT_EQ(reversed.body["data"]["aAfter"], 1500);
  EXPECT_EQ(reversed.body["data"]["bAfter"], 1500);

  auto again = Ops("/ops/events/" + std::to_string(event_id) + "/reverse");
  EXPECT_EQ(again.status, http::status::conflict);
  EXPECT_EQ(again.body["error"]["code"], "already_reversed");

  auto reversal_id = reversed.body["data"]["eventId"].get<std::uint64_t>();
  auto of_reversal = Ops("/ops/events/" + std::to_string(reversal_id) + "/reverse");
  EXPECT_EQ(of_reversal.status, http::status::conflict);
  EXPECT_EQ(of_reversal.body["error"]["code"], "not_reversible");

  auto missing = Ops("/ops/events/999/reverse");
  EXPECT_EQ(missing.status, http::status::not_found);
  EXPECT_EQ(missing.body["error"]["code"], "event_not_found");

  EXPECT_EQ(Ops("/ops/events/abc/reverse").status, http::status::bad_request);

  auto h2h = Get("/api/head-to-head?a=a&b=b");
  EXPECT_EQ(h2h.body["data"]["total"], 0);
}

TEST_F(OpsApiFixture, RebuildMatchesLiveProjection) {
  PostResult("d1", "a_wins");
  PostResult("d2", "draw");
  auto event_id = PostResult("d3", "b_wins");
  ASSERT_EQ(Ops("/ops/events/" + std::to_string(event_id) + "/reverse").status, http::status::created);

  auto before = Get("/api/standings");
  auto rebuild = Ops("/ops/rebuild");
  ASSERT_EQ(rebuild.status, http::status::ok);
  EXPECT_EQ(rebuild.body["data"]["eventsApplied"], 4);
  EXPECT_TRUE(rebuild.body["data"]["diverged"].empty());

  auto after = Get("/api/standings");
  EXPECT_EQ(before.body["data"]["standings"], after.body["data"]["standings"]);
}

TEST_F(OpsApiFixture, RebuildWithNewKFactorRecomputesHistory) {
  PostResult("d1", "a_wins");
  PostResult("d2", "a_wins");

  auto rebuild = Ops("/ops/rebuild", {{"kFactor", 16}});
  ASSERT_EQ(rebuild.status, http::status::ok);
  EXPECT_EQ(rebuild.body["data"]["kFactor"], 16);
  EXPECT_EQ(rebuild.body["data"]["recomputed"], 2);
  EXPECT_EQ(rebuild.body["data"]["diverged"].size(), 2u);

  auto standings = Get("/api/standings");
  EXPECT_EQ(standings.body["data"]["standings"][0]["rating"], 1516);
  EXPECT_EQ(standings.body["data"]["standings"][1]["rating"], 1484);

  auto status = Get("/ops/status", kOpsToken);
  EXPECT_EQ(status.body["data"]["kFactor"], 16);

  auto events = Get("/api/entrants/a/events");
  ASSERT_EQ(events.body["data"]["events"].size(), 2u);
  EXPECT_EQ(events.body["data"]["events"][0]["aAfter"], 1508);
  EXPECT_EQ(events.body["data"]["events"][0]["kFactor"], 16);

  EXPECT_EQ(Ops("/ops/rebuild", {{"kFactor", 0}}).status, http::status::bad_request);
  EXPECT_EQ(Ops("/ops/rebuild", {{"kFactor", "big"}}).status, http::status::bad_request);
}

TEST_F(OpsApiFixture, DeactivatedEntrantLeavesActiveStandings) {
  PostResult("d1", "a_wins");

  auto res = Ops("/ops/entrants/b/active", {{"active", false}});
  ASSERT_EQ(res.status, http::status::ok);
  EXPECT_FALSE(res.body["data"]["active"].get<bool>());

  auto active = Get("/api/standings");
  ASSERT_EQ(active.body["data"]["standings"].size(), 1u);
  EXPECT_EQ(active.body["data"]["standings"][0]["entrant"]["id"], "a");

  auto all = Get("/api/standings?activeOnly=false");
  ASSERT_EQ(all.body["data"]["standings"].size(), 2u);
  EXPECT_EQ(all.body["data"]["standings"][1]["entrant"]["id"], "b");

  auto detail = Get("/api/entrants/b");
  ASSERT_EQ(detail.status, http::status::ok);
  EXPECT_EQ(detail.body["data"]["rank"], 2);

  EXPECT_EQ(Ops("/ops/entrants/ghost/active", {{"active", true}}).status, http::status::not_found);
  EXPECT_EQ(Ops("/ops/entrants/b/active", {{"active", "no"}}).status, http::status::bad_request);
}

TEST_F(OpsApiFixture, MetricsCountRequestsAndErrors) {
  PostResult("d1", "draw");
  Get("/api/nothing");

  auto metrics = Get("/metrics");
  ASSERT_EQ(metrics.status, http::status::ok);
  EXPECT_GE(metrics.body["data"]["requests"]["total"].get<long long>(), 4);
  EXPECT_GE(metrics.body["data"]["requests"]["errors"].get<long long>(), 1);
  EXPECT_EQ(metrics.body["data"]["ledger"]["events"], 1);
  EXPECT_EQ(metrics.body["data"]["entrants"]["total"], 2);
}

}  // namespace
