/*
 * 설명: HTTP 요청을 처리하고 조회/수집/운영 경로를 분기한다. 도메인 예외는 오류 엔벨로프로 옮긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/e2e/standings_api_test.cpp, arena/tests/e2e/ops_api_test.cpp
 */
#include "arena/http_session.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

#include <boost/beast/version.hpp>
#include <openssl/crypto.h>

#include "arena/api_response.hpp"
#include "arena/db_client.hpp"
#include "arena/rating_error.hpp"

namespace arena {

namespace {
namespace http = boost::beast::http;

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

std::int64_t ToEpochMillis(Clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int HexValue(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  return std::tolower(static_cast<unsigned char>(ch)) - 'a' + 10;
}

std::string UrlDecode(const std::string& text, bool plus_as_space) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    char ch = text[i];
    if (ch == '%' && i + 2 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
      out.push_back(static_cast<char>(HexValue(text[i + 1]) * 16 + HexValue(text[i + 2])));
      i += 2;
    } else if (ch == '+' && plus_as_space) {
      out.push_back(' ');
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(UrlDecode(pair.substr(0, eq), true), UrlDecode(pair.substr(eq + 1), true));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

template <typename T>
std::optional<T> ParseNumber(const std::string& value) {
  T parsed{};
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) {
    return std::nullopt;
  }
  return parsed;
}

// activeOnly 같은 불리언 쿼리. 값이 없으면 기본값, 해석할 수 없으면 예외.
bool ParseBoolParam(const std::unordered_map<std::string, std::string>& params, const std::string& key, bool def) {
  auto it = params.find(key);
  if (it == params.end()) {
    return def;
  }
  if (it->second == "true" || it->second == "1") {
    return true;
  }
  if (it->second == "false" || it->second == "0") {
    return false;
  }
  throw RatingException(RatingError::kInvalidArgument, key + " 값은 true 또는 false여야 합니다");
}

// trendWindow 쿼리. 값이 없으면 기본 창 크기를 쓴다.
std::size_t ParseTrendWindow(const std::unordered_map<std::string, std::string>& params, std::size_t def) {
  auto it = params.find("trendWindow");
  if (it == params.end()) {
    return def;
  }
  auto window = ParseNumber<std::size_t>(it->second);
  if (!window || *window == 0) {
    throw RatingException(RatingError::kInvalidArgument, "trendWindow는 1 이상의 정수여야 합니다");
  }
  return *window;
}

std::string RequireString(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || !body[key].is_string() || body[key].get<std::string>().empty()) {
    throw RatingException(RatingError::kInvalidArgument, std::string(key) + " 필드가 필요합니다");
  }
  return body[key].get<std::string>();
}

nlohmann::json EntrantJson(const Entrant& entrant) {
  return nlohmann::json{{"id", entrant.id},
                        {"name", entrant.name},
                        {"provider", entrant.provider},
                        {"slug", entrant.slug},
                        {"active", entrant.active},
                        {"createdAt", ToIsoString(entrant.created_at)}};
}

nlohmann::json EventJson(const RatingEvent& event) {
  nlohmann::json j{{"eventId", event.event_id},
                   {"debateId", event.debate_id},
                   {"entrantA", event.entrant_a},
                   {"entrantB", event.entrant_b},
                   {"outcome", std::string(ToString(event.outcome))},
                   {"aBefore", event.a_before},
                   {"aAfter", event.a_after},
                   {"bBefore", event.b_before},
                   {"bAfter", event.b_after},
                   {"occurredAt", ToIsoString(event.occurred_at)},
                   {"occurredAtMs", ToEpochMillis(event.occurred_at)},
                   {"kFactor", event.k_factor}};
  j["reversesEventId"] = event.IsReversal() ? nlohmann::json(event.reverses_event_id) : nlohmann::json(nullptr);
  return j;
}

nlohmann::json WinRateJson(int wins, int decided) {
  if (decided == 0) {
    return nullptr;
  }
  return 100.0 * wins / decided;
}

nlohmann::json SnapshotJson(const RatingSnapshot& snapshot) {
  nlohmann::json recent = nlohmann::json::array();
  for (const auto& outcome : snapshot.recent) {
    recent.push_back({{"eventId", outcome.event_id},
                      {"result", std::string(ToString(outcome.result))},
                      {"delta", outcome.delta}});
  }
  return nlohmann::json{{"rating", snapshot.rating},
                        {"wins", snapshot.wins},
                        {"losses", snapshot.losses},
                        {"draws", snapshot.draws},
                        {"debates", snapshot.debates()},
                        {"winRate", WinRateJson(snapshot.wins, snapshot.decided())},
                        {"recent", recent},
                        {"lastEventId", snapshot.last_event_id}};
}

nlohmann::json HeadToHeadJson(const HeadToHeadRecord& record) {
  return nlohmann::json{{"entrantId", record.entrant_id},
                        {"opponentId", record.opponent_id},
                        {"wins", record.wins},
                        {"losses", record.losses},
                        {"draws", record.draws},
                        {"total", record.total()},
                        {"winRate", record.win_rate()}};
}

nlohmann::json SeriesJson(const std::vector<SeriesPoint>& points) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& point : points) {
    out.push_back({{"t", ToEpochMillis(point.at)}, {"rating", point.rating}, {"eventId", point.event_id}});
  }
  return out;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ServiceBundle> services)
    : stream_(std::move(socket)), services_(std::move(services)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read(stream_, buffer_, req_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = services_->observability->NextTraceId();
  services_->observability->IncrementRequest();
  log_entrant_id_.reset();
  log_debate_id_.reset();

  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "arena-server");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  try {
    Route(path, ParseQueryParams(query), *res);
  } catch (const RatingException& ex) {
    Reply(*res, static_cast<http::status>(HttpStatusFor(ex.error)), MakeErrorEnvelope(ToCode(ex.error), ex.what()));
  } catch (const DbException& ex) {
    services_->observability->LogEvent(LogLevel::kError, "db.failure",
                                       {{"traceId", trace_id_}, {"code", ex.code}, {"reason", ex.what()}});
    Reply(*res, http::status::service_unavailable,
          MakeErrorEnvelope("db_unavailable", "저장소를 사용할 수 없습니다", {{"retryable", ex.retryable}}));
  } catch (const nlohmann::json::exception&) {
    Reply(*res, http::status::bad_request, MakeErrorEnvelope("invalid_argument", "JSON 본문이 올바르지 않습니다"));
  } catch (const std::exception& ex) {
    services_->observability->LogEvent(LogLevel::kError, "http.unhandled",
                                       {{"traceId", trace_id_}, {"path", path}, {"reason", ex.what()}});
    Reply(*res, http::status::internal_server_error, MakeErrorEnvelope("internal_error", "서버 내부 오류입니다"));
  }
  SendResponse(res);
}

void HttpSession::Route(const std::string& path, const std::unordered_map<std::string, std::string>& params,
                        Response& res) {
  const http::verb method = req_.method();
  const std::string entrants_prefix = "/api/entrants/";

  if (method == http::verb::get) {
    if (path == "/api/health") {
      nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
      return Reply(res, http::status::ok, MakeSuccessEnvelope(payload));
    }
    if (path == "/api/standings") {
      return HandleStandings(params, res);
    }
    if (path == "/api/head-to-head") {
      return HandleHeadToHead(params, res);
    }
    if (path == "/api/history") {
      return HandleAllHistory(params, res);
    }
    if (path == "/metrics") {
      return HandleMetrics(res);
    }
    if (path == "/ops/status") {
      if (!CheckOpsToken()) {
        return Reply(res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
      }
      return HandleOpsStatus(res);
    }
    if (StartsWith(path, entrants_prefix + "by-slug/")) {
      std::string slug = UrlDecode(path.substr(entrants_prefix.size() + 8), false);
      auto entrant = services_->rating_service->Registry()->FindBySlug(slug);
      if (!entrant) {
        return Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "참가자를 찾을 수 없습니다"));
      }
      return HandleEntrantDetail(entrant->id, params, res);
    }
    if (StartsWith(path, entrants_prefix)) {
      std::string rest = path.substr(entrants_prefix.size());
      auto slash = rest.find('/');
      std::string entrant_id = UrlDecode(rest.substr(0, slash), false);
      std::string suffix = slash == std::string::npos ? std::string() : rest.substr(slash);
      if (!entrant_id.empty()) {
        log_entrant_id_ = entrant_id;
        if (suffix.empty()) {
          return HandleEntrantDetail(entrant_id, params, res);
        }
        if (suffix == "/history") {
          return HandleEntrantHistory(entrant_id, res);
        }
        if (suffix == "/events") {
          return HandleEntrantEvents(entrant_id, params, res);
        }
      }
    }
  }

  if (method == http::verb::post) {
    if (path == "/api/entrants") {
      return HandleRegisterEntrant(res);
    }
    if (path == "/api/debates/results") {
      return HandleDebateResult(res);
    }
    if (StartsWith(path, "/ops/")) {
      if (!CheckOpsToken()) {
        return Reply(res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
      }
      if (path == "/ops/rebuild") {
        return HandleRebuild(res);
      }
      const std::string events_prefix = "/ops/events/";
      if (StartsWith(path, events_prefix) && EndsWith(path, "/reverse")) {
        return HandleReverse(path.substr(events_prefix.size(), path.size() - events_prefix.size() - 8), res);
      }
      const std::string ops_entrants_prefix = "/ops/entrants/";
      if (StartsWith(path, ops_entrants_prefix) && EndsWith(path, "/active")) {
        std::string entrant_id =
            UrlDecode(path.substr(ops_entrants_prefix.size(), path.size() - ops_entrants_prefix.size() - 7), false);
        return HandleSetActive(entrant_id, res);
      }
    }
  }

  Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleStandings(const std::unordered_map<std::string, std::string>& params, Response& res) {
  bool active_only = ParseBoolParam(params, "activeOnly", true);
  std::size_t window = ParseTrendWindow(params, services_->standings->TrendWindow());
  nlohmann::json rows = nlohmann::json::array();
  for (const auto& standing :
       services_->standings->RankedStandings(services_->rating_service->View(), active_only, window)) {
    rows.push_back({{"rank", standing.rank},
                    {"entrant", EntrantJson(standing.entrant)},
                    {"rating", standing.snapshot.rating},
                    {"wins", standing.snapshot.wins},
                    {"losses", standing.snapshot.losses},
                    {"draws", standing.snapshot.draws},
                    {"debates", standing.snapshot.debates()},
                    {"trend", standing.trend},
                    {"winRate", standing.win_rate_percent ? nlohmann::json(*standing.win_rate_percent)
                                                          : nlohmann::json(nullptr)}});
  }
  nlohmann::json data{{"activeOnly", active_only},
                      {"trendWindow", window},
                      {"standings", rows}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleEntrantDetail(const std::string& entrant_id,
                                      const std::unordered_map<std::string, std::string>& params, Response& res) {
  auto entrant = services_->rating_service->Registry()->Find(entrant_id);
  if (!entrant) {
    return Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "참가자를 찾을 수 없습니다"));
  }
  log_entrant_id_ = entrant_id;
  std::size_t window = ParseTrendWindow(params, services_->standings->TrendWindow());
  const auto& standings = services_->standings;
  // 순위, 스냅샷, 추세, 전적이 모두 같은 시점을 보도록 view를 한 번만 잡는다.
  LedgerView view = services_->rating_service->View();

  nlohmann::json rank = nullptr;
  for (const auto& standing : standings->RankedStandings(view, entrant->active, window)) {
    if (standing.entrant.id == entrant_id) {
      rank = standing.rank;
      break;
    }
  }
  RatingSnapshot snapshot;
  if (const RatingSnapshot* found = view.Find(entrant_id)) {
    snapshot = *found;
  } else {
    snapshot.entrant_id = entrant_id;
    snapshot.rating = view.base_rating;
  }
  nlohmann::json recent_events = nlohmann::json::array();
  const std::size_t recent_limit = services_->rating_service->Settings().recent_capacity;
  for (auto it = view.events->rbegin(); it != view.events->rend() && recent_events.size() < recent_limit; ++it) {
    if (it->Touches(entrant_id)) {
      recent_events.push_back(EventJson(*it));
    }
  }
  nlohmann::json head_to_head = nlohmann::json::array();
  for (const auto& record : standings->HeadToHeadTable(view, entrant_id)) {
    head_to_head.push_back(HeadToHeadJson(record));
  }
  nlohmann::json data{{"entrant", EntrantJson(*entrant)},
                      {"rank", rank},
                      {"snapshot", SnapshotJson(snapshot)},
                      {"trend", standings->Trend(view, entrant_id, window)},
                      {"trendWindow", window},
                      {"recentEvents", recent_events},
                      {"headToHead", head_to_head}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleEntrantHistory(const std::string& entrant_id, Response& res) {
  auto series = services_->history->Series(entrant_id);
  nlohmann::json data{{"entrantId", entrant_id}, {"points", SeriesJson(series.ToVector())}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleEntrantEvents(const std::string& entrant_id,
                                      const std::unordered_map<std::string, std::string>& params, Response& res) {
  std::optional<Clock::time_point> since;
  auto it = params.find("since");
  if (it != params.end()) {
    auto millis = ParseNumber<std::int64_t>(it->second);
    // 시계 표현 범위를 넘는 값은 변환 전에 거른다.
    const auto max_millis = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max()).count();
    const auto min_millis = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::min()).count();
    if (!millis || *millis > max_millis || *millis < min_millis) {
      throw RatingException(RatingError::kInvalidArgument, "since는 epoch 밀리초여야 합니다");
    }
    since = Clock::time_point(std::chrono::milliseconds(*millis));
  }
  nlohmann::json events = nlohmann::json::array();
  for (const auto& event : services_->rating_service->ListEvents(entrant_id, since)) {
    events.push_back(EventJson(event));
  }
  nlohmann::json data{{"entrantId", entrant_id}, {"events", events}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleHeadToHead(const std::unordered_map<std::string, std::string>& params, Response& res) {
  auto a = params.find("a");
  auto b = params.find("b");
  if (a == params.end() || b == params.end() || a->second.empty() || b->second.empty()) {
    throw RatingException(RatingError::kInvalidArgument, "a와 b 쿼리 파라미터가 필요합니다");
  }
  Reply(res, http::status::ok, MakeSuccessEnvelope(HeadToHeadJson(services_->standings->HeadToHead(a->second, b->second))));
}

void HttpSession::HandleAllHistory(const std::unordered_map<std::string, std::string>& params, Response& res) {
  bool active_only = ParseBoolParam(params, "activeOnly", true);
  nlohmann::json series = nlohmann::json::array();
  for (const auto& entry : services_->history->AllSeries(active_only)) {
    series.push_back({{"entrant", EntrantJson(entry.entrant)}, {"points", SeriesJson(entry.points)}});
  }
  Reply(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json{{"series", series}}));
}

void HttpSession::HandleRegisterEntrant(Response& res) {
  auto body = ParseBodyObject();
  std::string id = RequireString(body, "id");
  std::string name = RequireString(body, "name");
  std::string provider = body.contains("provider") ? body["provider"].get<std::string>() : std::string();
  bool active = body.contains("active") ? body["active"].get<bool>() : true;
  log_entrant_id_ = id;
  auto entrant = services_->rating_service->RegisterEntrant(id, name, provider, active);
  Reply(res, http::status::created, MakeSuccessEnvelope(EntrantJson(entrant)));
}

void HttpSession::HandleDebateResult(Response& res) {
  if (services_->rating_service->IsRebuilding()) {
    return Reply(res, http::status::service_unavailable,
                 MakeErrorEnvelope("store_rebuilding", "레이팅 투영을 재구축하는 중입니다"));
  }
  auto body = ParseBodyObject();
  std::string debate_id = RequireString(body, "debateId");
  log_debate_id_ = debate_id;
  std::string entrant_a = RequireString(body, "entrantA");
  std::string entrant_b = RequireString(body, "entrantB");
  auto outcome = ParseOutcome(RequireString(body, "outcome"));
  if (!outcome) {
    throw RatingException(RatingError::kInvalidArgument, "outcome은 a_wins, b_wins, draw 중 하나여야 합니다");
  }
  auto result = services_->rating_service->AppendEvent(debate_id, entrant_a, entrant_b, *outcome);
  nlohmann::json data{{"created", result.created}, {"event", EventJson(result.event)}};
  Reply(res, result.created ? http::status::created : http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleReverse(const std::string& event_id_text, Response& res) {
  if (services_->rating_service->IsRebuilding()) {
    return Reply(res, http::status::service_unavailable,
                 MakeErrorEnvelope("store_rebuilding", "레이팅 투영을 재구축하는 중입니다"));
  }
  auto event_id = ParseNumber<std::uint64_t>(event_id_text);
  if (!event_id || *event_id == 0) {
    throw RatingException(RatingError::kInvalidArgument, "이벤트 ID가 올바르지 않습니다: " + event_id_text);
  }
  auto reversal = services_->rating_service->ReverseEvent(*event_id);
  log_debate_id_ = reversal.debate_id;
  Reply(res, http::status::created, MakeSuccessEnvelope(EventJson(reversal)));
}

void HttpSession::HandleSetActive(const std::string& entrant_id, Response& res) {
  auto body = ParseBodyObject();
  if (!body.contains("active") || !body["active"].is_boolean()) {
    throw RatingException(RatingError::kInvalidArgument, "active 필드가 필요합니다");
  }
  log_entrant_id_ = entrant_id;
  auto entrant = services_->rating_service->Registry()->SetActive(entrant_id, body["active"].get<bool>());
  Reply(res, http::status::ok, MakeSuccessEnvelope(EntrantJson(entrant)));
}

void HttpSession::HandleRebuild(Response& res) {
  std::optional<int> k_factor;
  if (!req_.body().empty()) {
    auto body = ParseBodyObject();
    if (body.contains("kFactor")) {
      const auto& value = body["kFactor"];
      if (!value.is_number_integer() || value.get<std::int64_t>() <= 0 ||
          value.get<std::int64_t>() > std::numeric_limits<int>::max()) {
        throw RatingException(RatingError::kInvalidArgument, "kFactor는 양의 정수여야 합니다");
      }
      k_factor = static_cast<int>(value.get<std::int64_t>());
    }
  }
  auto report = services_->rating_service->RebuildFromLedger(k_factor);
  nlohmann::json data{{"eventsApplied", report.events_applied},
                      {"entrants", report.entrants},
                      {"diverged", report.diverged},
                      {"recomputed", report.recomputed},
                      {"kFactor", report.k_factor},
                      {"elapsedMs", report.elapsed_ms}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleOpsStatus(Response& res) {
  const auto& service = services_->rating_service;
  auto snapshot = services_->observability->Snapshot(service->EventCount(), service->Registry()->Size());
  nlohmann::json data{{"events", snapshot.events_total},
                      {"entrants", snapshot.entrants_total},
                      {"rebuilding", service->IsRebuilding()},
                      {"persistent", !services_->config.db_host.empty()},
                      {"kFactor", service->Settings().k_factor},
                      {"baseRating", service->Settings().base_rating},
                      {"errorCount", snapshot.request_errors}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleMetrics(Response& res) {
  const auto& service = services_->rating_service;
  auto snapshot = services_->observability->Snapshot(service->EventCount(), service->Registry()->Size());
  nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                      {"ledger", {{"events", snapshot.events_total}}},
                      {"entrants", {{"total", snapshot.entrants_total}}}};
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

bool HttpSession::CheckOpsToken() const {
  const std::string& expected = services_->config.ops_token;
  if (expected.empty()) {
    return false;
  }
  auto header_it = req_.base().find("X-Ops-Token");
  if (header_it == req_.base().end()) {
    return false;
  }
  std::string provided(header_it->value());
  if (provided.size() != expected.size()) {
    return false;
  }
  return CRYPTO_memcmp(provided.data(), expected.data(), expected.size()) == 0;
}

nlohmann::json HttpSession::ParseBodyObject() const {
  auto body = nlohmann::json::parse(req_.body());
  if (!body.is_object()) {
    throw RatingException(RatingError::kInvalidArgument, "JSON 객체 본문이 필요합니다");
  }
  return body;
}

void HttpSession::Reply(Response& res, http::status status, const nlohmann::json& envelope) const {
  res.result(status);
  res.body() = envelope.dump();
  res.content_length(res.body().size());
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  const int status = static_cast<int>(res->result_int());
  if (status >= 400) {
    services_->observability->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  services_->observability->Log(LogContext{trace_id_, log_entrant_id_, log_debate_id_, std::string(req_.target()),
                                           static_cast<long>(latency), status});
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

}  // namespace arena
