/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/observability_test.cpp
 */
#include "arena/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace arena {

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level, std::ostream* sink)
    : min_level_(min_level), sink_(sink ? sink : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t events_total, std::uint64_t entrants_total) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.events_total = events_total;
  snapshot.entrants_total = entrants_total;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  LogLevel level = ctx.status >= 500 ? LogLevel::kError : LogLevel::kInfo;
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = std::string(ToString(level));
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  log_json["status"] = ctx.status;
  if (ctx.entrant_id) {
    log_json["entrantId"] = *ctx.entrant_id;
  }
  if (ctx.debate_id) {
    log_json["debateId"] = *ctx.debate_id;
  }
  Write(log_json);
}

void Observability::LogEvent(LogLevel level, std::string_view name, const nlohmann::json& fields) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json::object();
  log_json["level"] = std::string(ToString(level));
  log_json["eventName"] = std::string(name);
  Write(log_json);
}

void Observability::Write(const nlohmann::json& line) const {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  *sink_ << line.dump() << std::endl;
}

}  // namespace arena
