/*
 * 설명: 구조화 로그(JSON 한 줄)와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace arena {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> entrant_id;
  std::optional<std::string> debate_id;
  std::string name;
  long latency_ms{0};
  int status{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t events_total{0};
  std::uint64_t entrants_total{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream* sink = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  MetricsSnapshot Snapshot(std::uint64_t events_total, std::uint64_t entrants_total) const;

  // HTTP 요청 로그.
  void Log(const LogContext& ctx) const;
  // 엔진 이벤트 로그. fields는 JSON 객체여야 한다.
  void LogEvent(LogLevel level, std::string_view name, const nlohmann::json& fields = nlohmann::json::object()) const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }

 private:
  void Write(const nlohmann::json& line) const;

  LogLevel min_level_;
  std::ostream* sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace arena
