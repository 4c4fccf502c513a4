/*
 * 설명: 토론 결과 한 건이 레이팅에 미친 영향을 기록하는 불변 원장 항목을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_ledger_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace arena {

using Clock = std::chrono::system_clock;

enum class Outcome { kAWins, kBWins, kDraw };

// 한 참가자 관점의 결과.
enum class EntrantResult { kWin, kLoss, kDraw };

std::string_view ToString(Outcome outcome);
std::optional<Outcome> ParseOutcome(std::string_view text);
std::string_view ToString(EntrantResult result);

struct RatingEvent {
  std::uint64_t event_id{0};
  std::string debate_id;
  std::string entrant_a;
  std::string entrant_b;
  Outcome outcome{Outcome::kDraw};
  int a_before{0};
  int b_before{0};
  int a_after{0};
  int b_after{0};
  Clock::time_point occurred_at{};
  // 0이면 일반 이벤트, 아니면 보정 대상 이벤트 ID.
  std::uint64_t reverses_event_id{0};
  // 이 이벤트를 계산한 k. 보정 이벤트는 원 이벤트의 k를 따른다.
  int k_factor{0};

  bool IsReversal() const { return reverses_event_id != 0; }
  bool Touches(const std::string& entrant_id) const { return entrant_a == entrant_id || entrant_b == entrant_id; }
  bool IsBetween(const std::string& x, const std::string& y) const {
    return (entrant_a == x && entrant_b == y) || (entrant_a == y && entrant_b == x);
  }
  int DeltaA() const { return a_after - a_before; }
  int DeltaB() const { return b_after - b_before; }
  int DeltaFor(const std::string& entrant_id) const { return entrant_id == entrant_a ? DeltaA() : DeltaB(); }
  int RatingAfter(const std::string& entrant_id) const { return entrant_id == entrant_a ? a_after : b_after; }
  int RatingBefore(const std::string& entrant_id) const { return entrant_id == entrant_a ? a_before : b_before; }
  const std::string& OpponentOf(const std::string& entrant_id) const {
    return entrant_id == entrant_a ? entrant_b : entrant_a;
  }
  // 보정 이벤트는 원래 결과를 그대로 담으므로 호출자가 IsReversal()을 함께 본다.
  EntrantResult ResultFor(const std::string& entrant_id) const;
};

std::int64_t ToEpochMicros(Clock::time_point tp);
Clock::time_point FromEpochMicros(std::int64_t micros);

}  // namespace arena
