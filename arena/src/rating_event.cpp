/*
 * 설명: 결과 열거형의 문자열 변환과 원장 항목 보조 함수를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_ledger_test.cpp
 */
#include "arena/rating_event.hpp"

namespace arena {

std::string_view ToString(Outcome outcome) {
  switch (outcome) {
    case Outcome::kAWins:
      return "a_wins";
    case Outcome::kBWins:
      return "b_wins";
    case Outcome::kDraw:
      return "draw";
  }
  return "draw";
}

std::optional<Outcome> ParseOutcome(std::string_view text) {
  if (text == "a_wins") {
    return Outcome::kAWins;
  }
  if (text == "b_wins") {
    return Outcome::kBWins;
  }
  if (text == "draw") {
    return Outcome::kDraw;
  }
  return std::nullopt;
}

std::string_view ToString(EntrantResult result) {
  switch (result) {
    case EntrantResult::kWin:
      return "win";
    case EntrantResult::kLoss:
      return "loss";
    case EntrantResult::kDraw:
      return "draw";
  }
  return "draw";
}

EntrantResult RatingEvent::ResultFor(const std::string& entrant_id) const {
  if (outcome == Outcome::kDraw) {
    return EntrantResult::kDraw;
  }
  bool a_won = outcome == Outcome::kAWins;
  bool is_a = entrant_id == entrant_a;
  return a_won == is_a ? EntrantResult::kWin : EntrantResult::kLoss;
}

std::int64_t ToEpochMicros(Clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

Clock::time_point FromEpochMicros(std::int64_t micros) {
  return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros)));
}

}  // namespace arena
