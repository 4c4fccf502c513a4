/*
 * 설명: 레이팅 엔진의 도메인 오류 코드와 예외 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_ledger_test.cpp, arena/tests/unit/rating_store_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace arena {

enum class RatingError {
  kUnknownEntrant,
  kDuplicateEntrant,
  kDuplicateEvent,
  kEventNotFound,
  kAlreadyReversed,
  kNotReversible,
  kOutOfOrderEvent,
  kInvariantViolation,
  kInvalidArgument,
};

// API 응답의 error.code 값으로 그대로 쓰인다.
std::string_view ToCode(RatingError error);

class RatingException : public std::runtime_error {
 public:
  RatingException(RatingError error, const std::string& message) : std::runtime_error(message), error(error) {}
  RatingError error;
};

}  // namespace arena
