/*
 * 설명: 도메인 오류 코드를 API 오류 문자열로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/e2e/standings_api_test.cpp
 */
#include "arena/rating_error.hpp"

namespace arena {

std::string_view ToCode(RatingError error) {
  switch (error) {
    case RatingError::kUnknownEntrant:
      return "unknown_entrant";
    case RatingError::kDuplicateEntrant:
      return "duplicate_entrant";
    case RatingError::kDuplicateEvent:
      return "duplicate_event";
    case RatingError::kEventNotFound:
      return "event_not_found";
    case RatingError::kAlreadyReversed:
      return "already_reversed";
    case RatingError::kNotReversible:
      return "not_reversible";
    case RatingError::kOutOfOrderEvent:
      return "out_of_order_event";
    case RatingError::kInvariantViolation:
      return "invariant_violation";
    case RatingError::kInvalidArgument:
      return "invalid_argument";
  }
  return "internal_error";
}

}  // namespace arena
