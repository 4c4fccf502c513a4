/*
 * 설명: JSON 응답 엔벨로프를 생성하고 오류 코드를 HTTP 상태로 옮긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/json_envelope_test.cpp
 */
#include "arena/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace arena {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", std::string(code)}, {"message", std::string(message)}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

unsigned int HttpStatusFor(RatingError error) {
  switch (error) {
    case RatingError::kUnknownEntrant:
    case RatingError::kEventNotFound:
      return 404;
    case RatingError::kDuplicateEntrant:
    case RatingError::kDuplicateEvent:
    case RatingError::kAlreadyReversed:
    case RatingError::kNotReversible:
    case RatingError::kOutOfOrderEvent:
      return 409;
    case RatingError::kInvalidArgument:
      return 400;
    case RatingError::kInvariantViolation:
      return 500;
  }
  return 500;
}

}  // namespace arena
