/*
 * 설명: Elo 공식 구현. 상태 없이 k 상수만 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_math_test.cpp
 */
#include "arena/rating_math.hpp"

#include <cmath>
#include <string>

#include "arena/rating_error.hpp"

namespace arena {

RatingMath::RatingMath(int k_factor) : k_factor_(k_factor) {
  if (k_factor_ <= 0) {
    throw RatingException(RatingError::kInvalidArgument, "k 값은 양수여야 합니다: " + std::to_string(k_factor_));
  }
}

double RatingMath::ExpectedScore(int rating_self, int rating_opponent) {
  double exponent = static_cast<double>(rating_opponent - rating_self) / 400.0;
  return 1.0 / (1.0 + std::pow(10.0, exponent));
}

double RatingMath::ScoreFor(Outcome outcome, Side side) {
  if (outcome == Outcome::kDraw) {
    return 0.5;
  }
  bool a_won = outcome == Outcome::kAWins;
  return (a_won == (side == Side::kA)) ? 1.0 : 0.0;
}

int RatingMath::NewRating(int rating_self, int rating_opponent, double actual_score) const {
  double expected = ExpectedScore(rating_self, rating_opponent);
  double next = static_cast<double>(rating_self) + static_cast<double>(k_factor_) * (actual_score - expected);
  return static_cast<int>(std::round(next));
}

int RatingMath::Delta(int rating_self, int rating_opponent, double actual_score) const {
  double expected = ExpectedScore(rating_self, rating_opponent);
  return static_cast<int>(std::round(static_cast<double>(k_factor_) * (actual_score - expected)));
}

}  // namespace arena
