/*
 * 설명: Elo 기대 승률과 레이팅 변화량을 계산하는 순수 함수 모음.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_math_test.cpp
 */
#pragma once

#include "arena/rating_event.hpp"

namespace arena {

enum class Side { kA, kB };

class RatingMath {
 public:
  explicit RatingMath(int k_factor);

  // 1 / (1 + 10^((opponent - self) / 400))
  static double ExpectedScore(int rating_self, int rating_opponent);
  static double ScoreFor(Outcome outcome, Side side);

  int NewRating(int rating_self, int rating_opponent, double actual_score) const;
  int Delta(int rating_self, int rating_opponent, double actual_score) const;
  int KFactor() const { return k_factor_; }

 private:
  int k_factor_;
};

}  // namespace arena
