#include <gtest/gtest.h>

#include "arena/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = arena::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = arena::MakeErrorEnvelope("invalid_argument", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "invalid_argument");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
  EXPECT_TRUE(env["error"]["detail"].is_null());
}

TEST(JsonEnvelopeTest, ErrorDetailIsPassedThrough) {
  auto env = arena::MakeErrorEnvelope("db_unavailable", "저장소 오류", {{"retryable", true}});
  EXPECT_TRUE(env["error"]["detail"]["retryable"].get<bool>());
}

TEST(JsonEnvelopeTest, DomainErrorsMapToHttpStatus) {
  using arena::RatingError;
  EXPECT_EQ(arena::HttpStatusFor(RatingError::kUnknownEntrant), 404u);
  EXPECT_EQ(arena::HttpStatusFor(RatingError::kEventNotFound), 404u);
  EXPECT_EQ(arena::HttpStatusFor(RatingError::kDuplicateEntrant), 409u);
  EXPECT_EQ(arena::HttpStatusFor(RatingError::kDuplicateEvent), 409u);
  EXPECT_EQ(arena::HttpStatusFor(RatingError::kAlreadyReversed), 409u);
  EXPECT_EQ(arena::HttpStatusFor(RatingError::kNotReversible), 409u);
  EXPECT_EQ(arena::HttpStatusFor(RatingError::kInvalidArgument), 400u);
  EXPECT_EQ(arena::HttpStatusFor(RatingError::kInvariantViolation), 500u);
  EXPECT_EQ(arena::ToCode(RatingError::kAlreadyReversed), "already_reversed");
}
