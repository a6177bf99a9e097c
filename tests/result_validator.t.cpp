#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>

#include "../services/performer/include/log.hpp"
#include "../services/performer/include/result_validator.hpp"

using json = nlohmann::json;

static ErrorCode rejectionCode(const std::string &bytes) {
  ResultValidator v;
  auto r = v.validate(bytes);
  EXPECT_FALSE(r.outcome.is_accepted()) << bytes;
  EXPECT_FALSE(r.result.has_value());
  if (r.outcome.is_accepted()) {
    return ErrorCode::EmptyResult;
  }
  EXPECT_EQ(ErrorCategory::InvalidResult, r.outcome.error().category());
  return r.outcome.error().code;
}

TEST(ResultValidator, acceptsSerializedResult) {
  ComputationResult in;
  in.llm_output = "this is valid";
  in.verified = true;

  ResultValidator v;
  auto r = v.validate(serialize_result(in));
  ASSERT_TRUE(r.outcome.is_accepted());
  ASSERT_TRUE(r.result.has_value());
  EXPECT_EQ("this is valid", r.result->llm_output);
  EXPECT_TRUE(r.result->verified);
  EXPECT_TRUE(r.result->extra.empty());
}

TEST(ResultValidator, keepsExtraFields) {
  ResultValidator v;
  auto r = v.validate(R"({"llm_output":"yes","verified":false,"model":"gpt","usage":{"tokens":3}})");
  ASSERT_TRUE(r.outcome.is_accepted());
  EXPECT_FALSE(r.result->verified);
  EXPECT_EQ("gpt", r.result->extra["model"]);
  EXPECT_EQ(3, r.result->extra["usage"]["tokens"]);

  auto again = json::parse(serialize_result(*r.result));
  EXPECT_EQ("yes", again["llm_output"]);
  EXPECT_FALSE(again["verified"].get<bool>());
  EXPECT_EQ("gpt", again["model"]);
}

TEST(ResultValidator, emptyBytes) { EXPECT_EQ(ErrorCode::EmptyResult, rejectionCode("")); }

TEST(ResultValidator, sizeBoundary) {
  // {"llm_output":"aaa...","verified":true}
  const std::string head = R"({"llm_output":")";
  const std::string tail = R"(","verified":true})";
  std::string exact = head + std::string(kMaxResultBytes - head.size() - tail.size(), 'a') + tail;
  ASSERT_EQ(kMaxResultBytes, exact.size());

  ResultValidator v;
  EXPECT_TRUE(v.validate(exact).outcome.is_accepted());

  std::string over = head + std::string(kMaxResultBytes + 1 - head.size() - tail.size(), 'a') + tail;
  EXPECT_EQ(ErrorCode::ResultTooLarge, rejectionCode(over));
}

TEST(ResultValidator, oversizedGarbageIsTooLargeNotMalformed) {
  EXPECT_EQ(ErrorCode::ResultTooLarge, rejectionCode(std::string(kMaxResultBytes + 1, '{')));
}

TEST(ResultValidator, malformedJson) {
  EXPECT_EQ(ErrorCode::MalformedResult, rejectionCode("{llm_output: yes}"));
  EXPECT_EQ(ErrorCode::MalformedResult, rejectionCode("{\"llm_output\":\"x\",\"verified\":true"));
}

TEST(ResultValidator, invalidUtf8IsRejectedNotReplaced) {
  EXPECT_EQ(ErrorCode::MalformedResult, rejectionCode("{\"llm_output\":\"ok \xff\",\"verified\":true}"));
}

TEST(ResultValidator, nonObjectJson) {
  EXPECT_EQ(ErrorCode::MalformedResult, rejectionCode("[\"llm_output\", true]"));
  EXPECT_EQ(ErrorCode::MalformedResult, rejectionCode("\"this is valid\""));
}

TEST(ResultValidator, missingVerified) {
  ResultValidator v;
  auto r = v.validate(R"({"llm_output":"this is valid"})");
  ASSERT_FALSE(r.outcome.is_accepted());
  EXPECT_EQ(ErrorCode::MissingField, r.outcome.error().code);
  EXPECT_EQ("verified", r.outcome.error().fragment.value_or(""));
}

TEST(ResultValidator, missingOutputReportedFirst) {
  ResultValidator v;
  auto r = v.validate("{}");
  ASSERT_FALSE(r.outcome.is_accepted());
  EXPECT_EQ(ErrorCode::MissingField, r.outcome.error().code);
  EXPECT_EQ("llm_output", r.outcome.error().fragment.value_or(""));
}

TEST(ResultValidator, outputMustBeText) {
  EXPECT_EQ(ErrorCode::InvalidOutput, rejectionCode(R"({"llm_output":42,"verified":true})"));
  EXPECT_EQ(ErrorCode::InvalidOutput, rejectionCode(R"({"llm_output":null,"verified":true})"));
}

TEST(ResultValidator, blankOutput) {
  EXPECT_EQ(ErrorCode::InvalidOutput, rejectionCode(R"({"llm_output":"","verified":true})"));
  EXPECT_EQ(ErrorCode::InvalidOutput, rejectionCode(R"({"llm_output":" \n\t ","verified":true})"));
}

TEST(ResultValidator, verifiedMustBeBoolean) {
  EXPECT_EQ(ErrorCode::InvalidVerified, rejectionCode(R"({"llm_output":"ok","verified":"true"})"));
  EXPECT_EQ(ErrorCode::InvalidVerified, rejectionCode(R"({"llm_output":"ok","verified":1})"));
  EXPECT_EQ(ErrorCode::InvalidVerified, rejectionCode(R"({"llm_output":"ok","verified":null})"));
}

TEST(ResultValidator, outputIsCheckedBeforeVerified) {
  EXPECT_EQ(ErrorCode::InvalidOutput, rejectionCode(R"({"llm_output":"  ","verified":"yes"})"));
}

int main(int argc, char **argv) {
  set_log_level(LogLevel::Off);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
