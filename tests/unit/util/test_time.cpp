#include <gtest/gtest.h>

#include <chrono>

#include "noted/util/time.hpp"
#include "test_helpers.hpp"

using namespace noted::util;
using noted::ErrorCode;
using std::chrono::system_clock;

class TimeTest : public ::testing::Test {};

TEST_F(TimeTest, FormatsEpochWithMilliseconds) {
  system_clock::time_point epoch{};
  EXPECT_EQ(Time::toRfc3339(epoch), "1970-01-01T00:00:00.000Z");
}

TEST_F(TimeTest, FormatsMilliseconds) {
  auto time = system_clock::from_time_t(1609459200) + std::chrono::milliseconds(42);
  EXPECT_EQ(Time::toRfc3339(time), "2021-01-01T00:00:00.042Z");
}

TEST_F(TimeTest, ParseWithoutFraction) {
  auto result = Time::fromRfc3339("2021-01-01T00:00:00Z");
  ASSERT_OK(result);
  EXPECT_EQ(system_clock::to_time_t(*result), 1609459200);
}

TEST_F(TimeTest, ParseTruncatesFractionToMilliseconds) {
  auto result = Time::fromRfc3339("2021-01-01T00:00:00.123456789Z");
  ASSERT_OK(result);
  EXPECT_EQ(Time::toRfc3339(*result), "2021-01-01T00:00:00.123Z");
}

TEST_F(TimeTest, FormatThenParseIsStable) {
  auto now = Time::now();
  auto text = Time::toRfc3339(now);
  auto parsed = Time::fromRfc3339(text);
  ASSERT_OK(parsed);
  EXPECT_EQ(Time::toRfc3339(*parsed), text);
}

TEST_F(TimeTest, ParseRejectsMalformed) {
  EXPECT_ERROR(Time::fromRfc3339(""), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2021-01-01 00:00:00Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2021-01-01T00:00:00+02:00"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2021-13-01T00:00:00Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2021-01-01T24:00:00Z"), ErrorCode::kParseError);
}

TEST_F(TimeTest, FormatDuration) {
  using namespace std::chrono_literals;
  EXPECT_EQ(Time::formatDuration(850us), "850us");
  EXPECT_EQ(Time::formatDuration(12345us), "12.345ms");
  EXPECT_EQ(Time::formatDuration(2010ms), "2.010s");
}
