/**
 * @file test_time_utils.cpp
 * @brief Unit tests for time utility functions
 */

#include <gtest/gtest.h>
#include <ptet/utils/time_utils.h>

using namespace ptet::utils;

class TimeUtilsTest : public ::testing::Test {
protected:
    // 2025-03-01T15:15:00Z
    const int64_t referenceSeconds = 1740842100;
};

// --- Formatting ---

TEST_F(TimeUtilsTest, FormatRfc3339_Utc) {
    EXPECT_EQ(formatRfc3339(fromUnixSeconds(referenceSeconds)), "2025-03-01T15:15:00Z");
}

TEST_F(TimeUtilsTest, FormatRfc3339_Epoch) {
    EXPECT_EQ(formatRfc3339(fromUnixSeconds(0)), "1970-01-01T00:00:00Z");
}

TEST_F(TimeUtilsTest, FormatRfc3339_Fraction) {
    auto base = fromUnixSeconds(referenceSeconds);
    EXPECT_EQ(formatRfc3339(base + std::chrono::milliseconds(500)), "2025-03-01T15:15:00.500Z");
    EXPECT_EQ(formatRfc3339(base + std::chrono::microseconds(123456)), "2025-03-01T15:15:00.123456Z");
    EXPECT_EQ(formatRfc3339(fromUnixSeconds(-1) + std::chrono::milliseconds(250)),
              "1969-12-31T23:59:59.250Z");
}

// --- Parsing ---

TEST_F(TimeUtilsTest, ParseRfc3339_Zulu) {
    auto tp = parseRfc3339("2025-03-01T15:15:00Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(toUnixSeconds(*tp), referenceSeconds);
}

TEST_F(TimeUtilsTest, ParseRfc3339_PositiveOffsetNormalisedToUtc) {
    auto tp = parseRfc3339("2025-03-01T16:15:00+01:00");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(formatRfc3339(*tp), "2025-03-01T15:15:00Z");
}

TEST_F(TimeUtilsTest, ParseRfc3339_NegativeOffsetAcrossMidnight) {
    auto tp = parseRfc3339("2025-02-28T23:30:00-05:00");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(formatRfc3339(*tp), "2025-03-01T04:30:00Z");
}

TEST_F(TimeUtilsTest, ParseRfc3339_FractionAndLowercase) {
    auto tp = parseRfc3339("2025-03-01t15:15:00.123456z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(toUnixSeconds(*tp), referenceSeconds);
    EXPECT_EQ(formatRfc3339(*tp), "2025-03-01T15:15:00.123456Z");
}

TEST_F(TimeUtilsTest, ParseRfc3339_FractionKept) {
    auto tp = parseRfc3339("2025-03-01T16:15:00.5+01:00");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(*tp - fromUnixSeconds(referenceSeconds), std::chrono::milliseconds(500));
    EXPECT_EQ(formatRfc3339(*tp), "2025-03-01T15:15:00.500Z");
}

TEST_F(TimeUtilsTest, ParseRfc3339_SpaceSeparator) {
    EXPECT_TRUE(parseRfc3339("2025-03-01 15:15:00Z").has_value());
}

TEST_F(TimeUtilsTest, ParseRfc3339_LeapDay) {
    EXPECT_TRUE(parseRfc3339("2024-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(parseRfc3339("2025-02-29T00:00:00Z").has_value());
}

TEST_F(TimeUtilsTest, ParseRfc3339_Invalid) {
    EXPECT_FALSE(parseRfc3339("").has_value());
    EXPECT_FALSE(parseRfc3339("2025-03-01").has_value());
    EXPECT_FALSE(parseRfc3339("2025-03-01T15:15:00").has_value());   // no zone
    EXPECT_FALSE(parseRfc3339("2025-13-01T15:15:00Z").has_value());
    EXPECT_FALSE(parseRfc3339("2025-03-01T24:00:00Z").has_value());
    EXPECT_FALSE(parseRfc3339("2025-03-01T15:15:00.Z").has_value());
    EXPECT_FALSE(parseRfc3339("2025-03-01T15:15:00+0100").has_value());
    EXPECT_FALSE(parseRfc3339("2025-03-01T15:15:00Zjunk").has_value());
    EXPECT_FALSE(parseRfc3339("not a date at all!!!").has_value());
}

// --- Conversions ---

TEST_F(TimeUtilsTest, UnixSeconds_Consistency) {
    EXPECT_EQ(toUnixSeconds(fromUnixSeconds(referenceSeconds)), referenceSeconds);
}

TEST_F(TimeUtilsTest, Now_IsRecent) {
    // Later than 2025-01-01
    EXPECT_GT(toUnixSeconds(now()), 1735689600);
}
