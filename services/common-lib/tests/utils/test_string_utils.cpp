/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string utility functions
 */

#include <gtest/gtest.h>
#include <ptet/utils/string_utils.h>
#include <set>

using namespace ptet::utils;

class StringUtilsTest : public ::testing::Test {
protected:
    // Test setup if needed
};

// toLower tests
TEST_F(StringUtilsTest, ToLower_Mixed) {
    EXPECT_EQ(toLower("HeLLo WoRLd"), "hello world");
}

TEST_F(StringUtilsTest, ToLower_Empty) {
    EXPECT_EQ(toLower(""), "");
}

// trim tests
TEST_F(StringUtilsTest, Trim_BothEnds) {
    EXPECT_EQ(trim("   hello   "), "hello");
}

TEST_F(StringUtilsTest, Trim_TrailingNewline) {
    EXPECT_EQ(trim("abc123\n"), "abc123");
}

TEST_F(StringUtilsTest, Trim_OnlySpaces) {
    EXPECT_EQ(trim(" \t\n "), "");
}

TEST_F(StringUtilsTest, Trim_KeepsInnerSpaces) {
    EXPECT_EQ(trim("  a b  "), "a b");
}

// startsWith tests
TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(startsWith("key_abc", "key_"));
    EXPECT_FALSE(startsWith("ke", "key_"));
    EXPECT_TRUE(startsWith("anything", ""));
}

// parseUnsigned tests
TEST_F(StringUtilsTest, ParseUnsigned_Valid) {
    EXPECT_EQ(parseUnsigned("0"), 0u);
    EXPECT_EQ(parseUnsigned("42"), 42u);
    EXPECT_EQ(parseUnsigned("4294967295"), 4294967295u);
}

TEST_F(StringUtilsTest, ParseUnsigned_Invalid) {
    EXPECT_FALSE(parseUnsigned("").has_value());
    EXPECT_FALSE(parseUnsigned("-1").has_value());
    EXPECT_FALSE(parseUnsigned("+1").has_value());
    EXPECT_FALSE(parseUnsigned("12a").has_value());
    EXPECT_FALSE(parseUnsigned("4294967296").has_value());
    EXPECT_FALSE(parseUnsigned("99999999999").has_value());
}

// parseInt64 tests
TEST_F(StringUtilsTest, ParseInt64_Valid) {
    EXPECT_EQ(parseInt64("31536000"), 31536000);
    EXPECT_EQ(parseInt64("-5"), -5);
}

TEST_F(StringUtilsTest, ParseInt64_Invalid) {
    EXPECT_FALSE(parseInt64("").has_value());
    EXPECT_FALSE(parseInt64("10s").has_value());
    EXPECT_FALSE(parseInt64("abc").has_value());
    EXPECT_FALSE(parseInt64("99999999999999999999").has_value());
}

// randomAlphanumeric tests
TEST_F(StringUtilsTest, RandomAlphanumeric_LengthAndAlphabet) {
    std::string value = randomAlphanumeric(100);
    ASSERT_EQ(value.size(), 100u);
    for (char c : value) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c))) << "Unexpected char: " << c;
    }
}

TEST_F(StringUtilsTest, RandomAlphanumeric_Distinct) {
    std::set<std::string> values;
    for (int i = 0; i < 20; ++i) {
        values.insert(randomAlphanumeric(16));
    }
    EXPECT_EQ(values.size(), 20u);
}

TEST_F(StringUtilsTest, RandomAlphanumeric_Zero) {
    EXPECT_EQ(randomAlphanumeric(0), "");
}
