#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <string>
#include "util/ParseUtils.hpp"

using namespace blamer;

// Test: Plain decimal values parse
TEST(ParseUtilsTest, ParseUnsignedDecimal) {
    EXPECT_EQ(ParseUtils::parseUnsignedOr("0", 9), 0u);
    EXPECT_EQ(ParseUtils::parseUnsignedOr("42", 0), 42u);
    EXPECT_EQ(ParseUtils::parseUnsignedOr("1744981061", 0), 1744981061u);
    EXPECT_EQ(ParseUtils::parseUnsignedOr("+17", 0), 17u);
}

// Test: Anything malformed yields the fallback instead of failing
TEST(ParseUtilsTest, ParseUnsignedFallsBack) {
    EXPECT_EQ(ParseUtils::parseUnsignedOr("", 5), 5u);
    EXPECT_EQ(ParseUtils::parseUnsignedOr("+", 5), 5u);
    EXPECT_EQ(ParseUtils::parseUnsignedOr("abc", 0), 0u);
    EXPECT_EQ(ParseUtils::parseUnsignedOr("12a", 0), 0u);
    EXPECT_EQ(ParseUtils::parseUnsignedOr("-3", 7), 7u);
    EXPECT_EQ(ParseUtils::parseUnsignedOr(" 12", 0), 0u);
    EXPECT_EQ(ParseUtils::parseUnsignedOr("1.5", 0), 0u);
}

// Test: 64-bit boundary
TEST(ParseUtilsTest, ParseUnsignedOverflow) {
    EXPECT_EQ(ParseUtils::parseUnsignedOr("18446744073709551615", 0),
              std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(ParseUtils::parseUnsignedOr("18446744073709551616", 3), 3u);
    EXPECT_EQ(ParseUtils::parseUnsignedOr("99999999999999999999999", 3), 3u);
}

// Test: Whitespace splitting collapses runs and trims
TEST(ParseUtilsTest, SplitWhitespace) {
    auto tokens = ParseUtils::splitWhitespace("  abc123 1\t2   3 ");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0], "abc123");
    EXPECT_EQ(tokens[1], "1");
    EXPECT_EQ(tokens[2], "2");
    EXPECT_EQ(tokens[3], "3");

    EXPECT_TRUE(ParseUtils::splitWhitespace("").empty());
    EXPECT_TRUE(ParseUtils::splitWhitespace(" \t ").empty());
}

// Test: splitOnce only splits at the first separator
TEST(ParseUtilsTest, SplitOnce) {
    auto parts = ParseUtils::splitOnce("summary Fix the bug in parser", ' ');
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->first, "summary");
    EXPECT_EQ(parts->second, "Fix the bug in parser");

    auto trailing = ParseUtils::splitOnce("previous ", ' ');
    ASSERT_TRUE(trailing.has_value());
    EXPECT_EQ(trailing->first, "previous");
    EXPECT_EQ(trailing->second, "");

    EXPECT_FALSE(ParseUtils::splitOnce("boundary", ' ').has_value());
}

TEST(ParseUtilsTest, StartsWith) {
    EXPECT_TRUE(ParseUtils::startsWith("author-mail <a@b>", "author"));
    EXPECT_TRUE(ParseUtils::startsWith("x", ""));
    EXPECT_FALSE(ParseUtils::startsWith("auth", "author"));
}
