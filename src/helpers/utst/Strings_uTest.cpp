/**
 * @file Strings_uTest.cpp
 * @brief Unit tests for headroom::helpers::strings.
 */

#include "src/helpers/inc/Strings.hpp"

#include <gtest/gtest.h>

#include <string_view>

namespace str = headroom::helpers::strings;

/* ----------------------------- Trimming ----------------------------- */

/** @test trim removes surrounding whitespace. */
TEST(StringsTest, Trim) {
  EXPECT_EQ(str::trim("  max 100000\n"), "max 100000");
  EXPECT_EQ(str::trim("\t\n "), "");
  EXPECT_EQ(str::trimRightChar("/sys/fs/cgroup//", '/'), "/sys/fs/cgroup");
}

/** @test isAllDigits rejects empty and mixed input. */
TEST(StringsTest, IsAllDigits) {
  EXPECT_TRUE(str::isAllDigits("1234"));
  EXPECT_FALSE(str::isAllDigits(""));
  EXPECT_FALSE(str::isAllDigits("12a"));
}

/* ----------------------------- Splitting ----------------------------- */

/** @test splitLines drops the trailing newline but keeps interior empty lines. */
TEST(StringsTest, SplitLines) {
  const auto LINES = str::splitLines("a\n\nb\n");
  ASSERT_EQ(LINES.size(), 3U);
  EXPECT_EQ(LINES[0], "a");
  EXPECT_EQ(LINES[1], "");
  EXPECT_EQ(LINES[2], "b");
}

/** @test splitWhitespace collapses runs. */
TEST(StringsTest, SplitWhitespace) {
  const auto TOKENS = str::splitWhitespace("  cpu  1 2\t3 ");
  ASSERT_EQ(TOKENS.size(), 4U);
  EXPECT_EQ(TOKENS[0], "cpu");
  EXPECT_EQ(TOKENS[3], "3");
}

/** @test split honours maxParts. */
TEST(StringsTest, SplitMaxParts) {
  const auto PARTS = str::split("0::/user.slice:extra", ':', 3);
  ASSERT_EQ(PARTS.size(), 3U);
  EXPECT_EQ(PARTS[0], "0");
  EXPECT_EQ(PARTS[1], "");
  EXPECT_EQ(PARTS[2], "/user.slice:extra");
}

/* ----------------------------- Numbers ----------------------------- */

/** @test Integer parsing requires the whole field. */
TEST(StringsTest, ParseIntegers) {
  EXPECT_EQ(str::parseInt64(" -5 "), -5);
  EXPECT_EQ(str::parseUint64("9223372036854771712"), 9223372036854771712ULL);
  EXPECT_FALSE(str::parseUint64("-1").has_value());
  EXPECT_FALSE(str::parseInt64("12x").has_value());
  EXPECT_FALSE(str::parseInt64("").has_value());
}

/** @test parseDouble accepts decimals and rejects garbage. */
TEST(StringsTest, ParseDouble) {
  const auto V = str::parseDouble("12345.67");
  ASSERT_TRUE(V.has_value());
  EXPECT_DOUBLE_EQ(*V, 12345.67);
  EXPECT_FALSE(str::parseDouble("abc").has_value());
}

/** @test findKeyedValue matches only the first token of a line. */
TEST(StringsTest, FindKeyedValue) {
  constexpr std::string_view CONTENT = "nr_periods 10\nnr_throttled 3\nthrottled_usec 900\n";
  EXPECT_EQ(str::findKeyedValue(CONTENT, "nr_throttled"), 3U);
  EXPECT_FALSE(str::findKeyedValue(CONTENT, "throttled").has_value());
}
