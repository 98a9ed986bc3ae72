/**
 * @file Strings_uTest.cpp
 * @brief Unit tests for wattmeter::helpers::strings.
 */

#include "src/helpers/inc/Strings.hpp"

#include <gtest/gtest.h>

#include <cstring>

using wattmeter::helpers::strings::escapeJson;
using wattmeter::helpers::strings::parseDouble;
using wattmeter::helpers::strings::parseUint64;
using wattmeter::helpers::strings::startsWith;
using wattmeter::helpers::strings::stripTrailingWhitespace;
using wattmeter::helpers::strings::trim;

/** @test Trailing newline from a sysfs read is removed in place. */
TEST(StringsTest, StripTrailingWhitespace) {
  char buf[] = "123456\n \t";
  std::size_t len = std::strlen(buf);
  stripTrailingWhitespace(buf, len);
  EXPECT_EQ(len, 6U);
  EXPECT_STREQ(buf, "123456");
}

/** @test trim() removes both ends. */
TEST(StringsTest, Trim) {
  EXPECT_EQ(trim("  package-0\n"), "package-0");
  EXPECT_EQ(trim("\t\r\n "), "");
  EXPECT_EQ(trim("x"), "x");
}

/** @test Prefix matching. */
TEST(StringsTest, StartsWith) {
  EXPECT_TRUE(startsWith("intel-rapl:0:1", "intel-rapl"));
  EXPECT_FALSE(startsWith("rapl", "intel-rapl"));
  EXPECT_TRUE(startsWith("anything", ""));
}

/** @test Unsigned parse accepts counter-sized values and rejects junk. */
TEST(StringsTest, ParseUint64) {
  EXPECT_EQ(parseUint64("262143328850"), 262143328850ULL);
  EXPECT_EQ(parseUint64(" 42\n"), 42U);
  EXPECT_EQ(parseUint64("18446744073709551615"), UINT64_MAX);
  EXPECT_FALSE(parseUint64("18446744073709551616").has_value());
  EXPECT_FALSE(parseUint64("-1").has_value());
  EXPECT_FALSE(parseUint64("12abc").has_value());
  EXPECT_FALSE(parseUint64("").has_value());
}

/** @test Double parse rejects non-finite and trailing garbage. */
TEST(StringsTest, ParseDouble) {
  EXPECT_DOUBLE_EQ(*parseDouble("2.5"), 2.5);
  EXPECT_DOUBLE_EQ(*parseDouble(" -0.5 "), -0.5);
  EXPECT_FALSE(parseDouble("nan").has_value());
  EXPECT_FALSE(parseDouble("inf").has_value());
  EXPECT_FALSE(parseDouble("1.0s").has_value());
  EXPECT_FALSE(parseDouble("").has_value());
}

/** @test JSON escaping of quotes, backslashes, and control characters. */
TEST(StringsTest, EscapeJson) {
  EXPECT_EQ(escapeJson("plain"), "plain");
  EXPECT_EQ(escapeJson("say \"hi\""), "say \\\"hi\\\"");
  EXPECT_EQ(escapeJson("a\\b"), "a\\\\b");
  EXPECT_EQ(escapeJson("line\n"), "line\\n");
  EXPECT_EQ(escapeJson(std::string_view("\x01", 1)), "\\u0001");
}
