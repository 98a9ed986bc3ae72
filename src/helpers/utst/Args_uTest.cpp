/**
 * @file Args_uTest.cpp
 * @brief Unit tests for wattmeter::helpers::args.
 */

#include "src/helpers/inc/Args.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using wattmeter::helpers::args::ArgMap;
using wattmeter::helpers::args::hasFlag;
using wattmeter::helpers::args::parseArgs;
using wattmeter::helpers::args::ParsedArgs;
using wattmeter::helpers::args::valueAsDouble;
using wattmeter::helpers::args::valueAsUint;

namespace {

enum ArgKey : std::uint8_t { ARG_HELP = 0, ARG_DURATION, ARG_NVML };

ArgMap testMap() {
  ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show help"};
  map[ARG_DURATION] = {"--duration", 1, false, "Seconds"};
  map[ARG_NVML] = {"--nvml", 1, false, "GPU index"};
  return map;
}

} // namespace

/** @test Flags with and without values. */
TEST(ArgsTest, ParsesFlags) {
  const std::vector<std::string_view> ARGV{"--duration", "2.5", "--help", "--nvml", "1"};
  ParsedArgs pargs;
  std::string error;
  ASSERT_TRUE(parseArgs(ARGV, testMap(), pargs, error)) << error;

  EXPECT_TRUE(hasFlag(pargs, ARG_HELP));
  EXPECT_DOUBLE_EQ(*valueAsDouble(pargs, ARG_DURATION, error), 2.5);
  EXPECT_EQ(*valueAsUint(pargs, ARG_NVML, error), 1U);
  EXPECT_TRUE(error.empty());
}

/** @test Unknown tokens are rejected. */
TEST(ArgsTest, RejectsUnknown) {
  const std::vector<std::string_view> ARGV{"--durration", "2"};
  ParsedArgs pargs;
  std::string error;
  EXPECT_FALSE(parseArgs(ARGV, testMap(), pargs, error));
  EXPECT_NE(error.find("--durration"), std::string::npos);
}

/** @test A flag missing its value is rejected. */
TEST(ArgsTest, RejectsMissingValue) {
  const std::vector<std::string_view> ARGV{"--duration"};
  ParsedArgs pargs;
  std::string error;
  EXPECT_FALSE(parseArgs(ARGV, testMap(), pargs, error));
  EXPECT_FALSE(error.empty());
}

/** @test Malformed values set the error; absent values return nullopt quietly. */
TEST(ArgsTest, TypedAccessors) {
  const std::vector<std::string_view> ARGV{"--duration", "soon", "--nvml", "-1"};
  ParsedArgs pargs;
  std::string error;
  ASSERT_TRUE(parseArgs(ARGV, testMap(), pargs, error));

  EXPECT_FALSE(valueAsDouble(pargs, ARG_DURATION, error).has_value());
  EXPECT_NE(error.find("soon"), std::string::npos);

  error.clear();
  EXPECT_FALSE(valueAsUint(pargs, ARG_NVML, error).has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(valueAsUint(pargs, ARG_HELP, error).has_value());
  EXPECT_TRUE(error.empty());
}

/** @test Ranged accessors reject values outside the bounds, including huge ones. */
TEST(ArgsTest, RangedAccessors) {
  const std::vector<std::string_view> ARGV{"--duration", "1e300", "--nvml", "3"};
  ParsedArgs pargs;
  std::string error;
  ASSERT_TRUE(parseArgs(ARGV, testMap(), pargs, error));

  EXPECT_FALSE(valueAsDouble(pargs, ARG_DURATION, 0.001, 604800.0, error).has_value());
  EXPECT_NE(error.find("out of range"), std::string::npos);

  error.clear();
  EXPECT_FALSE(valueAsUint(pargs, ARG_NVML, 0, 2, error).has_value());
  EXPECT_NE(error.find("out of range"), std::string::npos);

  error.clear();
  const auto IN_RANGE = valueAsUint(pargs, ARG_NVML, 0, 7, error);
  ASSERT_TRUE(IN_RANGE.has_value());
  EXPECT_EQ(*IN_RANGE, 3U);
  EXPECT_TRUE(error.empty());

  // Absent flag stays quiet
  EXPECT_FALSE(valueAsDouble(pargs, ARG_HELP, 0.0, 1.0, error).has_value());
  EXPECT_TRUE(error.empty());
}
