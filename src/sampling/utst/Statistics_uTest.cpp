/**
 * @file Statistics_uTest.cpp
 * @brief Unit tests for wattmeter::sampling statistics.
 */

#include "src/sampling/inc/Statistics.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

using wattmeter::sampling::Clock;
using wattmeter::sampling::computeDistribution;
using wattmeter::sampling::computeStatistics;
using wattmeter::sampling::PowerDistribution;
using wattmeter::sampling::PowerStatistics;
using wattmeter::sampling::Reading;
using wattmeter::sampling::ReadingList;

namespace {

/// Build readings from (seconds, watts) pairs.
ReadingList makeReadings(const std::vector<std::pair<double, double>>& points) {
  const Clock::time_point BASE = Clock::now();
  ReadingList out;
  for (const auto& [sec, w] : points) {
    const auto OFFSET = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(sec));
    out.push_back(*Reading::create(BASE + OFFSET, w));
  }
  return out;
}

} // namespace

/* ----------------------------- PowerStatistics ----------------------------- */

/** @test Empty input yields zeros and hasData() == false. */
TEST(StatisticsTest, EmptyHasNoData) {
  const PowerStatistics S = computeStatistics({});
  EXPECT_FALSE(S.hasData());
  EXPECT_EQ(S.sampleCount, 0U);
  EXPECT_DOUBLE_EQ(S.averageWatts, 0.0);
  EXPECT_DOUBLE_EQ(S.totalEnergyJoules, 0.0);
  EXPECT_NE(S.toString().find("No power data"), std::string::npos);
}

/** @test [(0,5W),(1,7W),(2,6W)] integrates to 12 J. */
TEST(StatisticsTest, ThreeReadingEnergy) {
  const PowerStatistics S = computeStatistics(makeReadings({{0.0, 5.0}, {1.0, 7.0}, {2.0, 6.0}}));
  ASSERT_TRUE(S.hasData());
  EXPECT_EQ(S.sampleCount, 3U);
  EXPECT_NEAR(S.totalEnergyJoules, 12.0, 1e-6);
  EXPECT_NEAR(S.averageWatts, 6.0, 1e-9);
  EXPECT_DOUBLE_EQ(S.peakWatts, 7.0);
  EXPECT_DOUBLE_EQ(S.minWatts, 5.0);
  EXPECT_NEAR(S.durationSeconds, 2.0, 1e-6);
}

/** @test A single reading has no trailing interval, so zero energy. */
TEST(StatisticsTest, SingleReadingZeroEnergy) {
  const PowerStatistics S = computeStatistics(makeReadings({{0.0, 42.0}}));
  EXPECT_EQ(S.sampleCount, 1U);
  EXPECT_DOUBLE_EQ(S.averageWatts, 42.0);
  EXPECT_DOUBLE_EQ(S.peakWatts, 42.0);
  EXPECT_DOUBLE_EQ(S.minWatts, 42.0);
  EXPECT_DOUBLE_EQ(S.totalEnergyJoules, 0.0);
}

/** @test Average/peak/min do not depend on sequence order. */
TEST(StatisticsTest, AggregatesOrderIndependent) {
  ReadingList readings = makeReadings({{0.0, 5.0}, {1.0, 7.0}, {2.0, 6.0}, {3.0, 9.0}});
  const PowerStatistics FORWARD = computeStatistics(readings);

  std::reverse(readings.begin(), readings.end());
  const PowerStatistics REVERSED = computeStatistics(readings);

  EXPECT_DOUBLE_EQ(FORWARD.averageWatts, REVERSED.averageWatts);
  EXPECT_DOUBLE_EQ(FORWARD.peakWatts, REVERSED.peakWatts);
  EXPECT_DOUBLE_EQ(FORWARD.minWatts, REVERSED.minWatts);
}

/** @test Energy assumes timestamp order; out-of-order input is not auto-sorted. */
TEST(StatisticsTest, EnergyRequiresTimestampOrder) {
  ReadingList readings = makeReadings({{0.0, 5.0}, {1.0, 7.0}, {2.0, 6.0}});
  std::reverse(readings.begin(), readings.end());

  const PowerStatistics S = computeStatistics(readings);
  // Negative gaps: 6*(-1) + 7*(-1)
  EXPECT_NEAR(S.totalEnergyJoules, -13.0, 1e-6);
  EXPECT_NE(S.totalEnergyJoules, 12.0);
}

/** @test Summary text lists the aggregates. */
TEST(StatisticsTest, ToStringHasFields) {
  const std::string OUT =
      computeStatistics(makeReadings({{0.0, 5.0}, {1.0, 7.0}, {2.0, 6.0}})).toString();
  EXPECT_NE(OUT.find("Samples:  3"), std::string::npos) << OUT;
  EXPECT_NE(OUT.find("7.00 W"), std::string::npos) << OUT;
  EXPECT_NE(OUT.find("12.00 J"), std::string::npos) << OUT;
}

/* ----------------------------- PowerDistribution ----------------------------- */

/** @test Empty input yields zeros. */
TEST(DistributionTest, Empty) {
  const PowerDistribution D = computeDistribution({});
  EXPECT_EQ(D.sampleCount, 0U);
  EXPECT_DOUBLE_EQ(D.medianWatts, 0.0);
}

/** @test Median, spread, and interpolated percentiles. */
TEST(DistributionTest, KnownValues) {
  // Values 2, 4, 4, 4, 5, 5, 7, 9: mean 5, population stddev 2
  const PowerDistribution D = computeDistribution(makeReadings(
      {{0, 9.0}, {1, 4.0}, {2, 2.0}, {3, 5.0}, {4, 4.0}, {5, 7.0}, {6, 4.0}, {7, 5.0}}));
  EXPECT_EQ(D.sampleCount, 8U);
  EXPECT_NEAR(D.medianWatts, 4.5, 1e-9);
  EXPECT_NEAR(D.stdDevWatts, 2.0, 1e-9);
  EXPECT_NEAR(D.p25Watts, 4.0, 1e-9);  // index 1.75 between 4 and 4
  EXPECT_NEAR(D.p75Watts, 5.5, 1e-9);  // index 5.25 between 5 and 7
  EXPECT_LE(D.p90Watts, D.p95Watts);
  EXPECT_LE(D.p95Watts, D.p99Watts);
  EXPECT_LE(D.p99Watts, 9.0);
}

/** @test Single value collapses every percentile onto it. */
TEST(DistributionTest, SingleValue) {
  const PowerDistribution D = computeDistribution(makeReadings({{0, 3.0}}));
  EXPECT_DOUBLE_EQ(D.medianWatts, 3.0);
  EXPECT_DOUBLE_EQ(D.p99Watts, 3.0);
  EXPECT_DOUBLE_EQ(D.stdDevWatts, 0.0);
}
