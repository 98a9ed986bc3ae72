/**
 * @file Statistics.cpp
 * @brief Reading-sequence statistics.
 */

#include "src/sampling/inc/Statistics.hpp"
#include "src/helpers/inc/Format.hpp"

#include <algorithm> // std::sort
#include <cmath>     // std::sqrt
#include <vector>    // std::vector

#include <fmt/core.h>

namespace wattmeter {

namespace sampling {

using wattmeter::helpers::format::joules;
using wattmeter::helpers::format::watts;

namespace {

/// Linear interpolation between closest ranks of a sorted sequence.
double percentile(const std::vector<double>& sorted, double p) noexcept {
  const std::size_t N = sorted.size();
  const double INDEX = (static_cast<double>(N) - 1.0) * p;
  const std::size_t LOWER = static_cast<std::size_t>(INDEX);
  const std::size_t UPPER = LOWER + 1;
  const double FRAC = INDEX - static_cast<double>(LOWER);

  if (UPPER >= N) {
    return sorted[N - 1];
  }
  return sorted[LOWER] * (1.0 - FRAC) + sorted[UPPER] * FRAC;
}

} // namespace

/* ----------------------------- API ----------------------------- */

PowerStatistics computeStatistics(const ReadingList& readings) noexcept {
  PowerStatistics stats{};
  const std::size_t N = readings.size();
  if (N == 0) {
    return stats;
  }

  stats.sampleCount = N;
  stats.peakWatts = readings.front().powerWatts();
  stats.minWatts = readings.front().powerWatts();

  double sum = 0.0;
  for (std::size_t i = 0; i < N; ++i) {
    const double P = readings[i].powerWatts();
    sum += P;
    if (P > stats.peakWatts) {
      stats.peakWatts = P;
    }
    if (P < stats.minWatts) {
      stats.minWatts = P;
    }
    if (i + 1 < N) {
      const double GAP =
          std::chrono::duration<double>(readings[i + 1].timestamp() - readings[i].timestamp())
              .count();
      stats.totalEnergyJoules += P * GAP;
    }
  }

  stats.averageWatts = sum / static_cast<double>(N);
  stats.durationSeconds =
      std::chrono::duration<double>(readings.back().timestamp() - readings.front().timestamp())
          .count();
  return stats;
}

PowerDistribution computeDistribution(const ReadingList& readings) {
  PowerDistribution dist{};
  const std::size_t N = readings.size();
  if (N == 0) {
    return dist;
  }

  std::vector<double> values;
  values.reserve(N);
  double sum = 0.0;
  for (const Reading& r : readings) {
    values.push_back(r.powerWatts());
    sum += r.powerWatts();
  }
  std::sort(values.begin(), values.end());

  dist.sampleCount = N;
  dist.medianWatts = (N % 2 == 0) ? (values[N / 2 - 1] + values[N / 2]) / 2.0 : values[N / 2];
  dist.p25Watts = percentile(values, 0.25);
  dist.p75Watts = percentile(values, 0.75);
  dist.p90Watts = percentile(values, 0.90);
  dist.p95Watts = percentile(values, 0.95);
  dist.p99Watts = percentile(values, 0.99);

  const double MEAN = sum / static_cast<double>(N);
  double sumSq = 0.0;
  for (double v : values) {
    const double DIFF = v - MEAN;
    sumSq += DIFF * DIFF;
  }
  dist.stdDevWatts = std::sqrt(sumSq / static_cast<double>(N));
  return dist;
}

/* ----------------------------- toString ----------------------------- */

std::string PowerStatistics::toString() const {
  if (!hasData()) {
    return "  No power data\n";
  }

  std::string out;
  out.reserve(256);
  out += fmt::format("  Samples:  {}  |  Duration: {:.2f} s\n", sampleCount, durationSeconds);
  out += fmt::format("  Average:  {:>12}\n", watts(averageWatts));
  out += fmt::format("  Peak:     {:>12}\n", watts(peakWatts));
  out += fmt::format("  Min:      {:>12}\n", watts(minWatts));
  out += fmt::format("  Energy:   {:>12}\n", joules(totalEnergyJoules));
  return out;
}

std::string PowerDistribution::toString() const {
  std::string out;
  out.reserve(256);
  out += fmt::format("  Median:   {:>12}  |  StdDev: {}\n", watts(medianWatts), watts(stdDevWatts));
  out += fmt::format("  p25/p75:  {} / {}\n", watts(p25Watts), watts(p75Watts));
  out += fmt::format("  p90/p95/p99: {} / {} / {}\n", watts(p90Watts), watts(p95Watts),
                     watts(p99Watts));
  return out;
}

} // namespace sampling

} // namespace wattmeter
