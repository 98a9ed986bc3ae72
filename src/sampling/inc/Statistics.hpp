#ifndef WATTMETER_SAMPLING_STATISTICS_HPP
#define WATTMETER_SAMPLING_STATISTICS_HPP
/**
 * @file Statistics.hpp
 * @brief Summary statistics over a reading sequence.
 * @note Thread-safe: All functions are stateless; callers pass snapshots.
 */

#include "src/sampling/inc/Reading.hpp"

#include <cstddef> // std::size_t
#include <string>  // std::string

namespace wattmeter {

namespace sampling {

/* ----------------------------- PowerStatistics ----------------------------- */

/**
 * @brief Average/peak/min power and integrated energy.
 *
 * An empty sequence yields all zeros with hasData() == false, so "no data"
 * is distinguishable from "zero power".
 */
struct PowerStatistics {
  std::size_t sampleCount{0};    ///< Number of readings
  double averageWatts{0.0};      ///< Arithmetic mean of power
  double peakWatts{0.0};         ///< Maximum power
  double minWatts{0.0};          ///< Minimum power
  double totalEnergyJoules{0.0}; ///< Left Riemann sum of power * gap to next reading
  double durationSeconds{0.0};   ///< Last timestamp minus first

  [[nodiscard]] bool hasData() const noexcept { return sampleCount > 0; }

  /// @brief Human-readable multi-line summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- PowerDistribution ----------------------------- */

/**
 * @brief Spread of power values (order-independent).
 */
struct PowerDistribution {
  std::size_t sampleCount{0}; ///< Number of readings
  double medianWatts{0.0};    ///< p50
  double stdDevWatts{0.0};    ///< Population standard deviation
  double p25Watts{0.0};       ///< 25th percentile
  double p75Watts{0.0};       ///< 75th percentile
  double p90Watts{0.0};       ///< 90th percentile
  double p95Watts{0.0};       ///< 95th percentile
  double p99Watts{0.0};       ///< 99th percentile

  /// @brief Human-readable multi-line summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Compute average, peak, min, energy, and duration.
 * @param readings Sequence in timestamp order.
 * @return Statistics; zeros if empty.
 *
 * Energy: sum over i of power[i] * (t[i+1] - t[i]); the last reading has no
 * trailing interval. Input is not sorted here: timestamp order is the
 * caller's precondition for a meaningful energy value.
 */
[[nodiscard]] PowerStatistics computeStatistics(const ReadingList& readings) noexcept;

/**
 * @brief Compute median, standard deviation, and percentiles.
 * @param readings Any order.
 * @return Distribution; zeros if empty.
 * @note Allocates a sorted copy of the power values.
 */
[[nodiscard]] PowerDistribution computeDistribution(const ReadingList& readings);

} // namespace sampling

} // namespace wattmeter

#endif // WATTMETER_SAMPLING_STATISTICS_HPP
