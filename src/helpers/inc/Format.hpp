#ifndef WATTMETER_HELPERS_FORMAT_HPP
#define WATTMETER_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for power, energy, and durations.
 *
 * Provides consistent unit scaling across CLI tools and log output.
 * Uses fmt library for string formatting.
 *
 * @note Allocates: All functions return std::string. Cold paths only.
 */

#include <chrono>
#include <cmath>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace wattmeter {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format power with an SI prefix (mW, W, kW).
 * @param watts Power in watts.
 * @return Formatted string (e.g., "12.50 W").
 */
[[nodiscard]] inline std::string watts(double watts) {
  const double MAG = std::fabs(watts);
  if (MAG >= 1000.0) {
    return fmt::format("{:.2f} kW", watts / 1000.0);
  }
  if (MAG > 0.0 && MAG < 1.0) {
    return fmt::format("{:.1f} mW", watts * 1000.0);
  }
  return fmt::format("{:.2f} W", watts);
}

/**
 * @brief Format energy with an SI prefix (mJ, J, kJ, MJ).
 * @param joules Energy in joules.
 * @return Formatted string (e.g., "1.25 kJ").
 */
[[nodiscard]] inline std::string joules(double joules) {
  const double MAG = std::fabs(joules);
  if (MAG >= 1'000'000.0) {
    return fmt::format("{:.2f} MJ", joules / 1'000'000.0);
  }
  if (MAG >= 1000.0) {
    return fmt::format("{:.2f} kJ", joules / 1000.0);
  }
  if (MAG > 0.0 && MAG < 1.0) {
    return fmt::format("{:.1f} mJ", joules * 1000.0);
  }
  return fmt::format("{:.2f} J", joules);
}

/**
 * @brief Format a duration in the largest fitting unit (us, ms, s).
 * @param d Duration.
 * @return Formatted string (e.g., "250.0 ms").
 */
template <typename Rep, typename Period>
[[nodiscard]] inline std::string duration(std::chrono::duration<Rep, Period> d) {
  const double SECONDS = std::chrono::duration<double>(d).count();
  const double MAG = std::fabs(SECONDS);
  if (MAG >= 1.0) {
    return fmt::format("{:.2f} s", SECONDS);
  }
  if (MAG >= 0.001) {
    return fmt::format("{:.1f} ms", SECONDS * 1000.0);
  }
  return fmt::format("{:.1f} us", SECONDS * 1'000'000.0);
}

} // namespace format
} // namespace helpers
} // namespace wattmeter

#endif // WATTMETER_HELPERS_FORMAT_HPP
