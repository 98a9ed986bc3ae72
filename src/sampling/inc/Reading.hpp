#ifndef WATTMETER_SAMPLING_READING_HPP
#define WATTMETER_SAMPLING_READING_HPP
/**
 * @file Reading.hpp
 * @brief Timestamped power measurement with source metadata.
 * @note Thread-safe: Reading is immutable after creation.
 */

#include <chrono>   // std::chrono::system_clock
#include <cstdint>  // std::int64_t
#include <map>      // std::map
#include <optional> // std::optional
#include <string>   // std::string
#include <variant>  // std::variant
#include <vector>   // std::vector

namespace wattmeter {

namespace sampling {

/* ----------------------------- Types ----------------------------- */

/// Wall clock used for reading timestamps.
using Clock = std::chrono::system_clock;

/// Single metadata value (temperature, utilization, device name, ...).
using MetadataValue = std::variant<bool, std::int64_t, double, std::string>;

/// Source-specific metadata, ordered by key.
using Metadata = std::map<std::string, MetadataValue>;

/// @brief Render a metadata value.
[[nodiscard]] std::string toString(const MetadataValue& value);

/* ----------------------------- Reading ----------------------------- */

/**
 * @brief One power measurement.
 *
 * Created only through create(), which rejects NaN, infinite, and negative
 * wattages. Copies are handed out; the producing Monitor keeps the original.
 */
class Reading {
public:
  /**
   * @brief Validate and build a reading.
   * @param timestamp When the sample was taken.
   * @param powerWatts Power in watts (finite, >= 0).
   * @param metadata Source-specific values.
   * @return Reading, or std::nullopt if powerWatts is invalid.
   */
  [[nodiscard]] static std::optional<Reading> create(Clock::time_point timestamp, double powerWatts,
                                                     Metadata metadata = {});

  /// @brief True if @p watts may be stored in a Reading.
  [[nodiscard]] static bool isValidPower(double watts) noexcept;

  [[nodiscard]] Clock::time_point timestamp() const noexcept { return timestamp_; }
  [[nodiscard]] double powerWatts() const noexcept { return powerWatts_; }
  [[nodiscard]] const Metadata& metadata() const noexcept { return metadata_; }

  /// @brief Metadata lookup; nullptr if absent.
  [[nodiscard]] const MetadataValue* find(const std::string& key) const noexcept;

  /// @brief One-line summary, e.g. "Reading(2026-01-01T00:00:00.000Z, 12.50 W)".
  [[nodiscard]] std::string toString() const;

private:
  Reading(Clock::time_point timestamp, double powerWatts, Metadata metadata) noexcept;

  Clock::time_point timestamp_{};
  double powerWatts_{0.0};
  Metadata metadata_{};
};

/// Ordered sequence of readings from one source.
using ReadingList = std::vector<Reading>;

} // namespace sampling

} // namespace wattmeter

#endif // WATTMETER_SAMPLING_READING_HPP
