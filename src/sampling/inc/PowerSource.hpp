#ifndef WATTMETER_SAMPLING_POWER_SOURCE_HPP
#define WATTMETER_SAMPLING_POWER_SOURCE_HPP
/**
 * @file PowerSource.hpp
 * @brief Capability interface for one power sample from one hardware backend.
 *
 * Every hardware family (powercap energy counters, hwmon, NVML, ...) is a
 * PowerSource variant selected at construction. The sampling core only calls
 * read() and never inspects the implementation.
 */

#include "src/sampling/inc/Reading.hpp"

#include <cstdint>     // std::uint8_t
#include <string>      // std::string
#include <string_view> // std::string_view

namespace wattmeter {

namespace sampling {

/* ----------------------------- SourceError ----------------------------- */

/**
 * @brief Classification of a failed read. Categories are disjoint.
 */
enum class SourceError : std::uint8_t {
  NONE = 0,    ///< Read succeeded
  UNAVAILABLE, ///< No data yet (e.g. first counter sample)
  TRANSIENT,   ///< Retryable (busy sysfs node, dropped request)
  PERMANENT,   ///< Will never succeed (unsupported device, no permission)
};

/**
 * @brief Human-readable error name.
 * @note Returns static string.
 */
[[nodiscard]] const char* toString(SourceError error) noexcept;

/* ----------------------------- SampleResult ----------------------------- */

/**
 * @brief Outcome of PowerSource::read().
 */
struct SampleResult {
  SourceError error{SourceError::NONE}; ///< NONE on success
  double powerWatts{0.0};               ///< Valid only on success
  Metadata metadata{};                  ///< Source-specific values
  std::string detail{};                 ///< Failure description

  [[nodiscard]] bool ok() const noexcept { return error == SourceError::NONE; }

  /// @brief Successful sample.
  [[nodiscard]] static SampleResult success(double watts, Metadata metadata = {});

  /// @brief Failed sample; NONE is coerced to TRANSIENT.
  [[nodiscard]] static SampleResult failure(SourceError error, std::string detail);
};

/* ----------------------------- PowerSource ----------------------------- */

/**
 * @brief Produce one power sample or a classified failure.
 *
 * read() is only ever called from one sampling loop at a time and may block
 * (file I/O, library calls, network round trips).
 */
class PowerSource {
public:
  virtual ~PowerSource() = default;

  /// @brief Take one sample.
  [[nodiscard]] virtual SampleResult read() = 0;

  /// @brief Short backend name for logs, e.g. "rapl", "nvml".
  [[nodiscard]] virtual std::string_view kind() const noexcept = 0;

  /// @brief Drop state carried between reads. Monitor calls this before each start.
  virtual void reset() noexcept {}

  PowerSource(const PowerSource&) = delete;
  PowerSource& operator=(const PowerSource&) = delete;

protected:
  PowerSource() = default;
};

} // namespace sampling

} // namespace wattmeter

#endif // WATTMETER_SAMPLING_POWER_SOURCE_HPP
