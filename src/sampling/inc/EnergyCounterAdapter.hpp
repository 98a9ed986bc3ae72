#ifndef WATTMETER_SAMPLING_ENERGY_COUNTER_ADAPTER_HPP
#define WATTMETER_SAMPLING_ENERGY_COUNTER_ADAPTER_HPP
/**
 * @file EnergyCounterAdapter.hpp
 * @brief Derive instantaneous power from a wrapping hardware energy counter.
 *
 * Behavior:
 *  - First read stores a baseline and reports UNAVAILABLE (a rate needs two points)
 *  - Later reads difference consecutive counter values over elapsed monotonic time
 *  - A counter value below the previous one is treated as exactly one wrap
 *  - A second wrap within one interval is undetectable
 *
 * @note Not thread-safe: Owned by one Monitor and read from its sampling loop only.
 */

#include "src/sampling/inc/PowerSource.hpp"

#include <chrono>      // std::chrono::steady_clock
#include <cstdint>     // std::uint64_t
#include <memory>      // std::unique_ptr
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

namespace wattmeter {

namespace sampling {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Counter width and unit, supplied by the accessor.
 */
struct EnergyCounterConfig {
  std::uint64_t wrapMax{0};   ///< Counter range; values wrap to 0 past this
  double joulesPerUnit{1.0};  ///< Native unit to joules (1e-6 for microjoules)

  /// @brief wrapMax > 0 and joulesPerUnit finite and > 0.
  [[nodiscard]] bool isValid() const noexcept;
};

/**
 * @brief One raw counter read.
 */
struct CounterSample {
  std::uint64_t value{0};                          ///< Counter value in native units
  std::chrono::steady_clock::time_point readTime{}; ///< When the value was read
};

/**
 * @brief Outcome of EnergyCounter::readCounter().
 */
struct CounterReadResult {
  SourceError error{SourceError::NONE}; ///< NONE on success
  CounterSample sample{};               ///< Valid only on success
  Metadata metadata{};                  ///< Passed through to the derived sample
  std::string detail{};                 ///< Failure description

  [[nodiscard]] bool ok() const noexcept { return error == SourceError::NONE; }
};

/* ----------------------------- EnergyCounter ----------------------------- */

/**
 * @brief Raw accessor for a monotonically increasing, wrapping energy counter.
 */
class EnergyCounter {
public:
  virtual ~EnergyCounter() = default;

  /// @brief Read the counter and the time of the read.
  [[nodiscard]] virtual CounterReadResult readCounter() = 0;

  /// @brief Width and unit of this counter.
  [[nodiscard]] virtual EnergyCounterConfig counterConfig() const noexcept = 0;

  /// @brief Short backend name for logs.
  [[nodiscard]] virtual std::string_view kind() const noexcept = 0;

  EnergyCounter(const EnergyCounter&) = delete;
  EnergyCounter& operator=(const EnergyCounter&) = delete;

protected:
  EnergyCounter() = default;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Counter increase between two reads, correcting for one wrap.
 * @param previous Earlier counter value (<= wrapMax).
 * @param current Later counter value (<= wrapMax).
 * @param wrapMax Counter range.
 * @return current - previous, or (wrapMax - previous) + current if current < previous.
 * @note Pure; unsigned arithmetic only.
 */
[[nodiscard]] std::uint64_t counterDelta(std::uint64_t previous, std::uint64_t current,
                                         std::uint64_t wrapMax) noexcept;

/* ----------------------------- EnergyCounterAdapter ----------------------------- */

/**
 * @brief PowerSource that converts counter deltas into watts.
 *
 * Metadata added to each successful sample:
 *  - `energy_joules`   energy consumed over the interval
 *  - `interval_s`      elapsed seconds between the two counter reads
 *  - `counter_wrapped` true if the counter wrapped during the interval
 */
class EnergyCounterAdapter final : public PowerSource {
public:
  /**
   * @brief Wrap a counter accessor.
   * @param counter Raw accessor; its counterConfig() is captured here.
   */
  explicit EnergyCounterAdapter(std::unique_ptr<EnergyCounter> counter);

  [[nodiscard]] SampleResult read() override;
  [[nodiscard]] std::string_view kind() const noexcept override;

  /// @brief Forget the baseline; the next read reports UNAVAILABLE again.
  void reset() noexcept override;

  /// @brief True once a baseline sample is stored.
  [[nodiscard]] bool hasBaseline() const noexcept { return last_.has_value(); }

  [[nodiscard]] const EnergyCounterConfig& config() const noexcept { return config_; }

private:
  std::unique_ptr<EnergyCounter> counter_;
  EnergyCounterConfig config_{};
  std::optional<CounterSample> last_{};
};

} // namespace sampling

} // namespace wattmeter

#endif // WATTMETER_SAMPLING_ENERGY_COUNTER_ADAPTER_HPP
