#ifndef WATTMETER_SAMPLING_COLLECTOR_HPP
#define WATTMETER_SAMPLING_COLLECTOR_HPP
/**
 * @file Collector.hpp
 * @brief Start, stop, and merge several Monitors as one unit.
 *
 * Behavior:
 *  - start() starts monitors in insertion order; if one fails, those already
 *    started are stopped again and the first failure is reported
 *  - stop() stops every monitor and collects every buffer, recording each
 *    monitor's last error against its name; one failure never hides the others
 *  - A faulted monitor never stops its siblings or the collector
 *
 * @note Not thread-safe: Drive a Collector from one thread. Monitors inside
 *       it run their own sampling threads.
 */

#include "src/sampling/inc/Monitor.hpp"
#include "src/sampling/inc/Reading.hpp"
#include "src/sampling/inc/Statistics.hpp"

#include <chrono>   // std::chrono::nanoseconds
#include <cstdint>  // std::uint8_t
#include <map>      // std::map
#include <memory>   // std::unique_ptr
#include <optional> // std::optional
#include <string>   // std::string
#include <vector>   // std::vector

namespace wattmeter {

namespace sampling {

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Collector lifecycle state.
 */
enum class CollectorState : std::uint8_t {
  IDLE = 0, ///< Never started
  RUNNING,  ///< At least one monitor started, not yet stopped collector-wide
  STOPPED,  ///< stop() was called
};

/// @brief Human-readable state name.
[[nodiscard]] const char* toString(CollectorState state) noexcept;

/**
 * @brief Status codes for Collector operations.
 */
enum class CollectorStatus : std::uint8_t {
  OK = 0,
  NO_MONITORS,     ///< start() with nothing to start
  NULL_MONITOR,    ///< addMonitor(nullptr)
  DUPLICATE_NAME,  ///< addMonitor() with a name already present
  ALREADY_RUNNING, ///< addMonitor() while running
  START_FAILED,    ///< A monitor failed to start; the start was rolled back
};

/// @brief Human-readable status name.
[[nodiscard]] const char* toString(CollectorStatus status) noexcept;

/* ----------------------------- Types ----------------------------- */

/**
 * @brief First monitor that failed during start().
 */
struct StartFailure {
  std::string monitorName{};                 ///< Failing monitor
  MonitorStatus status{MonitorStatus::OK};   ///< Why it failed
};

/**
 * @brief Merged output of all monitors.
 */
struct CollectionResult {
  CollectorStatus status{CollectorStatus::OK}; ///< START_FAILED if collectFor() could not start
  std::vector<std::string> names{};            ///< Monitor names, insertion order
  std::map<std::string, ReadingList> readings{}; ///< Per-monitor readings
  std::map<std::string, MonitorFault> faults{};  ///< Per-monitor last error, if any

  /// @brief True if any monitor recorded an error.
  [[nodiscard]] bool hasFaults() const noexcept { return !faults.empty(); }

  /// @brief Readings of one monitor; nullptr if unknown.
  [[nodiscard]] const ReadingList* find(const std::string& name) const noexcept;

  /// @brief Statistics per monitor.
  [[nodiscard]] std::map<std::string, PowerStatistics> statistics() const;

  /// @brief Multi-line per-source summary including faults.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Collector ----------------------------- */

/**
 * @brief Owns a named, ordered set of Monitors.
 */
class Collector {
public:
  Collector() = default;

  /// Stops all monitors if running.
  ~Collector();

  Collector(const Collector&) = delete;
  Collector& operator=(const Collector&) = delete;

  /**
   * @brief Take ownership of a monitor.
   * @return OK, NULL_MONITOR, DUPLICATE_NAME, or ALREADY_RUNNING.
   */
  [[nodiscard]] CollectorStatus addMonitor(std::unique_ptr<Monitor> monitor);

  /**
   * @brief Start every monitor in insertion order.
   * @return OK (also when already running), NO_MONITORS, or START_FAILED.
   *         On START_FAILED no monitor is left running; see startFailure().
   */
  [[nodiscard]] CollectorStatus start();

  /**
   * @brief Stop every monitor and merge their buffers.
   * @return Readings and faults keyed by monitor name.
   */
  CollectionResult stop();

  /**
   * @brief start(), wait for @p duration, stop().
   * @param duration Collection window.
   * @return Merged dataset; status START_FAILED (no wait) if start failed.
   * @note Blocks the calling thread for @p duration.
   */
  CollectionResult collectFor(std::chrono::nanoseconds duration);

  /// @brief Non-owning access; nullptr if unknown.
  [[nodiscard]] Monitor* monitor(const std::string& name) noexcept;
  [[nodiscard]] const Monitor* monitor(const std::string& name) const noexcept;

  /// @brief Monitor names in insertion order.
  [[nodiscard]] std::vector<std::string> names() const;

  [[nodiscard]] std::size_t size() const noexcept { return monitors_.size(); }
  [[nodiscard]] CollectorState state() const noexcept { return state_; }
  [[nodiscard]] bool isRunning() const noexcept { return state_ == CollectorState::RUNNING; }

  /// @brief Failure from the most recent start(); cleared by a successful start().
  [[nodiscard]] const std::optional<StartFailure>& startFailure() const noexcept {
    return startFailure_;
  }

private:
  std::vector<std::unique_ptr<Monitor>> monitors_{};
  CollectorState state_{CollectorState::IDLE};
  std::optional<StartFailure> startFailure_{};
};

} // namespace sampling

} // namespace wattmeter

#endif // WATTMETER_SAMPLING_COLLECTOR_HPP
