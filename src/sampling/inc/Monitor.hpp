#ifndef WATTMETER_SAMPLING_MONITOR_HPP
#define WATTMETER_SAMPLING_MONITOR_HPP
/**
 * @file Monitor.hpp
 * @brief Background sampling loop over one PowerSource.
 *
 * Behavior:
 *  - start() launches one sampling thread; calling it while running is a no-op
 *  - Each tick reads the source, appends a Reading on success, then sleeps
 *    for max(0, interval - read latency); the sleep wakes early on stop()
 *  - TRANSIENT and UNAVAILABLE skip the tick; PERMANENT, or more than
 *    consecutiveFailureThreshold failures in a row, stop the loop from inside
 *  - stop() signals the loop, waits up to stopTimeout, and returns a copy of
 *    the buffer; a loop that does not acknowledge in time terminates the process
 *
 * @note Thread-safe: All public methods may be called from any thread. The
 *       buffer lock is held only for an append or a snapshot copy, never
 *       across PowerSource::read().
 */

#include "src/sampling/inc/PowerSource.hpp"
#include "src/sampling/inc/Reading.hpp"
#include "src/sampling/inc/Statistics.hpp"

#include <atomic>             // std::atomic
#include <chrono>             // std::chrono
#include <condition_variable> // std::condition_variable
#include <cstdint>            // std::uint32_t, std::uint64_t
#include <memory>             // std::unique_ptr
#include <mutex>              // std::mutex
#include <optional>           // std::optional
#include <string>             // std::string
#include <thread>             // std::thread

namespace wattmeter {

namespace sampling {

/* ----------------------------- Constants ----------------------------- */

/// Consecutive failed ticks tolerated before a Monitor stops itself.
inline constexpr std::uint32_t DEFAULT_FAILURE_THRESHOLD = 5;

/// Default sampling interval.
inline constexpr std::chrono::milliseconds DEFAULT_SAMPLING_INTERVAL{1000};

/// Default bound on how long stop() waits for the loop to exit.
inline constexpr std::chrono::milliseconds DEFAULT_STOP_TIMEOUT{10'000};

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Monitor lifecycle state.
 */
enum class MonitorState : std::uint8_t {
  IDLE = 0, ///< Created, never started
  RUNNING,  ///< Sampling loop active
  STOPPED,  ///< Stopped by stop() or by a fault
};

/// @brief Human-readable state name.
[[nodiscard]] const char* toString(MonitorState state) noexcept;

/**
 * @brief Status codes for Monitor::start().
 */
enum class MonitorStatus : std::uint8_t {
  OK = 0,
  INVALID_CONFIG,      ///< interval or stopTimeout not positive
  NO_SOURCE,           ///< Constructed without a PowerSource
  THREAD_START_FAILED, ///< std::thread could not be created
};

/// @brief Human-readable status name.
[[nodiscard]] const char* toString(MonitorStatus status) noexcept;

/* ----------------------------- MonitorConfig ----------------------------- */

/**
 * @brief Sampling policy.
 */
struct MonitorConfig {
  std::chrono::nanoseconds interval{DEFAULT_SAMPLING_INTERVAL};          ///< Target tick period
  std::uint32_t consecutiveFailureThreshold{DEFAULT_FAILURE_THRESHOLD}; ///< Failures tolerated
  std::chrono::milliseconds stopTimeout{DEFAULT_STOP_TIMEOUT};          ///< stop() wait bound

  /// @brief interval > 0 and stopTimeout > 0.
  [[nodiscard]] bool isValid() const noexcept;

  /// @brief Default policy with a custom interval.
  [[nodiscard]] static MonitorConfig withInterval(std::chrono::nanoseconds interval) noexcept;

  /// @brief 100 ms sampling for local counters and GPU libraries.
  [[nodiscard]] static MonitorConfig fast() noexcept;

  /// @brief Slow remote controllers: 1 s interval, threshold 10, 30 s stop timeout.
  [[nodiscard]] static MonitorConfig outOfBand() noexcept;
};

/* ----------------------------- MonitorFault ----------------------------- */

/**
 * @brief Last recorded error of a Monitor.
 */
struct MonitorFault {
  SourceError error{SourceError::NONE}; ///< Category of the failing read
  std::string detail{};                 ///< Source-provided description
  std::uint32_t consecutiveFailures{0}; ///< Failure streak when recorded
  bool thresholdExceeded{false};        ///< Streak exceeded the threshold
  Clock::time_point timestamp{};        ///< When recorded

  /// @brief True if this fault stopped the Monitor.
  [[nodiscard]] bool isFatal() const noexcept;

  /// @brief One-line summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- MonitorCounters ----------------------------- */

/**
 * @brief Tick outcome counters since construction.
 */
struct MonitorCounters {
  std::uint64_t ticks{0};             ///< Source reads attempted
  std::uint64_t successes{0};         ///< Readings appended
  std::uint64_t transientFailures{0}; ///< TRANSIENT results (including invalid values)
  std::uint64_t unavailable{0};       ///< UNAVAILABLE results
  std::uint64_t overruns{0};          ///< Ticks whose read took >= interval
};

/* ----------------------------- Monitor ----------------------------- */

/**
 * @brief Owns one PowerSource, its sampling thread, and its reading buffer.
 */
class Monitor {
public:
  /**
   * @brief Create an idle monitor.
   * @param name Unique name within a Collector (e.g. "cpu-package-0").
   * @param source Backend to sample; null makes start() fail with NO_SOURCE.
   * @param config Sampling policy; validated by start().
   */
  Monitor(std::string name, std::unique_ptr<PowerSource> source, MonitorConfig config = {});

  /// Stops the sampling loop if running.
  ~Monitor();

  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;
  Monitor(Monitor&&) = delete;
  Monitor& operator=(Monitor&&) = delete;

  /**
   * @brief Launch the sampling loop.
   * @return OK (also when already running) or the reason it could not start.
   * @note Returns immediately; does not wait for the first sample.
   */
  [[nodiscard]] MonitorStatus start() noexcept;

  /**
   * @brief Stop the sampling loop and return the collected readings.
   * @return Copy of the buffer. When not running, the current buffer unchanged.
   */
  ReadingList stop();

  /// @brief Empty the buffer. Serialized with the loop's append.
  void clear() noexcept;

  /// @brief Statistics over a snapshot of the buffer.
  [[nodiscard]] PowerStatistics getStatistics() const;

  /// @brief Distribution over a snapshot of the buffer.
  [[nodiscard]] PowerDistribution getDistribution() const;

  /// @brief Copy of the buffer.
  [[nodiscard]] ReadingList readings() const;

  /// @brief Buffer size.
  [[nodiscard]] std::size_t readingCount() const;

  [[nodiscard]] bool isRunning() const noexcept { return state() == MonitorState::RUNNING; }
  [[nodiscard]] MonitorState state() const noexcept { return state_.load(); }

  /// @brief Most recent error; cleared by start().
  [[nodiscard]] std::optional<MonitorFault> lastError() const;

  /// @brief Current failure streak; 0 after any success.
  [[nodiscard]] std::uint32_t consecutiveFailures() const noexcept {
    return consecutiveFailures_.load();
  }

  /// @brief Snapshot of the tick counters.
  [[nodiscard]] MonitorCounters counters() const noexcept;

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const MonitorConfig& config() const noexcept { return config_; }

private:
  void samplingLoop() noexcept;
  [[nodiscard]] SampleResult readSource() noexcept;
  [[nodiscard]] bool handleResult(SampleResult result);
  void recordFault(SourceError error, std::string detail, std::uint32_t streak, bool exceeded);
  void joinFinishedLoop() noexcept;

  const std::string name_;
  const std::unique_ptr<PowerSource> source_;
  const MonitorConfig config_;

  // Lifecycle calls (start/stop/destructor) are serialized
  std::mutex controlMutex_;

  // Loop signalling
  std::mutex signalMutex_;
  std::condition_variable signalCv_;
  bool stopRequested_{false};
  bool loopExited_{true};
  std::thread thread_;

  std::atomic<MonitorState> state_{MonitorState::IDLE};
  std::atomic<std::uint32_t> consecutiveFailures_{0};

  std::atomic<std::uint64_t> ticks_{0};
  std::atomic<std::uint64_t> successes_{0};
  std::atomic<std::uint64_t> transientFailures_{0};
  std::atomic<std::uint64_t> unavailable_{0};
  std::atomic<std::uint64_t> overruns_{0};

  mutable std::mutex faultMutex_;
  std::optional<MonitorFault> lastError_{};

  mutable std::mutex bufferMutex_;
  ReadingList buffer_{};
};

} // namespace sampling

} // namespace wattmeter

#endif // WATTMETER_SAMPLING_MONITOR_HPP
