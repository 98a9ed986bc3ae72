/**
 * @file Monitor.cpp
 * @brief Sampling loop, lifecycle, and failure policy.
 */

#include "src/sampling/inc/Monitor.hpp"
#include "src/helpers/inc/Format.hpp"

#include <exception>    // std::exception, std::terminate
#include <system_error> // std::system_error
#include <utility>      // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace wattmeter {

namespace sampling {

using SteadyClock = std::chrono::steady_clock;
using wattmeter::helpers::format::duration;
using wattmeter::helpers::format::watts;

/* ----------------------------- Enums ----------------------------- */

const char* toString(MonitorState state) noexcept {
  switch (state) {
  case MonitorState::IDLE:
    return "idle";
  case MonitorState::RUNNING:
    return "running";
  case MonitorState::STOPPED:
    return "stopped";
  }
  return "unknown";
}

const char* toString(MonitorStatus status) noexcept {
  switch (status) {
  case MonitorStatus::OK:
    return "ok";
  case MonitorStatus::INVALID_CONFIG:
    return "invalid config";
  case MonitorStatus::NO_SOURCE:
    return "no power source";
  case MonitorStatus::THREAD_START_FAILED:
    return "thread start failed";
  }
  return "unknown";
}

/* ----------------------------- MonitorConfig ----------------------------- */

bool MonitorConfig::isValid() const noexcept {
  return interval > std::chrono::nanoseconds::zero() &&
         stopTimeout > std::chrono::milliseconds::zero();
}

MonitorConfig MonitorConfig::withInterval(std::chrono::nanoseconds interval) noexcept {
  MonitorConfig cfg{};
  cfg.interval = interval;
  return cfg;
}

MonitorConfig MonitorConfig::fast() noexcept {
  return withInterval(std::chrono::milliseconds{100});
}

MonitorConfig MonitorConfig::outOfBand() noexcept {
  MonitorConfig cfg{};
  cfg.interval = std::chrono::seconds{1};
  cfg.consecutiveFailureThreshold = 10;
  cfg.stopTimeout = std::chrono::seconds{30};
  return cfg;
}

/* ----------------------------- MonitorFault ----------------------------- */

bool MonitorFault::isFatal() const noexcept {
  return error == SourceError::PERMANENT || thresholdExceeded;
}

std::string MonitorFault::toString() const {
  if (thresholdExceeded) {
    return fmt::format("{} consecutive failures (last {}: {})", consecutiveFailures,
                       sampling::toString(error), detail);
  }
  return fmt::format("{}: {}", sampling::toString(error), detail);
}

/* ----------------------------- Monitor ----------------------------- */

Monitor::Monitor(std::string name, std::unique_ptr<PowerSource> source, MonitorConfig config)
    : name_(std::move(name)), source_(std::move(source)), config_(config) {}

Monitor::~Monitor() {
  if (isRunning()) {
    (void)stop();
  } else {
    std::lock_guard<std::mutex> control(controlMutex_);
    joinFinishedLoop();
  }
}

MonitorStatus Monitor::start() noexcept {
  std::lock_guard<std::mutex> control(controlMutex_);

  if (state_.load() == MonitorState::RUNNING) {
    spdlog::warn("{}: already running", name_);
    return MonitorStatus::OK;
  }
  if (!source_) {
    spdlog::error("{}: cannot start without a power source", name_);
    return MonitorStatus::NO_SOURCE;
  }
  if (!config_.isValid()) {
    spdlog::error("{}: invalid sampling config (interval {}, stop timeout {})", name_,
                  duration(config_.interval), duration(config_.stopTimeout));
    return MonitorStatus::INVALID_CONFIG;
  }

  // A loop that stopped itself on a fault still needs joining
  joinFinishedLoop();

  // State from a previous run (a counter baseline) would span the stopped gap
  source_->reset();

  {
    std::lock_guard<std::mutex> lock(faultMutex_);
    lastError_.reset();
  }
  consecutiveFailures_.store(0);
  {
    std::lock_guard<std::mutex> lock(signalMutex_);
    stopRequested_ = false;
    loopExited_ = false;
  }

  const MonitorState PREVIOUS = state_.exchange(MonitorState::RUNNING);
  try {
    thread_ = std::thread(&Monitor::samplingLoop, this);
  } catch (const std::system_error& ex) {
    state_.store(PREVIOUS);
    {
      std::lock_guard<std::mutex> lock(signalMutex_);
      loopExited_ = true;
    }
    spdlog::error("{}: failed to start sampling thread: {}", name_, ex.what());
    return MonitorStatus::THREAD_START_FAILED;
  }

  spdlog::info("{}: started ({} source, interval {})", name_, source_->kind(),
               duration(config_.interval));
  return MonitorStatus::OK;
}

ReadingList Monitor::stop() {
  std::lock_guard<std::mutex> control(controlMutex_);

  if (state_.load() != MonitorState::RUNNING) {
    joinFinishedLoop();
    if (state_.load() == MonitorState::IDLE) {
      spdlog::warn("{}: stop requested but monitor was never started", name_);
    }
    return readings();
  }

  {
    std::lock_guard<std::mutex> lock(signalMutex_);
    stopRequested_ = true;
  }
  signalCv_.notify_all();

  {
    std::unique_lock<std::mutex> lock(signalMutex_);
    const bool EXITED =
        signalCv_.wait_for(lock, config_.stopTimeout, [this] { return loopExited_; });
    if (!EXITED) {
      lock.unlock();
      spdlog::critical("{}: sampling loop did not stop within {}", name_,
                       duration(config_.stopTimeout));
      spdlog::shutdown();
      std::terminate();
    }
  }

  if (thread_.joinable()) {
    thread_.join();
  }
  state_.store(MonitorState::STOPPED);

  ReadingList out = readings();
  spdlog::info("{}: stopped, collected {} readings", name_, out.size());
  return out;
}

void Monitor::clear() noexcept {
  std::lock_guard<std::mutex> lock(bufferMutex_);
  buffer_.clear();
}

PowerStatistics Monitor::getStatistics() const {
  const ReadingList SNAPSHOT = readings();
  if (SNAPSHOT.empty()) {
    spdlog::debug("{}: no power data available for statistics", name_);
  }
  return computeStatistics(SNAPSHOT);
}

PowerDistribution Monitor::getDistribution() const { return computeDistribution(readings()); }

ReadingList Monitor::readings() const {
  std::lock_guard<std::mutex> lock(bufferMutex_);
  return buffer_;
}

std::size_t Monitor::readingCount() const {
  std::lock_guard<std::mutex> lock(bufferMutex_);
  return buffer_.size();
}

std::optional<MonitorFault> Monitor::lastError() const {
  std::lock_guard<std::mutex> lock(faultMutex_);
  return lastError_;
}

MonitorCounters Monitor::counters() const noexcept {
  MonitorCounters out{};
  out.ticks = ticks_.load();
  out.successes = successes_.load();
  out.transientFailures = transientFailures_.load();
  out.unavailable = unavailable_.load();
  out.overruns = overruns_.load();
  return out;
}

/* ----------------------------- Sampling Loop ----------------------------- */

void Monitor::samplingLoop() noexcept {
  spdlog::debug("{}: sampling loop started", name_);

  while (true) {
    {
      std::lock_guard<std::mutex> lock(signalMutex_);
      if (stopRequested_) {
        break;
      }
    }

    const SteadyClock::time_point TICK_START = SteadyClock::now();

    bool keepGoing = false;
    try {
      keepGoing = handleResult(readSource());
    } catch (const std::exception& ex) {
      // Allocation failure while recording; treat as a fault of this monitor only
      recordFault(SourceError::PERMANENT, fmt::format("sampling loop error: {}", ex.what()),
                  consecutiveFailures_.load(), false);
      keepGoing = false;
    }

    if (!keepGoing) {
      state_.store(MonitorState::STOPPED);
      break;
    }

    // Drift compensation: sleep max(0, interval - elapsed)
    const auto ELAPSED = SteadyClock::now() - TICK_START;
    if (ELAPSED >= config_.interval) {
      overruns_.fetch_add(1);
      spdlog::debug("{}: read took {}, longer than interval {}", name_, duration(ELAPSED),
                    duration(config_.interval));
    }
    const SteadyClock::time_point WAKE =
        TICK_START + std::chrono::duration_cast<SteadyClock::duration>(config_.interval);

    std::unique_lock<std::mutex> lock(signalMutex_);
    if (signalCv_.wait_until(lock, WAKE, [this] { return stopRequested_; })) {
      break;
    }
  }

  {
    std::lock_guard<std::mutex> lock(signalMutex_);
    loopExited_ = true;
  }
  signalCv_.notify_all();
  spdlog::debug("{}: sampling loop exited", name_);
}

SampleResult Monitor::readSource() noexcept {
  try {
    return source_->read();
  } catch (const std::exception& ex) {
    return SampleResult::failure(SourceError::PERMANENT,
                                 fmt::format("power source threw: {}", ex.what()));
  } catch (...) {
    return SampleResult::failure(SourceError::PERMANENT, "power source threw: unknown exception");
  }
}

bool Monitor::handleResult(SampleResult result) {
  ticks_.fetch_add(1);

  if (result.ok()) {
    auto reading = Reading::create(Clock::now(), result.powerWatts, std::move(result.metadata));
    if (!reading) {
      result = SampleResult::failure(
          SourceError::TRANSIENT, fmt::format("invalid power value {}", result.powerWatts));
    } else {
      {
        std::lock_guard<std::mutex> lock(bufferMutex_);
        buffer_.push_back(std::move(*reading));
      }
      consecutiveFailures_.store(0);
      successes_.fetch_add(1);
      spdlog::debug("{}: recorded {}", name_, watts(result.powerWatts));
      return true;
    }
  }

  const std::uint32_t STREAK = consecutiveFailures_.fetch_add(1) + 1;
  const bool EXCEEDED = STREAK > config_.consecutiveFailureThreshold;

  switch (result.error) {
  case SourceError::UNAVAILABLE:
    unavailable_.fetch_add(1);
    spdlog::debug("{}: no data this tick: {}", name_, result.detail);
    break;
  case SourceError::TRANSIENT:
    transientFailures_.fetch_add(1);
    spdlog::warn("{}: transient read failure ({}/{}): {}", name_, STREAK,
                 config_.consecutiveFailureThreshold, result.detail);
    recordFault(result.error, result.detail, STREAK, EXCEEDED);
    break;
  case SourceError::PERMANENT:
  case SourceError::NONE:
    recordFault(SourceError::PERMANENT, result.detail, STREAK, EXCEEDED);
    spdlog::error("{}: permanent read failure, stopping: {}", name_, result.detail);
    return false;
  }

  if (EXCEEDED) {
    if (result.error == SourceError::UNAVAILABLE) {
      recordFault(result.error, result.detail, STREAK, true);
    }
    spdlog::error("{}: {} consecutive failures exceed threshold {}, stopping", name_, STREAK,
                  config_.consecutiveFailureThreshold);
    return false;
  }
  return true;
}

void Monitor::recordFault(SourceError error, std::string detail, std::uint32_t streak,
                          bool exceeded) {
  MonitorFault fault{};
  fault.error = error;
  fault.detail = std::move(detail);
  fault.consecutiveFailures = streak;
  fault.thresholdExceeded = exceeded;
  fault.timestamp = Clock::now();

  std::lock_guard<std::mutex> lock(faultMutex_);
  lastError_ = std::move(fault);
}

void Monitor::joinFinishedLoop() noexcept {
  if (!thread_.joinable()) {
    return;
  }
  // Only called when the loop has stopped itself (state != RUNNING)
  thread_.join();
}

} // namespace sampling

} // namespace wattmeter
