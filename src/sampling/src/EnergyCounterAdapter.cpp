/**
 * @file EnergyCounterAdapter.cpp
 * @brief Counter differencing with wraparound correction.
 */

#include "src/sampling/inc/EnergyCounterAdapter.hpp"

#include <cmath>   // std::isfinite
#include <utility> // std::move

#include <fmt/core.h>

namespace wattmeter {

namespace sampling {

/* ----------------------------- EnergyCounterConfig ----------------------------- */

bool EnergyCounterConfig::isValid() const noexcept {
  return wrapMax > 0 && std::isfinite(joulesPerUnit) && joulesPerUnit > 0.0;
}

/* ----------------------------- API ----------------------------- */

std::uint64_t counterDelta(std::uint64_t previous, std::uint64_t current,
                           std::uint64_t wrapMax) noexcept {
  if (current >= previous) {
    return current - previous;
  }
  // previous <= wrapMax is a precondition, so neither term underflows
  return (wrapMax - previous) + current;
}

/* ----------------------------- EnergyCounterAdapter ----------------------------- */

EnergyCounterAdapter::EnergyCounterAdapter(std::unique_ptr<EnergyCounter> counter)
    : counter_(std::move(counter)) {
  if (counter_) {
    config_ = counter_->counterConfig();
  }
}

std::string_view EnergyCounterAdapter::kind() const noexcept {
  return counter_ ? counter_->kind() : std::string_view{"energy-counter"};
}

void EnergyCounterAdapter::reset() noexcept { last_.reset(); }

SampleResult EnergyCounterAdapter::read() {
  if (!counter_) {
    return SampleResult::failure(SourceError::PERMANENT, "no energy counter attached");
  }
  if (!config_.isValid()) {
    return SampleResult::failure(
        SourceError::PERMANENT,
        fmt::format("invalid counter config (wrapMax={}, joulesPerUnit={})", config_.wrapMax,
                    config_.joulesPerUnit));
  }

  CounterReadResult raw = counter_->readCounter();
  if (!raw.ok()) {
    return SampleResult::failure(raw.error, std::move(raw.detail));
  }

  const CounterSample CURRENT = raw.sample;
  if (CURRENT.value > config_.wrapMax) {
    return SampleResult::failure(SourceError::PERMANENT,
                                 fmt::format("counter value {} exceeds wrap range {}",
                                             CURRENT.value, config_.wrapMax));
  }

  if (!last_) {
    last_ = CURRENT;
    return SampleResult::failure(SourceError::UNAVAILABLE,
                                 "baseline stored; power needs two counter samples");
  }

  const CounterSample PREVIOUS = *last_;
  last_ = CURRENT;

  const auto ELAPSED = CURRENT.readTime - PREVIOUS.readTime;
  if (ELAPSED <= std::chrono::steady_clock::duration::zero()) {
    return SampleResult::failure(
        SourceError::TRANSIENT,
        fmt::format("non-positive interval between counter reads ({} ns)",
                    std::chrono::duration_cast<std::chrono::nanoseconds>(ELAPSED).count()));
  }

  const bool WRAPPED = CURRENT.value < PREVIOUS.value;
  const std::uint64_t DELTA = counterDelta(PREVIOUS.value, CURRENT.value, config_.wrapMax);
  const double SECONDS = std::chrono::duration<double>(ELAPSED).count();
  const double JOULES = static_cast<double>(DELTA) * config_.joulesPerUnit;

  Metadata metadata = std::move(raw.metadata);
  metadata["energy_joules"] = JOULES;
  metadata["interval_s"] = SECONDS;
  metadata["counter_wrapped"] = WRAPPED;

  return SampleResult::success(JOULES / SECONDS, std::move(metadata));
}

} // namespace sampling

} // namespace wattmeter
