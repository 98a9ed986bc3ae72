/**
 * @file Collector.cpp
 * @brief Multi-monitor orchestration with partial-failure handling.
 */

#include "src/sampling/inc/Collector.hpp"
#include "src/helpers/inc/Format.hpp"

#include <exception> // std::exception
#include <thread>    // std::this_thread::sleep_for
#include <utility>   // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace wattmeter {

namespace sampling {

using wattmeter::helpers::format::duration;

/* ----------------------------- Enums ----------------------------- */

const char* toString(CollectorState state) noexcept {
  switch (state) {
  case CollectorState::IDLE:
    return "idle";
  case CollectorState::RUNNING:
    return "running";
  case CollectorState::STOPPED:
    return "stopped";
  }
  return "unknown";
}

const char* toString(CollectorStatus status) noexcept {
  switch (status) {
  case CollectorStatus::OK:
    return "ok";
  case CollectorStatus::NO_MONITORS:
    return "no monitors";
  case CollectorStatus::NULL_MONITOR:
    return "null monitor";
  case CollectorStatus::DUPLICATE_NAME:
    return "duplicate monitor name";
  case CollectorStatus::ALREADY_RUNNING:
    return "collector already running";
  case CollectorStatus::START_FAILED:
    return "monitor start failed";
  }
  return "unknown";
}

/* ----------------------------- CollectionResult ----------------------------- */

const ReadingList* CollectionResult::find(const std::string& name) const noexcept {
  const auto IT = readings.find(name);
  return (IT == readings.end()) ? nullptr : &IT->second;
}

std::map<std::string, PowerStatistics> CollectionResult::statistics() const {
  std::map<std::string, PowerStatistics> out;
  for (const auto& [name, list] : readings) {
    out.emplace(name, computeStatistics(list));
  }
  return out;
}

std::string CollectionResult::toString() const {
  std::string out;
  if (status != CollectorStatus::OK) {
    out += fmt::format("Collection status: {}\n", sampling::toString(status));
  }

  for (const std::string& name : names) {
    out += fmt::format("[{}]\n", name);
    const ReadingList* list = find(name);
    out += computeStatistics(list != nullptr ? *list : ReadingList{}).toString();

    const auto FAULT = faults.find(name);
    if (FAULT != faults.end()) {
      out += fmt::format("  {}: {}\n", FAULT->second.isFatal() ? "FAULT" : "Last error",
                         FAULT->second.toString());
    }
  }
  return out;
}

/* ----------------------------- Collector ----------------------------- */

Collector::~Collector() {
  if (state_ == CollectorState::RUNNING) {
    (void)stop();
  }
}

CollectorStatus Collector::addMonitor(std::unique_ptr<Monitor> monitor) {
  if (!monitor) {
    return CollectorStatus::NULL_MONITOR;
  }
  if (state_ == CollectorState::RUNNING) {
    return CollectorStatus::ALREADY_RUNNING;
  }
  if (this->monitor(monitor->name()) != nullptr) {
    return CollectorStatus::DUPLICATE_NAME;
  }
  monitors_.push_back(std::move(monitor));
  return CollectorStatus::OK;
}

CollectorStatus Collector::start() {
  if (state_ == CollectorState::RUNNING) {
    spdlog::warn("Collector already running");
    return CollectorStatus::OK;
  }
  if (monitors_.empty()) {
    spdlog::warn("Collector has no monitors to start");
    return CollectorStatus::NO_MONITORS;
  }

  startFailure_.reset();
  std::size_t started = 0;
  for (; started < monitors_.size(); ++started) {
    Monitor& mon = *monitors_[started];
    const MonitorStatus STATUS = mon.start();
    if (STATUS != MonitorStatus::OK) {
      startFailure_ = StartFailure{mon.name(), STATUS};
      break;
    }
  }

  if (startFailure_) {
    spdlog::error("Collector start failed at '{}' ({}); rolling back {} started monitor(s)",
                  startFailure_->monitorName, sampling::toString(startFailure_->status), started);
    while (started > 0) {
      --started;
      (void)monitors_[started]->stop();
    }
    return CollectorStatus::START_FAILED;
  }

  state_ = CollectorState::RUNNING;
  spdlog::info("Collector started {} monitor(s)", monitors_.size());
  return CollectorStatus::OK;
}

CollectionResult Collector::stop() {
  if (state_ != CollectorState::RUNNING) {
    spdlog::warn("Collector stop requested while {}", sampling::toString(state_));
  }

  CollectionResult result{};
  result.names = names();

  for (const auto& MON : monitors_) {
    const std::string& NAME = MON->name();
    try {
      result.readings[NAME] = MON->stop();
    } catch (const std::exception& ex) {
      // Keep whatever the monitor can still hand out
      result.readings[NAME] = MON->readings();
      MonitorFault fault{};
      fault.error = SourceError::PERMANENT;
      fault.detail = fmt::format("stop failed: {}", ex.what());
      fault.timestamp = Clock::now();
      result.faults[NAME] = std::move(fault);
      spdlog::error("{}: stop failed: {}", NAME, ex.what());
      continue;
    }

    if (auto fault = MON->lastError()) {
      if (fault->isFatal()) {
        spdlog::warn("{}: degraded during collection: {}", NAME, fault->toString());
      }
      result.faults[NAME] = std::move(*fault);
    }
  }

  state_ = CollectorState::STOPPED;
  spdlog::info("Collector stopped {} monitor(s), {} with errors", monitors_.size(),
               result.faults.size());
  return result;
}

CollectionResult Collector::collectFor(std::chrono::nanoseconds window) {
  const CollectorStatus STATUS = start();
  if (STATUS != CollectorStatus::OK) {
    CollectionResult result{};
    result.status = STATUS;
    result.names = names();
    for (const auto& MON : monitors_) {
      result.readings[MON->name()] = MON->readings();
    }
    if (startFailure_) {
      MonitorFault fault{};
      fault.error = SourceError::PERMANENT;
      fault.detail =
          fmt::format("start failed: {}", sampling::toString(startFailure_->status));
      fault.timestamp = Clock::now();
      result.faults[startFailure_->monitorName] = std::move(fault);
    }
    return result;
  }

  spdlog::info("Collecting for {}", duration(window));
  std::this_thread::sleep_for(window);
  return stop();
}

Monitor* Collector::monitor(const std::string& name) noexcept {
  for (const auto& MON : monitors_) {
    if (MON->name() == name) {
      return MON.get();
    }
  }
  return nullptr;
}

const Monitor* Collector::monitor(const std::string& name) const noexcept {
  for (const auto& MON : monitors_) {
    if (MON->name() == name) {
      return MON.get();
    }
  }
  return nullptr;
}

std::vector<std::string> Collector::names() const {
  std::vector<std::string> out;
  out.reserve(monitors_.size());
  for (const auto& MON : monitors_) {
    out.push_back(MON->name());
  }
  return out;
}

} // namespace sampling

} // namespace wattmeter
