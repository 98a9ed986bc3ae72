/**
 * @file RaplCounter.cpp
 * @brief Powercap zone discovery and energy_uj reads.
 */

#include "src/sources/inc/RaplCounter.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/sources/inc/SysfsError.hpp"

#include <algorithm>  // std::sort
#include <chrono>     // std::chrono::steady_clock
#include <filesystem> // std::filesystem
#include <utility>    // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace wattmeter {

namespace sources {

using wattmeter::helpers::files::FileValue;
using wattmeter::helpers::files::pathExists;
using wattmeter::helpers::files::readFileString;
using wattmeter::helpers::files::readFileUint64;

/* ----------------------------- RaplDomain ----------------------------- */

std::string RaplDomain::monitorName() const {
  return fmt::format("rapl:{}", name.empty() ? zone : name);
}

std::string RaplDomain::toString() const {
  return fmt::format("{:<16} {:<20} wrap {} uJ  ({})", zone, name.empty() ? "-" : name,
                     maxEnergyRangeUj, path);
}

/* ----------------------------- API ----------------------------- */

std::optional<RaplDomain> readRaplDomain(const std::string& path) {
  if (!pathExists(path + "/energy_uj")) {
    return std::nullopt;
  }

  const FileValue<std::uint64_t> RANGE = readFileUint64(path + "/max_energy_range_uj");
  if (!RANGE.ok() || RANGE.value == 0) {
    spdlog::debug("{}: no usable max_energy_range_uj, skipping", path);
    return std::nullopt;
  }

  RaplDomain domain{};
  domain.path = path;
  domain.zone = fs::path(path).filename().string();
  domain.name = readFileString(path + "/name");
  domain.maxEnergyRangeUj = RANGE.value;
  return domain;
}

std::vector<RaplDomain> discoverRaplDomains(const std::string& root) {
  std::vector<RaplDomain> out;
  std::error_code ec;

  if (!fs::is_directory(root, ec)) {
    spdlog::debug("{}: no powercap interface", root);
    return out;
  }

  // Subzones (intel-rapl:0:0, ...) are listed flat beside their parents
  for (const auto& ENTRY : fs::directory_iterator(root, ec)) {
    if (!ENTRY.is_directory(ec)) {
      continue;
    }
    const std::string BASE = ENTRY.path().filename().string();
    if (BASE.rfind("intel-rapl", 0) != 0) {
      continue;
    }
    if (auto domain = readRaplDomain(ENTRY.path().string())) {
      out.push_back(std::move(*domain));
    }
  }

  std::sort(out.begin(), out.end(),
            [](const RaplDomain& a, const RaplDomain& b) { return a.path < b.path; });
  spdlog::debug("Found {} powercap domain(s) under {}", out.size(), root);
  return out;
}

/* ----------------------------- RaplCounter ----------------------------- */

RaplCounter::RaplCounter(RaplDomain domain)
    : domain_(std::move(domain)), energyPath_(domain_.path + "/energy_uj") {}

sampling::CounterReadResult RaplCounter::readCounter() {
  sampling::CounterReadResult out{};

  const FileValue<std::uint64_t> RAW = readFileUint64(energyPath_);
  const auto READ_TIME = std::chrono::steady_clock::now();

  if (!RAW.ok()) {
    out.error = classifySysfsErrno(RAW.error);
    out.detail = describeSysfsError(energyPath_, RAW.error);
    return out;
  }

  out.sample.value = RAW.value;
  out.sample.readTime = READ_TIME;
  out.metadata["domain"] = domain_.name;
  out.metadata["zone"] = domain_.zone;
  return out;
}

sampling::EnergyCounterConfig RaplCounter::counterConfig() const noexcept {
  sampling::EnergyCounterConfig cfg{};
  cfg.wrapMax = domain_.maxEnergyRangeUj;
  cfg.joulesPerUnit = MICROJOULES_TO_JOULES;
  return cfg;
}

std::unique_ptr<sampling::PowerSource> makeRaplPowerSource(const RaplDomain& domain) {
  return std::make_unique<sampling::EnergyCounterAdapter>(std::make_unique<RaplCounter>(domain));
}

} // namespace sources

} // namespace wattmeter
