/**
 * @file HwmonPowerSource.cpp
 * @brief hwmon power sensor discovery and reads.
 */

#include "src/sources/inc/HwmonPowerSource.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/sources/inc/SysfsError.hpp"

#include <algorithm>  // std::sort
#include <cstdint>    // std::uint64_t
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

namespace {

/// temp*_input is millidegrees Celsius.
constexpr double MILLIDEGREES_TO_CELSIUS = 1e-3;

/// freq*_input is Hz.
constexpr double HZ_TO_MHZ = 1e-6;

} // namespace

/* ----------------------------- HwmonPowerSensor ----------------------------- */

std::string HwmonPowerSensor::monitorName() const {
  return fmt::format("hwmon:{}", name.empty() ? device : name);
}

std::string HwmonPowerSensor::toString() const {
  return fmt::format("{:<10} {:<16} {:<16} ({})", device, name.empty() ? "-" : name, powerFile,
                     path);
}

/* ----------------------------- API ----------------------------- */

std::optional<HwmonPowerSensor> readHwmonPowerSensor(const std::string& path) {
  HwmonPowerSensor sensor{};
  if (pathExists(path + "/power1_average")) {
    sensor.powerFile = "power1_average";
  } else if (pathExists(path + "/power1_input")) {
    sensor.powerFile = "power1_input";
  } else {
    return std::nullopt;
  }

  sensor.path = path;
  sensor.device = fs::path(path).filename().string();
  sensor.name = readFileString(path + "/name");
  return sensor;
}

std::vector<HwmonPowerSensor> discoverHwmonPowerSensors(const std::string& root) {
  std::vector<HwmonPowerSensor> out;
  std::error_code ec;

  if (!fs::is_directory(root, ec)) {
    spdlog::debug("{}: no hwmon interface", root);
    return out;
  }

  for (const auto& ENTRY : fs::directory_iterator(root, ec)) {
    if (!ENTRY.is_directory(ec)) {
      continue;
    }
    if (auto sensor = readHwmonPowerSensor(ENTRY.path().string())) {
      out.push_back(std::move(*sensor));
    }
  }

  std::sort(out.begin(), out.end(), [](const HwmonPowerSensor& a, const HwmonPowerSensor& b) {
    return a.path < b.path;
  });
  spdlog::debug("Found {} hwmon power sensor(s) under {}", out.size(), root);
  return out;
}

/* ----------------------------- HwmonPowerSource ----------------------------- */

HwmonPowerSource::HwmonPowerSource(HwmonPowerSensor sensor)
    : sensor_(std::move(sensor)), powerPath_(sensor_.path + "/" + sensor_.powerFile),
      tempPath_(sensor_.path + "/temp1_input"), freqPath_(sensor_.path + "/freq1_input") {}

sampling::SampleResult HwmonPowerSource::read() {
  const FileValue<std::uint64_t> POWER = readFileUint64(powerPath_);
  if (!POWER.ok()) {
    return sampling::SampleResult::failure(classifySysfsErrno(POWER.error),
                                           describeSysfsError(powerPath_, POWER.error));
  }

  sampling::Metadata metadata{};
  metadata["sensor"] = sensor_.name.empty() ? sensor_.device : sensor_.name;

  // Optional extras; missing attributes are normal
  const FileValue<std::uint64_t> TEMP = readFileUint64(tempPath_);
  if (TEMP.ok()) {
    metadata["temperature_c"] = static_cast<double>(TEMP.value) * MILLIDEGREES_TO_CELSIUS;
  }
  const FileValue<std::uint64_t> FREQ = readFileUint64(freqPath_);
  if (FREQ.ok()) {
    metadata["frequency_mhz"] = static_cast<double>(FREQ.value) * HZ_TO_MHZ;
  }

  return sampling::SampleResult::success(static_cast<double>(POWER.value) * MICROWATTS_TO_WATTS,
                                         std::move(metadata));
}

} // namespace sources

} // namespace wattmeter
