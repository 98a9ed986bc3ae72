/**
 * @file Reading.cpp
 * @brief Reading validation and formatting.
 */

#include "src/sampling/inc/Reading.hpp"
#include "src/helpers/inc/Format.hpp"

#include <cmath>   // std::isfinite
#include <ctime>   // std::gmtime_r
#include <utility> // std::move

#include <fmt/core.h>

namespace wattmeter {

namespace sampling {

using wattmeter::helpers::format::watts;

namespace {

/// ISO-8601 UTC with millisecond precision.
std::string isoTimestamp(Clock::time_point tp) {
  const std::time_t SECS = Clock::to_time_t(tp);
  std::tm utc{};
  ::gmtime_r(&SECS, &utc);
  const auto MILLIS =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", utc.tm_year + 1900,
                     utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec,
                     MILLIS < 0 ? MILLIS + 1000 : MILLIS);
}

} // namespace

/* ----------------------------- MetadataValue ----------------------------- */

std::string toString(const MetadataValue& value) {
  if (const auto* b = std::get_if<bool>(&value)) {
    return *b ? "true" : "false";
  }
  if (const auto* i = std::get_if<std::int64_t>(&value)) {
    return fmt::format("{}", *i);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    return fmt::format("{:.3f}", *d);
  }
  return std::get<std::string>(value);
}

/* ----------------------------- Reading ----------------------------- */

Reading::Reading(Clock::time_point timestamp, double powerWatts, Metadata metadata) noexcept
    : timestamp_(timestamp), powerWatts_(powerWatts), metadata_(std::move(metadata)) {}

bool Reading::isValidPower(double watts) noexcept { return std::isfinite(watts) && watts >= 0.0; }

std::optional<Reading> Reading::create(Clock::time_point timestamp, double powerWatts,
                                       Metadata metadata) {
  if (!isValidPower(powerWatts)) {
    return std::nullopt;
  }
  return Reading(timestamp, powerWatts, std::move(metadata));
}

const MetadataValue* Reading::find(const std::string& key) const noexcept {
  const auto IT = metadata_.find(key);
  return (IT == metadata_.end()) ? nullptr : &IT->second;
}

std::string Reading::toString() const {
  std::string out = fmt::format("Reading({}, {}", isoTimestamp(timestamp_), watts(powerWatts_));
  for (const auto& [key, value] : metadata_) {
    out += fmt::format(", {}={}", key, sampling::toString(value));
  }
  out += ")";
  return out;
}

} // namespace sampling

} // namespace wattmeter
