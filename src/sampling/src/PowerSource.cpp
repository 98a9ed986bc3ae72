/**
 * @file PowerSource.cpp
 * @brief SourceError names and SampleResult constructors.
 */

#include "src/sampling/inc/PowerSource.hpp"

#include <utility> // std::move

namespace wattmeter {

namespace sampling {

const char* toString(SourceError error) noexcept {
  switch (error) {
  case SourceError::NONE:
    return "none";
  case SourceError::UNAVAILABLE:
    return "unavailable";
  case SourceError::TRANSIENT:
    return "transient";
  case SourceError::PERMANENT:
    return "permanent";
  }
  return "unknown";
}

SampleResult SampleResult::success(double watts, Metadata metadata) {
  SampleResult out{};
  out.powerWatts = watts;
  out.metadata = std::move(metadata);
  return out;
}

SampleResult SampleResult::failure(SourceError error, std::string detail) {
  SampleResult out{};
  // A failure without a category is treated as retryable
  out.error = (error == SourceError::NONE) ? SourceError::TRANSIENT : error;
  out.detail = std::move(detail);
  return out;
}

} // namespace sampling

} // namespace wattmeter
