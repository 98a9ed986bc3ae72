#ifndef WATTMETER_SOURCES_SYSFS_ERROR_HPP
#define WATTMETER_SOURCES_SYSFS_ERROR_HPP
/**
 * @file SysfsError.hpp
 * @brief Map sysfs read errno values onto SourceError categories.
 */

#include "src/sampling/inc/PowerSource.hpp"

#include <cerrno>  // ENOENT, EACCES, ...
#include <cstring> // std::strerror
#include <string>

#include <fmt/core.h>

namespace wattmeter {

namespace sources {

/**
 * @brief Classify the errno of a failed attribute read.
 * @param err errno value (EINVAL/EIO also stand for unparsable or empty content).
 * @return PERMANENT for missing files and denied access, TRANSIENT otherwise.
 */
[[nodiscard]] inline sampling::SourceError classifySysfsErrno(int err) noexcept {
  switch (err) {
  case ENOENT:
  case ENODEV:
  case ENXIO:
  case ENOTDIR:
  case EACCES:
  case EPERM:
    return sampling::SourceError::PERMANENT;
  default:
    return sampling::SourceError::TRANSIENT;
  }
}

/// @brief "path: reason" for a failed attribute read.
[[nodiscard]] inline std::string describeSysfsError(const std::string& path, int err) {
  if (err == EINVAL) {
    return fmt::format("{}: unparsable content", path);
  }
  if (err == EIO) {
    return fmt::format("{}: empty or unreadable", path);
  }
  return fmt::format("{}: {}", path, std::strerror(err));
}

} // namespace sources

} // namespace wattmeter

#endif // WATTMETER_SOURCES_SYSFS_ERROR_HPP
