#ifndef WATTMETER_HELPERS_FILES_HPP
#define WATTMETER_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Small-file reads for sysfs attributes.
 *
 * Uses C-style I/O (open/read/close) into fixed buffers so the sampling loop
 * does not allocate per tick. Unlike a plain "0 on error" reader, every call
 * reports the errno that caused the failure so callers can classify it.
 *
 * @note Thread-safe: All functions are stateless.
 */

#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat, S_ISDIR
#include <unistd.h>   // read, close

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace wattmeter {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Default buffer size for attribute reads.
inline constexpr std::size_t FILE_READ_BUFFER_SIZE = 256;

/// Size for integer attribute reads.
inline constexpr std::size_t INT_READ_BUFFER_SIZE = 64;

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Outcome of a file read.
 *
 * `error` holds the errno of the failing syscall, EIO for an empty file, or
 * EINVAL when the content could not be parsed.
 */
template <typename T> struct FileValue {
  T value{};
  int error{0};

  [[nodiscard]] bool ok() const noexcept { return error == 0; }
};

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read file contents into buffer.
 * @param path File path to read.
 * @param buf Output buffer; always null-terminated.
 * @param bufSize Size of output buffer.
 * @return Bytes read (trailing whitespace stripped) and errno on failure.
 */
[[nodiscard]] inline FileValue<std::size_t> readFileToBuffer(const char* path, char* buf,
                                                             std::size_t bufSize) noexcept {
  FileValue<std::size_t> out{};
  if (path == nullptr || buf == nullptr || bufSize == 0) {
    out.error = EINVAL;
    return out;
  }

  buf[0] = '\0';

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    out.error = errno;
    return out;
  }

  std::size_t total = 0;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      out.error = errno;
      break;
    }
    if (N == 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }

  ::close(FD);
  buf[total] = '\0';

  if (out.error != 0) {
    return out;
  }

  strings::stripTrailingWhitespace(buf, total);
  if (total == 0) {
    out.error = EIO;
  }
  out.value = total;
  return out;
}

/**
 * @brief Read an unsigned decimal attribute (e.g. energy_uj, power1_average).
 * @param path File path to read.
 * @return Parsed value, or the errno of the failure (EINVAL if unparsable).
 */
[[nodiscard]] inline FileValue<std::uint64_t> readFileUint64(const std::string& path) {
  FileValue<std::uint64_t> out{};
  std::array<char, INT_READ_BUFFER_SIZE> buf{};
  const FileValue<std::size_t> RAW = readFileToBuffer(path.c_str(), buf.data(), buf.size());
  if (!RAW.ok()) {
    out.error = RAW.error;
    return out;
  }

  const auto PARSED = strings::parseUint64(std::string_view(buf.data(), RAW.value));
  if (!PARSED) {
    out.error = EINVAL;
    return out;
  }
  out.value = *PARSED;
  return out;
}

/**
 * @brief Read a text attribute (e.g. a powercap or hwmon `name`).
 * @param path File path to read.
 * @return Trimmed content; empty string on any failure.
 */
[[nodiscard]] inline std::string readFileString(const std::string& path) {
  std::array<char, FILE_READ_BUFFER_SIZE> buf{};
  const FileValue<std::size_t> RAW = readFileToBuffer(path.c_str(), buf.data(), buf.size());
  if (!RAW.ok()) {
    return {};
  }
  return std::string(strings::trim(std::string_view(buf.data(), RAW.value)));
}

/* ----------------------------- Path Utilities ----------------------------- */

/// True if path exists (file or directory).
[[nodiscard]] inline bool pathExists(const std::string& path) noexcept {
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0;
}

/// True if path exists and is a directory.
[[nodiscard]] inline bool isDirectory(const std::string& path) noexcept {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

} // namespace files
} // namespace helpers
} // namespace wattmeter

#endif // WATTMETER_HELPERS_FILES_HPP
