#ifndef WATTMETER_HELPERS_STRINGS_HPP
#define WATTMETER_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for sysfs values and CLI tokens.
 *
 * Parsers take non-owning views and report failure through std::optional so
 * callers can tell "zero" from "unparsable".
 *
 * @note Thread-safe: All functions are stateless.
 */

#include <cerrno>   // errno, ERANGE
#include <cmath>    // std::isfinite
#include <cstddef>  // std::size_t
#include <cstdint>  // std::uint64_t
#include <cstdlib>  // std::strtoull, std::strtod
#include <optional> // std::optional
#include <string>
#include <string_view>

namespace wattmeter {
namespace helpers {
namespace strings {

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip trailing whitespace in-place.
 * @param buf Buffer to modify (null-terminated).
 * @param len Current string length (will be updated).
 */
inline void stripTrailingWhitespace(char* buf, std::size_t& len) noexcept {
  if (buf == nullptr) {
    return;
  }

  while (len > 0) {
    const char C = buf[len - 1];
    if (C == '\n' || C == '\r' || C == ' ' || C == '\t') {
      --len;
      buf[len] = '\0';
    } else {
      break;
    }
  }
}

/// View with leading and trailing blanks removed.
[[nodiscard]] inline std::string_view trim(std::string_view text) noexcept {
  std::size_t begin = 0;
  while (begin < text.size() &&
         (text[begin] == ' ' || text[begin] == '\t' || text[begin] == '\n' || text[begin] == '\r')) {
    ++begin;
  }
  std::size_t end = text.size();
  while (end > begin && (text[end - 1] == ' ' || text[end - 1] == '\t' || text[end - 1] == '\n' ||
                         text[end - 1] == '\r')) {
    --end;
  }
  return text.substr(begin, end - begin);
}

/// True if @p text begins with @p prefix.
[[nodiscard]] inline bool startsWith(std::string_view text, std::string_view prefix) noexcept {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse an unsigned decimal integer.
 * @param text Token to parse; surrounding whitespace is ignored.
 * @return Value, or std::nullopt on empty input, trailing garbage, sign, or overflow.
 */
[[nodiscard]] inline std::optional<std::uint64_t> parseUint64(std::string_view text) {
  const std::string_view BODY = trim(text);
  if (BODY.empty() || BODY.front() < '0' || BODY.front() > '9') {
    return std::nullopt;
  }

  const std::string OWNED(BODY);
  char* end = nullptr;
  errno = 0;
  const unsigned long long VAL = std::strtoull(OWNED.c_str(), &end, 10);
  if (errno == ERANGE || end != OWNED.c_str() + OWNED.size()) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(VAL);
}

/**
 * @brief Parse a finite floating-point value.
 * @param text Token to parse; surrounding whitespace is ignored.
 * @return Value, or std::nullopt on empty input, trailing garbage, or non-finite result.
 */
[[nodiscard]] inline std::optional<double> parseDouble(std::string_view text) {
  const std::string_view BODY = trim(text);
  if (BODY.empty()) {
    return std::nullopt;
  }

  const std::string OWNED(BODY);
  char* end = nullptr;
  errno = 0;
  const double VAL = std::strtod(OWNED.c_str(), &end);
  if (errno == ERANGE || end != OWNED.c_str() + OWNED.size() || !std::isfinite(VAL)) {
    return std::nullopt;
  }
  return VAL;
}

/* ----------------------------- Output ----------------------------- */

/**
 * @brief Escape text for a JSON string literal (quotes not included).
 * @param text Raw text (paths, error details).
 * @return Escaped copy.
 */
[[nodiscard]] inline std::string escapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char C : text) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        constexpr const char* HEX = "0123456789abcdef";
        out += "\\u00";
        out += HEX[(C >> 4) & 0x0F];
        out += HEX[C & 0x0F];
      } else {
        out += C;
      }
    }
  }
  return out;
}

} // namespace strings
} // namespace helpers
} // namespace wattmeter

#endif // WATTMETER_HELPERS_STRINGS_HPP
