#ifndef WATTMETER_HELPERS_LOG_HPP
#define WATTMETER_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief spdlog setup shared by the library and CLI tools.
 *
 * Library code logs through the spdlog default logger. Tools call
 * setupLogging() once at startup to install the `wattmeter` logger with a
 * console sink and, optionally, a timestamped log file.
 *
 * @note Not thread-safe: Call setupLogging() before starting monitors.
 */

#include <array>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace wattmeter {
namespace helpers {
namespace log {

/* ----------------------------- Constants ----------------------------- */

/// Name of the logger installed as spdlog default.
inline constexpr const char* LOGGER_NAME = "wattmeter";

/// Console line layout.
inline constexpr const char* CONSOLE_PATTERN = "%^%l%$ - %v";

/// File line layout.
inline constexpr const char* FILE_PATTERN = "%Y-%m-%d %H:%M:%S.%e - %n - %l - %v";

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Logging configuration.
 */
struct LogConfig {
  spdlog::level::level_enum level{spdlog::level::info}; ///< Minimum level for all sinks
  std::string logDirectory{};                            ///< Empty = console only
};

/**
 * @brief Result of setupLogging().
 */
struct LogSetup {
  std::string logFile{};      ///< Path of the file sink; empty if none
  std::string fileSinkError{}; ///< Reason the file sink was skipped, if requested but failed

  [[nodiscard]] bool hasFileSink() const noexcept { return !logFile.empty(); }
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Map a level name to an spdlog level.
 * @param name One of trace, debug, info, warn, error, critical, off.
 * @return Level, or std::nullopt for unknown names.
 */
[[nodiscard]] inline std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) {
  if (name == "trace") {
    return spdlog::level::trace;
  }
  if (name == "debug") {
    return spdlog::level::debug;
  }
  if (name == "info") {
    return spdlog::level::info;
  }
  if (name == "warn" || name == "warning") {
    return spdlog::level::warn;
  }
  if (name == "error") {
    return spdlog::level::err;
  }
  if (name == "critical") {
    return spdlog::level::critical;
  }
  if (name == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

/**
 * @brief Install the `wattmeter` logger as the spdlog default.
 * @param config Level and optional log directory.
 * @return Which sinks were installed. A file sink that cannot be opened is
 *         reported in LogSetup::fileSinkError and logging continues on console.
 */
inline LogSetup setupLogging(const LogConfig& config) {
  LogSetup setup{};
  std::vector<spdlog::sink_ptr> sinks;

  auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console->set_pattern(CONSOLE_PATTERN);
  sinks.push_back(console);

  if (!config.logDirectory.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(config.logDirectory, ec);
    if (ec) {
      setup.fileSinkError = fmt::format("cannot create {}: {}", config.logDirectory, ec.message());
    } else {
      std::array<char, 32> stamp{};
      const std::time_t NOW = std::time(nullptr);
      std::tm local{};
      ::localtime_r(&NOW, &local);
      std::strftime(stamp.data(), stamp.size(), "%Y%m%d_%H%M%S", &local);

      const std::string PATH =
          (std::filesystem::path(config.logDirectory) / fmt::format("wattmeter_{}.log", stamp.data()))
              .string();
      try {
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(PATH, false);
        file->set_pattern(FILE_PATTERN);
        sinks.push_back(file);
        setup.logFile = PATH;
      } catch (const spdlog::spdlog_ex& ex) {
        setup.fileSinkError = ex.what();
      }
    }
  }

  spdlog::drop(LOGGER_NAME);
  auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
  logger->set_level(config.level);
  spdlog::set_default_logger(logger);

  if (setup.hasFileSink()) {
    spdlog::info("Logging initialized. Log file: {}", setup.logFile);
  } else if (!setup.fileSinkError.empty()) {
    spdlog::warn("Log file disabled: {}", setup.fileSinkError);
  }
  return setup;
}

} // namespace log
} // namespace helpers
} // namespace wattmeter

#endif // WATTMETER_HELPERS_LOG_HPP
