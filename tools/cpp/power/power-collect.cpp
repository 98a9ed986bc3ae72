/**
 * @file power-collect.cpp
 * @brief Sample power sources for a fixed window and report statistics.
 *
 * Builds one monitor per selected source (powercap domains, hwmon sensors,
 * NVML GPUs), collects for --duration seconds, then prints average, peak,
 * minimum, energy, and distribution per source along with any faults.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/sampling/inc/Collector.hpp"
#include "src/sampling/inc/Statistics.hpp"
#include "src/sources/inc/HwmonPowerSource.hpp"
#include "src/sources/inc/NvmlPowerSource.hpp"
#include "src/sources/inc/RaplCounter.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace sampling = wattmeter::sampling;
namespace sources = wattmeter::sources;
namespace args = wattmeter::helpers::args;

using wattmeter::helpers::format::joules;
using wattmeter::helpers::format::watts;
using wattmeter::helpers::strings::escapeJson;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_DURATION = 2,
  ARG_INTERVAL = 3,
  ARG_THRESHOLD = 4,
  ARG_RAPL = 5,
  ARG_HWMON = 6,
  ARG_NVML = 7,
  ARG_LOG_LEVEL = 8,
  ARG_LOG_DIR = 9,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Sample CPU, board, and GPU power for a fixed window and report per-source statistics.";

constexpr double DEFAULT_DURATION_S = 5.0;
constexpr std::uint64_t DEFAULT_INTERVAL_MS = 500;

/// Flag bounds; keep the chrono conversions in range.
constexpr double MIN_DURATION_S = 0.001;
constexpr double MAX_DURATION_S = 7.0 * 24.0 * 3600.0;
constexpr std::uint64_t MIN_INTERVAL_MS = 1;
constexpr std::uint64_t MAX_INTERVAL_MS = 3600ULL * 1000ULL;

/// Exit codes.
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_START_FAILED = 2;

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_DURATION] = {"--duration", 1, false, "Collection window in seconds (default: 5)"};
  map[ARG_INTERVAL] = {"--interval", 1, false, "Sampling interval in ms (default: 500)"};
  map[ARG_THRESHOLD] = {"--threshold", 1, false,
                        "Consecutive failures before a source is dropped (default: 5)"};
  map[ARG_RAPL] = {"--rapl", 0, false, "Sample all powercap (RAPL) domains"};
  map[ARG_HWMON] = {"--hwmon", 0, false, "Sample all hwmon power sensors"};
  map[ARG_NVML] = {"--nvml", 1, false, "Sample NVIDIA GPU <index>"};
  map[ARG_LOG_LEVEL] = {"--log-level", 1, false,
                        "trace|debug|info|warn|error|critical|off (default: warn)"};
  map[ARG_LOG_DIR] = {"--log-dir", 1, false, "Also write a timestamped log file here"};
  return map;
}

/// Collection options resolved from flags.
struct Options {
  bool json{false};
  double durationS{DEFAULT_DURATION_S};
  sampling::MonitorConfig monitor{
      sampling::MonitorConfig::withInterval(std::chrono::milliseconds{DEFAULT_INTERVAL_MS})};
  bool rapl{false};
  bool hwmon{false};
  std::vector<unsigned int> nvml{};
  wattmeter::helpers::log::LogConfig log{spdlog::level::warn, {}};
};

/// Convert parsed flags; false with @p error set on bad values.
bool resolveOptions(const args::ParsedArgs& pargs, Options& opts, std::string& error) {
  opts.json = args::hasFlag(pargs, ARG_JSON);
  opts.rapl = args::hasFlag(pargs, ARG_RAPL);
  opts.hwmon = args::hasFlag(pargs, ARG_HWMON);

  if (const auto DURATION =
          args::valueAsDouble(pargs, ARG_DURATION, MIN_DURATION_S, MAX_DURATION_S, error)) {
    opts.durationS = *DURATION;
  } else if (!error.empty()) {
    error = fmt::format("--duration: {}", error);
    return false;
  }
  if (const auto INTERVAL =
          args::valueAsUint(pargs, ARG_INTERVAL, MIN_INTERVAL_MS, MAX_INTERVAL_MS, error)) {
    opts.monitor.interval = std::chrono::milliseconds{*INTERVAL};
  } else if (!error.empty()) {
    error = fmt::format("--interval: {}", error);
    return false;
  }
  if (const auto THRESHOLD = args::valueAsUint(pargs, ARG_THRESHOLD, error)) {
    opts.monitor.consecutiveFailureThreshold = static_cast<std::uint32_t>(*THRESHOLD);
  }
  if (const auto INDEX = args::valueAsUint(pargs, ARG_NVML, error)) {
    opts.nvml.push_back(static_cast<unsigned int>(*INDEX));
  }
  if (const auto IT = pargs.find(ARG_LOG_LEVEL); IT != pargs.end() && !IT->second.empty()) {
    const auto LEVEL = wattmeter::helpers::log::parseLevel(IT->second.front());
    if (!LEVEL) {
      error = fmt::format("Unknown log level '{}'", IT->second.front());
      return false;
    }
    opts.log.level = *LEVEL;
  }
  if (const auto IT = pargs.find(ARG_LOG_DIR); IT != pargs.end() && !IT->second.empty()) {
    opts.log.logDirectory = std::string(IT->second.front());
  }
  return error.empty();
}

/// Add a monitor, falling back to @p altName when the preferred name is taken.
void addMonitor(sampling::Collector& collector, const std::string& name, const std::string& altName,
                std::unique_ptr<sampling::PowerSource> source, const sampling::MonitorConfig& cfg) {
  const std::string& chosen = (collector.monitor(name) == nullptr) ? name : altName;
  const sampling::CollectorStatus STATUS =
      collector.addMonitor(std::make_unique<sampling::Monitor>(chosen, std::move(source), cfg));
  if (STATUS != sampling::CollectorStatus::OK) {
    spdlog::warn("Skipping source '{}': {}", chosen, sampling::toString(STATUS));
  }
}

/// Register every selected source.
void buildCollector(const Options& opts, sampling::Collector& collector) {
  if (opts.rapl) {
    const auto DOMAINS = sources::discoverRaplDomains();
    if (DOMAINS.empty()) {
      spdlog::warn("No powercap domains found");
    }
    for (const sources::RaplDomain& D : DOMAINS) {
      addMonitor(collector, D.monitorName(), fmt::format("rapl:{}", D.zone),
                 sources::makeRaplPowerSource(D), opts.monitor);
    }
  }

  if (opts.hwmon) {
    const auto SENSORS = sources::discoverHwmonPowerSensors();
    if (SENSORS.empty()) {
      spdlog::warn("No hwmon power sensors found");
    }
    for (const sources::HwmonPowerSensor& S : SENSORS) {
      addMonitor(collector, S.monitorName(), fmt::format("hwmon:{}", S.device),
                 std::make_unique<sources::HwmonPowerSource>(S), opts.monitor);
    }
  }

  for (const unsigned int IDX : opts.nvml) {
    const std::string NAME = fmt::format("nvml:{}", IDX);
    addMonitor(collector, NAME, NAME, std::make_unique<sources::NvmlPowerSource>(IDX),
               opts.monitor);
  }
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const sampling::CollectionResult& result, const Options& opts) {
  fmt::print("=== Power Collection ({:.1f} s, interval {} ms) ===\n", opts.durationS,
             std::chrono::duration_cast<std::chrono::milliseconds>(opts.monitor.interval).count());

  double totalAverage = 0.0;
  double totalEnergy = 0.0;

  for (const std::string& NAME : result.names) {
    const sampling::ReadingList* list = result.find(NAME);
    const sampling::ReadingList EMPTY{};
    const sampling::ReadingList& READINGS = (list != nullptr) ? *list : EMPTY;
    const sampling::PowerStatistics STATS = sampling::computeStatistics(READINGS);

    fmt::print("\n[{}]\n", NAME);
    fmt::print("{}", STATS.toString());
    if (STATS.sampleCount >= 2) {
      fmt::print("{}", sampling::computeDistribution(READINGS).toString());
    }

    const auto FAULT = result.faults.find(NAME);
    if (FAULT != result.faults.end()) {
      if (FAULT->second.isFatal()) {
        fmt::print("  \033[31mFAULT:    {}\033[0m\n", FAULT->second.toString());
      } else {
        fmt::print("  \033[33mLast error: {}\033[0m\n", FAULT->second.toString());
      }
    }

    totalAverage += STATS.averageWatts;
    totalEnergy += STATS.totalEnergyJoules;
  }

  // Sub-zones overlap their packages, so the sum is only indicative
  fmt::print("\nSum of averages: {}  |  Sum of energy: {}\n", watts(totalAverage),
             joules(totalEnergy));
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const sampling::CollectionResult& result, const Options& opts) {
  fmt::print("{{\n");
  fmt::print("  \"durationSeconds\": {},\n", opts.durationS);
  fmt::print("  \"intervalMs\": {},\n",
             std::chrono::duration_cast<std::chrono::milliseconds>(opts.monitor.interval).count());
  fmt::print("  \"sources\": [\n");

  bool first = true;
  for (const std::string& NAME : result.names) {
    const sampling::ReadingList* list = result.find(NAME);
    const sampling::ReadingList EMPTY{};
    const sampling::ReadingList& READINGS = (list != nullptr) ? *list : EMPTY;
    const sampling::PowerStatistics STATS = sampling::computeStatistics(READINGS);
    const sampling::PowerDistribution DIST = sampling::computeDistribution(READINGS);

    if (!first) {
      fmt::print(",\n");
    }
    first = false;

    fmt::print("    {{\n");
    fmt::print("      \"name\": \"{}\",\n", escapeJson(NAME));
    fmt::print("      \"sampleCount\": {},\n", STATS.sampleCount);
    fmt::print("      \"averageWatts\": {:.6f},\n", STATS.averageWatts);
    fmt::print("      \"peakWatts\": {:.6f},\n", STATS.peakWatts);
    fmt::print("      \"minWatts\": {:.6f},\n", STATS.minWatts);
    fmt::print("      \"totalEnergyJoules\": {:.6f},\n", STATS.totalEnergyJoules);
    fmt::print("      \"durationSeconds\": {:.6f},\n", STATS.durationSeconds);
    fmt::print("      \"medianWatts\": {:.6f},\n", DIST.medianWatts);
    fmt::print("      \"stdDevWatts\": {:.6f},\n", DIST.stdDevWatts);
    fmt::print("      \"p95Watts\": {:.6f}", DIST.p95Watts);

    const auto FAULT = result.faults.find(NAME);
    if (FAULT != result.faults.end()) {
      const sampling::MonitorFault& F = FAULT->second;
      fmt::print(",\n      \"fault\": {{\"error\": \"{}\", \"detail\": \"{}\", "
                 "\"consecutiveFailures\": {}, \"fatal\": {}}}",
                 sampling::toString(F.error), escapeJson(F.detail), F.consecutiveFailures,
                 F.isFatal());
    }
    fmt::print("\n    }}");
  }

  fmt::print("\n  ]\n");
  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;
  Options opts{};

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return EXIT_USAGE;
  }

  if (args::hasFlag(pargs, ARG_HELP)) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return EXIT_OK;
  }

  if (!resolveOptions(pargs, opts, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return EXIT_USAGE;
  }

  (void)wattmeter::helpers::log::setupLogging(opts.log);

  if (!opts.rapl && !opts.hwmon && opts.nvml.empty()) {
    fmt::print(stderr, "Error: select at least one of --rapl, --hwmon, --nvml <index>\n\n");
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return EXIT_USAGE;
  }

  sampling::Collector collector;
  buildCollector(opts, collector);
  if (collector.size() == 0) {
    fmt::print(stderr, "Error: no power sources available\n");
    return EXIT_USAGE;
  }

  const sampling::CollectionResult RESULT =
      collector.collectFor(std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::duration<double>(opts.durationS)));

  if (RESULT.status != sampling::CollectorStatus::OK) {
    fmt::print(stderr, "Error: {}\n", sampling::toString(RESULT.status));
    for (const auto& [name, fault] : RESULT.faults) {
      fmt::print(stderr, "  {}: {}\n", name, fault.toString());
    }
    return EXIT_START_FAILED;
  }

  if (opts.json) {
    printJson(RESULT, opts);
  } else {
    printHuman(RESULT, opts);
  }

  spdlog::shutdown();
  return EXIT_OK;
}
