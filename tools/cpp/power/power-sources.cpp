/**
 * @file power-sources.cpp
 * @brief List the power sources this machine exposes.
 *
 * Shows powercap (RAPL) domains with their counter wrap range, hwmon devices
 * with a power attribute, and NVML GPUs.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/sources/inc/HwmonPowerSource.hpp"
#include "src/sources/inc/NvmlPowerSource.hpp"
#include "src/sources/inc/RaplCounter.hpp"
#include "src/sources/inc/compat_nvml_detect.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace sources = wattmeter::sources;
namespace args = wattmeter::helpers::args;

using wattmeter::helpers::strings::escapeJson;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "List power sources: powercap (RAPL) domains, hwmon power sensors, and NVML GPUs.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  return map;
}

/// Everything discovered in one pass.
struct Inventory {
  std::vector<sources::RaplDomain> rapl{};
  std::vector<sources::HwmonPowerSensor> hwmon{};
  std::vector<sources::NvmlDeviceInfo> nvml{};
};

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const Inventory& inv) {
  fmt::print("=== Powercap (RAPL) ===\n");
  if (inv.rapl.empty()) {
    fmt::print("  (none detected)\n");
  }
  for (const sources::RaplDomain& D : inv.rapl) {
    fmt::print("  {}\n", D.toString());
  }

  fmt::print("\n=== hwmon ===\n");
  if (inv.hwmon.empty()) {
    fmt::print("  (none detected)\n");
  }
  for (const sources::HwmonPowerSensor& S : inv.hwmon) {
    fmt::print("  {}\n", S.toString());
  }

  fmt::print("\n=== NVML ===\n");
  if (!sources::compat_nvml::available()) {
    fmt::print("  (NVML support not compiled in)\n");
  } else if (inv.nvml.empty()) {
    fmt::print("  (none detected)\n");
  }
  for (const sources::NvmlDeviceInfo& G : inv.nvml) {
    fmt::print("  {}\n", G.toString());
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const Inventory& inv) {
  fmt::print("{{\n");

  fmt::print("  \"rapl\": [");
  for (std::size_t i = 0; i < inv.rapl.size(); ++i) {
    const sources::RaplDomain& D = inv.rapl[i];
    fmt::print("{}\n    {{\"zone\": \"{}\", \"name\": \"{}\", \"path\": \"{}\", "
               "\"maxEnergyRangeUj\": {}}}",
               i == 0 ? "" : ",", escapeJson(D.zone), escapeJson(D.name), escapeJson(D.path),
               D.maxEnergyRangeUj);
  }
  fmt::print("{}],\n", inv.rapl.empty() ? "" : "\n  ");

  fmt::print("  \"hwmon\": [");
  for (std::size_t i = 0; i < inv.hwmon.size(); ++i) {
    const sources::HwmonPowerSensor& S = inv.hwmon[i];
    fmt::print("{}\n    {{\"device\": \"{}\", \"name\": \"{}\", \"path\": \"{}\", "
               "\"powerFile\": \"{}\"}}",
               i == 0 ? "" : ",", escapeJson(S.device), escapeJson(S.name), escapeJson(S.path),
               S.powerFile);
  }
  fmt::print("{}],\n", inv.hwmon.empty() ? "" : "\n  ");

  fmt::print("  \"nvmlAvailable\": {},\n", sources::compat_nvml::available());
  fmt::print("  \"nvml\": [");
  for (std::size_t i = 0; i < inv.nvml.size(); ++i) {
    const sources::NvmlDeviceInfo& G = inv.nvml[i];
    fmt::print("{}\n    {{\"index\": {}, \"name\": \"{}\", \"powerLimitWatts\": {:.1f}}}",
               i == 0 ? "" : ",", G.index, escapeJson(G.name), G.powerLimitWatts);
  }
  fmt::print("{}]\n", inv.nvml.empty() ? "" : "\n  ");

  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;
  bool jsonOutput = false;

  if (argc > 1) {
    std::vector<std::string_view> argList;
    argList.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      argList.emplace_back(argv[i]);
    }

    std::string error;
    if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
      fmt::print(stderr, "Error: {}\n\n", error);
      args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 1;
    }

    if (args::hasFlag(pargs, ARG_HELP)) {
      args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }

    jsonOutput = args::hasFlag(pargs, ARG_JSON);
  }

  Inventory inv{};
  inv.rapl = sources::discoverRaplDomains();
  inv.hwmon = sources::discoverHwmonPowerSensors();
  inv.nvml = sources::listNvmlDevices();

  if (jsonOutput) {
    printJson(inv);
  } else {
    printHuman(inv);
  }

  return 0;
}
