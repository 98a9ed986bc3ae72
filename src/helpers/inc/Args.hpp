#ifndef WATTMETER_HELPERS_ARGS_HPP
#define WATTMETER_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing for the wattmeter tools.
 *
 * Fixed-arity flags: a matched flag consumes exactly `nargs` following tokens.
 * Typed accessors convert the consumed tokens and report malformed values.
 *
 * @note Cold-path: Allocates.
 */

#include "src/helpers/inc/Strings.hpp"

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace wattmeter {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--interval"
  std::uint8_t nargs;      ///< Number of values consumed after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Help text
};

/// Map from key to flag definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to consumed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse arguments according to a flag map.
 * @param args  Argument list (views must outlive pargs).
 * @param map   Accepted flags.
 * @param pargs Output values per key (overwritten on repeat).
 * @param error Set on failure.
 * @return true on success.
 *
 * Unknown tokens are rejected so typos in flag names are reported.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::pair<std::uint8_t, const ArgDef*>> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, std::make_pair(KV.first, &KV.second));
  }

  std::bitset<256> seen;
  const std::size_t N = args.size();

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = args[i];
    const auto IT = lut.find(TOK);
    if (IT == lut.end()) {
      error = fmt::format("Unknown argument '{}'", TOK);
      return false;
    }

    const std::uint8_t KEY = IT->second.first;
    const ArgDef& DEF = *IT->second.second;

    // Values occupy [i+1, i+nargs]
    if (i + static_cast<std::size_t>(DEF.nargs) >= N) {
      error = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      return false;
    }

    auto& out = pargs[KEY];
    out.clear();
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }

    seen.set(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      error = fmt::format("Missing required argument '{}'", KV.second.flag);
      return false;
    }
  }

  return true;
}

/// True if the flag was given.
[[nodiscard]] inline bool hasFlag(const ParsedArgs& pargs, std::uint8_t key) {
  return pargs.count(key) != 0;
}

/**
 * @brief First value of a flag as a finite double.
 * @return Value; std::nullopt if absent. Sets @p error if present but malformed.
 */
[[nodiscard]] inline std::optional<double> valueAsDouble(const ParsedArgs& pargs, std::uint8_t key,
                                                         std::string& error) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  const auto VAL = strings::parseDouble(IT->second.front());
  if (!VAL) {
    error = fmt::format("Invalid number '{}'", IT->second.front());
  }
  return VAL;
}

/**
 * @brief First value of a flag as an unsigned integer.
 * @return Value; std::nullopt if absent. Sets @p error if present but malformed.
 */
[[nodiscard]] inline std::optional<std::uint64_t>
valueAsUint(const ParsedArgs& pargs, std::uint8_t key, std::string& error) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  const auto VAL = strings::parseUint64(IT->second.front());
  if (!VAL) {
    error = fmt::format("Invalid integer '{}'", IT->second.front());
  }
  return VAL;
}

/**
 * @brief valueAsDouble() restricted to [lo, hi].
 * @return Value; std::nullopt if absent, malformed, or out of range (the last two set @p error).
 */
[[nodiscard]] inline std::optional<double> valueAsDouble(const ParsedArgs& pargs, std::uint8_t key,
                                                         double lo, double hi, std::string& error) {
  const auto VAL = valueAsDouble(pargs, key, error);
  if (VAL && (*VAL < lo || *VAL > hi)) {
    error = fmt::format("Value {} out of range [{}, {}]", *VAL, lo, hi);
    return std::nullopt;
  }
  return VAL;
}

/**
 * @brief valueAsUint() restricted to [lo, hi].
 * @return Value; std::nullopt if absent, malformed, or out of range (the last two set @p error).
 */
[[nodiscard]] inline std::optional<std::uint64_t> valueAsUint(const ParsedArgs& pargs,
                                                              std::uint8_t key, std::uint64_t lo,
                                                              std::uint64_t hi,
                                                              std::string& error) {
  const auto VAL = valueAsUint(pargs, key, error);
  if (VAL && (*VAL < lo || *VAL > hi)) {
    error = fmt::format("Value {} out of range [{}, {}]", *VAL, lo, hi);
    return std::nullopt;
  }
  return VAL;
}

/**
 * @brief Print usage for a tool.
 * @param progName    Program name (argv[0]).
 * @param description One-line tool description.
 * @param map         Flags to document.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : entries) {
    std::string flagStr(def->flag);
    if (def->nargs == 1) {
      flagStr += " <value>";
    } else if (def->nargs > 1) {
      flagStr += " <value> ...";
    }
    fmt::print("  {:<22}  {}{}\n", flagStr, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace wattmeter

#endif // WATTMETER_HELPERS_ARGS_HPP
