#ifndef WATTMETER_SOURCES_RAPL_COUNTER_HPP
#define WATTMETER_SOURCES_RAPL_COUNTER_HPP
/**
 * @file RaplCounter.hpp
 * @brief Powercap (RAPL) energy counters as PowerSources.
 * @note Linux-only. Reads /sys/class/powercap/intel-rapl*. AMD Zen parts
 *       expose their package counters through the same interface.
 * @note energy_uj is root-only on kernels patched for CVE-2020-8694; a denied
 *       read is reported as PERMANENT.
 */

#include "src/sampling/inc/EnergyCounterAdapter.hpp"
#include "src/sampling/inc/PowerSource.hpp"

#include <cstdint>  // std::uint64_t
#include <memory>   // std::unique_ptr
#include <optional> // std::optional
#include <string>   // std::string
#include <vector>   // std::vector

namespace wattmeter {

namespace sources {

/* ----------------------------- Constants ----------------------------- */

/// Default powercap class directory.
inline constexpr const char* POWERCAP_ROOT = "/sys/class/powercap";

/// energy_uj unit in joules.
inline constexpr double MICROJOULES_TO_JOULES = 1e-6;

/* ----------------------------- RaplDomain ----------------------------- */

/**
 * @brief One powercap zone with an energy counter.
 */
struct RaplDomain {
  std::string path{};                 ///< Zone directory, e.g. .../intel-rapl:0
  std::string zone{};                 ///< Directory name, e.g. "intel-rapl:0"
  std::string name{};                 ///< Zone `name`, e.g. "package-0", "dram"
  std::uint64_t maxEnergyRangeUj{0};  ///< Counter wrap range (max_energy_range_uj)

  /// @brief Monitor name, e.g. "rapl:package-0" or "rapl:intel-rapl:0:1".
  [[nodiscard]] std::string monitorName() const;

  /// @brief One-line summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Describe one zone directory.
 * @param path Zone directory.
 * @return Domain, or std::nullopt if it has no energy_uj or no usable wrap range.
 */
[[nodiscard]] std::optional<RaplDomain> readRaplDomain(const std::string& path);

/**
 * @brief Enumerate powercap zones with energy counters.
 * @param root Powercap class directory.
 * @return Zones whose directory name starts with "intel-rapl", sorted by path.
 */
[[nodiscard]] std::vector<RaplDomain> discoverRaplDomains(const std::string& root = POWERCAP_ROOT);

/* ----------------------------- RaplCounter ----------------------------- */

/**
 * @brief Raw energy_uj accessor for one zone.
 *
 * Each read carries a steady_clock timestamp taken right after the file read.
 * Metadata: `domain`, `zone`.
 */
class RaplCounter final : public sampling::EnergyCounter {
public:
  explicit RaplCounter(RaplDomain domain);

  [[nodiscard]] sampling::CounterReadResult readCounter() override;
  [[nodiscard]] sampling::EnergyCounterConfig counterConfig() const noexcept override;
  [[nodiscard]] std::string_view kind() const noexcept override { return "rapl"; }

  [[nodiscard]] const RaplDomain& domain() const noexcept { return domain_; }

private:
  RaplDomain domain_;
  std::string energyPath_;
};

/**
 * @brief Power source for one zone: EnergyCounterAdapter over a RaplCounter.
 * @param domain Zone to sample.
 */
[[nodiscard]] std::unique_ptr<sampling::PowerSource> makeRaplPowerSource(const RaplDomain& domain);

} // namespace sources

} // namespace wattmeter

#endif // WATTMETER_SOURCES_RAPL_COUNTER_HPP
