#ifndef WATTMETER_SOURCES_HWMON_POWER_SOURCE_HPP
#define WATTMETER_SOURCES_HWMON_POWER_SOURCE_HPP
/**
 * @file HwmonPowerSource.hpp
 * @brief Instantaneous power from hwmon power1_average / power1_input.
 * @note Linux-only. amdgpu and some board power monitors expose power this
 *       way. Values are microwatts.
 */

#include "src/sampling/inc/PowerSource.hpp"

#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace wattmeter {

namespace sources {

/* ----------------------------- Constants ----------------------------- */

/// Default hwmon class directory.
inline constexpr const char* HWMON_ROOT = "/sys/class/hwmon";

/// power*_* unit in watts.
inline constexpr double MICROWATTS_TO_WATTS = 1e-6;

/* ----------------------------- HwmonPowerSensor ----------------------------- */

/**
 * @brief One hwmon device with a power attribute.
 */
struct HwmonPowerSensor {
  std::string path{};      ///< Device directory, e.g. .../hwmon3
  std::string device{};    ///< Directory name, e.g. "hwmon3"
  std::string name{};      ///< Chip `name`, e.g. "amdgpu"
  std::string powerFile{}; ///< "power1_average" if present, else "power1_input"

  /// @brief Monitor name, e.g. "hwmon:amdgpu" or "hwmon:hwmon3".
  [[nodiscard]] std::string monitorName() const;

  /// @brief One-line summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Describe one hwmon device directory.
 * @return Sensor, or std::nullopt if it has neither power1_average nor power1_input.
 */
[[nodiscard]] std::optional<HwmonPowerSensor> readHwmonPowerSensor(const std::string& path);

/**
 * @brief Enumerate hwmon devices that report power.
 * @param root hwmon class directory.
 * @return Sensors sorted by path.
 */
[[nodiscard]] std::vector<HwmonPowerSensor>
discoverHwmonPowerSensors(const std::string& root = HWMON_ROOT);

/* ----------------------------- HwmonPowerSource ----------------------------- */

/**
 * @brief PowerSource reading one hwmon power attribute per tick.
 *
 * Metadata: `sensor`, and when readable `temperature_c` (temp1_input) and
 * `frequency_mhz` (freq1_input).
 */
class HwmonPowerSource final : public sampling::PowerSource {
public:
  explicit HwmonPowerSource(HwmonPowerSensor sensor);

  [[nodiscard]] sampling::SampleResult read() override;
  [[nodiscard]] std::string_view kind() const noexcept override { return "hwmon"; }

  [[nodiscard]] const HwmonPowerSensor& sensor() const noexcept { return sensor_; }

private:
  HwmonPowerSensor sensor_;
  std::string powerPath_;
  std::string tempPath_;
  std::string freqPath_;
};

} // namespace sources

} // namespace wattmeter

#endif // WATTMETER_SOURCES_HWMON_POWER_SOURCE_HPP
