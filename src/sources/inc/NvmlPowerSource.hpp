#ifndef WATTMETER_SOURCES_NVML_POWER_SOURCE_HPP
#define WATTMETER_SOURCES_NVML_POWER_SOURCE_HPP
/**
 * @file NvmlPowerSource.hpp
 * @brief NVIDIA GPU board power via NVML.
 * @note Built without NVML (COMPAT_NVML_AVAILABLE == 0), every read reports
 *       PERMANENT and discovery finds no devices.
 */

#include "src/sampling/inc/PowerSource.hpp"

#include <memory>      // std::unique_ptr
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace wattmeter {

namespace sources {

/* ----------------------------- NvmlDeviceInfo ----------------------------- */

/**
 * @brief Identity of one NVML device for discovery listings.
 */
struct NvmlDeviceInfo {
  unsigned int index{0};          ///< NVML device index
  std::string name{};             ///< Product name
  double powerLimitWatts{0.0};    ///< Enforced power limit (0 if unknown)

  /// @brief Monitor name, e.g. "nvml:0".
  [[nodiscard]] std::string monitorName() const;

  /// @brief One-line summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/// @brief Number of NVML devices; 0 if NVML is absent or fails to initialize.
[[nodiscard]] unsigned int countNvmlDevices() noexcept;

/// @brief Describe every NVML device; empty if NVML is absent.
[[nodiscard]] std::vector<NvmlDeviceInfo> listNvmlDevices();

/* ----------------------------- NvmlPowerSource ----------------------------- */

/**
 * @brief PowerSource reading nvmlDeviceGetPowerUsage for one GPU.
 *
 * Holds an NVML session for its lifetime; the device handle is resolved once
 * at construction. Metadata: `device_index`, `device_name`, and when the
 * queries succeed `temperature_c`, `gpu_utilization_pct`,
 * `memory_utilization_pct`, `sm_clock_mhz`.
 *
 * NVML error mapping: NOT_SUPPORTED, NO_PERMISSION, NOT_FOUND, GPU_IS_LOST,
 * UNINITIALIZED, INVALID_ARGUMENT, LIBRARY_NOT_FOUND, and DRIVER_NOT_LOADED
 * are PERMANENT; everything else is TRANSIENT.
 */
class NvmlPowerSource final : public sampling::PowerSource {
public:
  explicit NvmlPowerSource(unsigned int deviceIndex);
  ~NvmlPowerSource() override;

  [[nodiscard]] sampling::SampleResult read() override;
  [[nodiscard]] std::string_view kind() const noexcept override { return "nvml"; }

  [[nodiscard]] unsigned int deviceIndex() const noexcept { return deviceIndex_; }

  /// @brief True if the session and device handle are usable.
  [[nodiscard]] bool isAvailable() const noexcept;

  /// @brief Why the source is unusable; empty when available.
  [[nodiscard]] const std::string& initError() const noexcept { return initError_; }

private:
  struct Impl;

  unsigned int deviceIndex_;
  std::unique_ptr<Impl> impl_;
  std::string initError_{};
};

} // namespace sources

} // namespace wattmeter

#endif // WATTMETER_SOURCES_NVML_POWER_SOURCE_HPP
