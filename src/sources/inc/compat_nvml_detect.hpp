#ifndef WATTMETER_SOURCES_COMPAT_NVML_DETECT_HPP
#define WATTMETER_SOURCES_COMPAT_NVML_DETECT_HPP
/**
 * @file compat_nvml_detect.hpp
 * @brief NVML availability/version guard for the GPU power source.
 *
 * Macros:
 *  - COMPAT_NVML_AVAILABLE    : 1 if the build found and links NVML, else 0
 *  - COMPAT_NVML_API_VERSION  : NVML_API_VERSION if provided by the header, else 0
 *
 * Notes:
 *  - The build system sets availability from its NVML lookup:
 *      -DCOMPAT_NVML_AVAILABLE=1   or   -DCOMPAT_NVML_AVAILABLE=0
 *    Left undefined, NVML support is compiled out.
 *  - This header does not link or initialize NVML.
 */

/* ---------------------- Availability ---------------------------- */
#ifndef COMPAT_NVML_AVAILABLE
#define COMPAT_NVML_AVAILABLE 0
#endif

/* ---------------------- Header Import + Version -------------------------- */
#if COMPAT_NVML_AVAILABLE
#include <nvml.h>
#ifdef NVML_API_VERSION
#define COMPAT_NVML_API_VERSION NVML_API_VERSION
#else
#define COMPAT_NVML_API_VERSION 0
#endif
#else
#define COMPAT_NVML_API_VERSION 0
#endif

/* --------------------- Compatibility Shims (Macros) ----------------------- */
#if COMPAT_NVML_AVAILABLE

// Older headers lack the v2 name buffer constant.
#ifndef NVML_DEVICE_NAME_V2_BUFFER_SIZE
#define NVML_DEVICE_NAME_V2_BUFFER_SIZE 96
#endif

#endif // COMPAT_NVML_AVAILABLE

/* --------------------------- Convenience Helpers -------------------------- */
namespace wattmeter {

namespace sources {

namespace compat_nvml {

/// @brief True if this build can talk to NVML.
inline constexpr bool available() noexcept { return COMPAT_NVML_AVAILABLE != 0; }

/// @brief NVML API version the build was compiled against (0 if none).
inline constexpr int apiVersion() noexcept { return COMPAT_NVML_API_VERSION; }

} // namespace compat_nvml

} // namespace sources

} // namespace wattmeter

#endif // WATTMETER_SOURCES_COMPAT_NVML_DETECT_HPP
