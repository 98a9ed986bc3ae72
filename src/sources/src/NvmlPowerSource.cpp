/**
 * @file NvmlPowerSource.cpp
 * @brief NVML session handling and per-tick power queries.
 */

#include "src/sources/inc/NvmlPowerSource.hpp"
#include "src/sources/inc/compat_nvml_detect.hpp"

#include <array>   // std::array
#include <cstdint> // std::int64_t
#include <utility> // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace wattmeter {

namespace sources {

using sampling::SampleResult;
using sampling::SourceError;

namespace {

#if COMPAT_NVML_AVAILABLE

/// RAII NVML init/shutdown. NVML reference-counts nested sessions.
class NvmlSession {
public:
  NvmlSession() noexcept : status_(nvmlInit_v2()) {}
  ~NvmlSession() {
    if (valid())
      nvmlShutdown();
  }

  [[nodiscard]] bool valid() const noexcept { return status_ == NVML_SUCCESS; }
  [[nodiscard]] nvmlReturn_t status() const noexcept { return status_; }

  NvmlSession(const NvmlSession&) = delete;
  NvmlSession& operator=(const NvmlSession&) = delete;

private:
  nvmlReturn_t status_;
};

/// Map an NVML return code onto a SourceError.
SourceError classifyNvmlError(nvmlReturn_t code) noexcept {
  switch (code) {
  case NVML_SUCCESS:
    return SourceError::NONE;
  case NVML_ERROR_UNINITIALIZED:
  case NVML_ERROR_INVALID_ARGUMENT:
  case NVML_ERROR_NOT_SUPPORTED:
  case NVML_ERROR_NO_PERMISSION:
  case NVML_ERROR_NOT_FOUND:
  case NVML_ERROR_GPU_IS_LOST:
  case NVML_ERROR_LIBRARY_NOT_FOUND:
  case NVML_ERROR_DRIVER_NOT_LOADED:
    return SourceError::PERMANENT;
  default:
    return SourceError::TRANSIENT;
  }
}

/// Device name; empty on failure.
std::string deviceName(nvmlDevice_t device) {
  std::array<char, NVML_DEVICE_NAME_V2_BUFFER_SIZE> name{};
  if (nvmlDeviceGetName(device, name.data(), static_cast<unsigned int>(name.size())) !=
      NVML_SUCCESS) {
    return {};
  }
  return std::string(name.data());
}

#endif // COMPAT_NVML_AVAILABLE

} // namespace

/* ----------------------------- NvmlDeviceInfo ----------------------------- */

std::string NvmlDeviceInfo::monitorName() const { return fmt::format("nvml:{}", index); }

std::string NvmlDeviceInfo::toString() const {
  if (powerLimitWatts > 0.0) {
    return fmt::format("GPU {}  {:<32} limit {:.1f} W", index, name.empty() ? "-" : name,
                       powerLimitWatts);
  }
  return fmt::format("GPU {}  {}", index, name.empty() ? "-" : name);
}

/* ----------------------------- API ----------------------------- */

unsigned int countNvmlDevices() noexcept {
  unsigned int count = 0;
#if COMPAT_NVML_AVAILABLE
  NvmlSession session;
  if (!session.valid()) {
    return 0;
  }
  if (nvmlDeviceGetCount_v2(&count) != NVML_SUCCESS) {
    return 0;
  }
#endif
  return count;
}

std::vector<NvmlDeviceInfo> listNvmlDevices() {
  std::vector<NvmlDeviceInfo> out;
#if COMPAT_NVML_AVAILABLE
  NvmlSession session;
  if (!session.valid()) {
    spdlog::debug("NVML init failed: {}", nvmlErrorString(session.status()));
    return out;
  }

  unsigned int count = 0;
  if (nvmlDeviceGetCount_v2(&count) != NVML_SUCCESS) {
    return out;
  }

  for (unsigned int i = 0; i < count; ++i) {
    nvmlDevice_t device{};
    if (nvmlDeviceGetHandleByIndex_v2(i, &device) != NVML_SUCCESS) {
      continue;
    }
    NvmlDeviceInfo info{};
    info.index = i;
    info.name = deviceName(device);
    unsigned int limit = 0;
    if (nvmlDeviceGetEnforcedPowerLimit(device, &limit) == NVML_SUCCESS) {
      info.powerLimitWatts = static_cast<double>(limit) / 1000.0;
    }
    out.push_back(std::move(info));
  }
#endif
  return out;
}

/* ----------------------------- NvmlPowerSource ----------------------------- */

#if COMPAT_NVML_AVAILABLE

struct NvmlPowerSource::Impl {
  NvmlSession session{};
  nvmlDevice_t device{};
  bool haveDevice{false};
  std::string name{};
};

NvmlPowerSource::NvmlPowerSource(unsigned int deviceIndex)
    : deviceIndex_(deviceIndex), impl_(std::make_unique<Impl>()) {
  if (!impl_->session.valid()) {
    initError_ = fmt::format("NVML init failed: {}", nvmlErrorString(impl_->session.status()));
    spdlog::warn("nvml:{}: {}", deviceIndex_, initError_);
    return;
  }

  const nvmlReturn_t RC = nvmlDeviceGetHandleByIndex_v2(deviceIndex_, &impl_->device);
  if (RC != NVML_SUCCESS) {
    initError_ = fmt::format("no NVML device {}: {}", deviceIndex_, nvmlErrorString(RC));
    spdlog::warn("nvml:{}: {}", deviceIndex_, initError_);
    return;
  }

  impl_->haveDevice = true;
  impl_->name = deviceName(impl_->device);
  spdlog::debug("nvml:{}: using '{}'", deviceIndex_, impl_->name);
}

NvmlPowerSource::~NvmlPowerSource() = default;

bool NvmlPowerSource::isAvailable() const noexcept { return impl_->haveDevice; }

SampleResult NvmlPowerSource::read() {
  if (!impl_->haveDevice) {
    return SampleResult::failure(SourceError::PERMANENT, initError_);
  }

  unsigned int milliwatts = 0;
  const nvmlReturn_t RC = nvmlDeviceGetPowerUsage(impl_->device, &milliwatts);
  if (RC != NVML_SUCCESS) {
    return SampleResult::failure(classifyNvmlError(RC),
                                 fmt::format("nvmlDeviceGetPowerUsage: {}", nvmlErrorString(RC)));
  }

  sampling::Metadata metadata{};
  metadata["device_index"] = static_cast<std::int64_t>(deviceIndex_);
  metadata["device_name"] = impl_->name;

#if COMPAT_NVML_API_VERSION >= 13
  nvmlTemperature_t tempQuery{};
  tempQuery.version = nvmlTemperature_v1;
  tempQuery.sensorType = NVML_TEMPERATURE_GPU;
  if (nvmlDeviceGetTemperatureV(impl_->device, &tempQuery) == NVML_SUCCESS) {
    metadata["temperature_c"] = static_cast<double>(tempQuery.temperature);
  }
#else
  unsigned int temp = 0;
  if (nvmlDeviceGetTemperature(impl_->device, NVML_TEMPERATURE_GPU, &temp) == NVML_SUCCESS) {
    metadata["temperature_c"] = static_cast<double>(temp);
  }
#endif

  nvmlUtilization_t util{};
  if (nvmlDeviceGetUtilizationRates(impl_->device, &util) == NVML_SUCCESS) {
    metadata["gpu_utilization_pct"] = static_cast<double>(util.gpu);
    metadata["memory_utilization_pct"] = static_cast<double>(util.memory);
  }

  unsigned int clock = 0;
  if (nvmlDeviceGetClockInfo(impl_->device, NVML_CLOCK_SM, &clock) == NVML_SUCCESS) {
    metadata["sm_clock_mhz"] = static_cast<std::int64_t>(clock);
  }

  return SampleResult::success(static_cast<double>(milliwatts) / 1000.0, std::move(metadata));
}

#else // !COMPAT_NVML_AVAILABLE

struct NvmlPowerSource::Impl {};

NvmlPowerSource::NvmlPowerSource(unsigned int deviceIndex)
    : deviceIndex_(deviceIndex), impl_(std::make_unique<Impl>()),
      initError_("NVML support not compiled in") {
  spdlog::warn("nvml:{}: {}", deviceIndex_, initError_);
}

NvmlPowerSource::~NvmlPowerSource() = default;

bool NvmlPowerSource::isAvailable() const noexcept { return false; }

SampleResult NvmlPowerSource::read() {
  return SampleResult::failure(SourceError::PERMANENT, initError_);
}

#endif // COMPAT_NVML_AVAILABLE

} // namespace sources

} // namespace wattmeter
