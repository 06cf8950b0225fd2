/**
 * @file SystemLimits.cpp
 * @brief SystemLimits derived accessors.
 */

#include "src/system/inc/SystemLimits.hpp"
#include "src/helpers/inc/Format.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace headroom {

namespace system {

using headroom::helpers::format::bytesBinarySigned;

/* ----------------------------- LimitSource ----------------------------- */

const char* toString(LimitSource source) noexcept {
  switch (source) {
  case LimitSource::HOST:
    return "host";
  case LimitSource::CGROUP_V1:
    return "cgroup_v1";
  case LimitSource::CGROUP_V2:
    return "cgroup_v2";
  }
  return "unknown";
}

/* ----------------------------- SystemLimits ----------------------------- */

std::int64_t SystemLimits::availableCpuCores() const noexcept {
  return std::max<std::int64_t>(0, cpuCores - currentCpuCores);
}

std::int64_t SystemLimits::availableMemoryBytes() const noexcept {
  const auto AVAILABLE =
      static_cast<std::int64_t>(static_cast<double>(memoryBytes) - currentMemoryBytes);
  return std::max<std::int64_t>(0, AVAILABLE);
}

double SystemLimits::cpuUtilization() const noexcept {
  if (cpuCores == 0) {
    return 0.0;
  }
  return static_cast<double>(currentCpuCores) / static_cast<double>(cpuCores) * 100.0;
}

double SystemLimits::memoryUtilization() const noexcept {
  if (memoryBytes == 0) {
    return 0.0;
  }
  return currentMemoryBytes / static_cast<double>(memoryBytes) * 100.0;
}

std::optional<double> SystemLimits::swapUtilization() const noexcept {
  if (!swapBytes || !currentSwapBytes) {
    return std::nullopt;
  }
  if (*swapBytes == 0) {
    return 0.0;
  }
  return *currentSwapBytes / static_cast<double>(*swapBytes) * 100.0;
}

double SystemLimits::cpuHeadroom() const noexcept {
  return std::max(0.0, 100.0 - cpuUtilization());
}

double SystemLimits::memoryHeadroom() const noexcept {
  return std::max(0.0, 100.0 - memoryUtilization());
}

bool SystemLimits::canScaleCpu(std::int64_t additionalCores) const noexcept {
  return currentCpuCores + additionalCores <= cpuCores;
}

bool SystemLimits::canScaleMemory(std::int64_t additionalBytes) const noexcept {
  return currentMemoryBytes + static_cast<double>(additionalBytes) <=
         static_cast<double>(memoryBytes);
}

bool SystemLimits::isCpuPressure(double thresholdPercent) const noexcept {
  return cpuUtilization() >= thresholdPercent;
}

bool SystemLimits::isMemoryPressure(double thresholdPercent) const noexcept {
  return memoryUtilization() >= thresholdPercent;
}

std::string SystemLimits::toString() const {
  std::string out;
  out += fmt::format("Source:   {}\n", system::toString(source));
  out += fmt::format("CPU:      {} / {} cores ({:.1f}% used, {:.1f}% headroom)\n", currentCpuCores,
                     cpuCores, cpuUtilization(), cpuHeadroom());
  out += fmt::format("Memory:   {} / {} ({:.1f}% used, {:.1f}% headroom)\n",
                     bytesBinarySigned(static_cast<std::int64_t>(currentMemoryBytes)),
                     bytesBinarySigned(memoryBytes), memoryUtilization(), memoryHeadroom());
  const auto SWAP = swapUtilization();
  if (SWAP && swapBytes && *swapBytes > 0) {
    out += fmt::format("Swap:     {} / {} ({:.1f}%)\n",
                       bytesBinarySigned(static_cast<std::int64_t>(currentSwapBytes.value_or(0.0))),
                       bytesBinarySigned(*swapBytes), *SWAP);
  } else {
    out += "Swap:     none\n";
  }
  return out;
}

} // namespace system

} // namespace headroom
