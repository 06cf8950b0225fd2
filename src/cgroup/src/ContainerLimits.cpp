/**
 * @file ContainerLimits.cpp
 * @brief ContainerLimits accessors and formatting.
 */

#include "src/cgroup/inc/ContainerLimits.hpp"
#include "src/helpers/inc/Format.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace headroom {

namespace cgroup {

using headroom::helpers::format::optionalBytes;
using headroom::helpers::format::optionalCount;
using headroom::helpers::format::optionalFixed;

/* ----------------------------- CgroupVersion toString ----------------------------- */

const char* toString(CgroupVersion version) noexcept {
  switch (version) {
  case CgroupVersion::NONE:
    return "none";
  case CgroupVersion::V1:
    return "v1";
  case CgroupVersion::V2:
    return "v2";
  case CgroupVersion::UNKNOWN:
  default:
    return "unknown";
  }
}

/* ----------------------------- ContainerLimits Methods ----------------------------- */

std::optional<double> ContainerLimits::cpuUtilizationPercentage() const noexcept {
  if (!cpuQuotaCores || !cpuUsageCores || *cpuQuotaCores <= 0.0) {
    return std::nullopt;
  }
  return std::min(100.0, (*cpuUsageCores / *cpuQuotaCores) * 100.0);
}

std::optional<double> ContainerLimits::memoryUtilizationPercentage() const noexcept {
  if (!memoryLimitBytes || !memoryUsageBytes || *memoryLimitBytes <= 0) {
    return std::nullopt;
  }
  const double RATIO =
      static_cast<double>(*memoryUsageBytes) / static_cast<double>(*memoryLimitBytes);
  return std::min(100.0, RATIO * 100.0);
}

std::optional<double> ContainerLimits::availableCpuCores() const noexcept {
  if (!cpuQuotaCores || !cpuUsageCores) {
    return std::nullopt;
  }
  return std::max(0.0, *cpuQuotaCores - *cpuUsageCores);
}

std::optional<std::int64_t> ContainerLimits::availableMemoryBytes() const noexcept {
  if (!memoryLimitBytes || !memoryUsageBytes) {
    return std::nullopt;
  }
  return std::max<std::int64_t>(0, *memoryLimitBytes - *memoryUsageBytes);
}

bool ContainerLimits::isCpuThrottled() const noexcept {
  return cpuThrottledCount.has_value() && *cpuThrottledCount > 0;
}

bool ContainerLimits::hasOomKills() const noexcept {
  return oomKillCount.has_value() && *oomKillCount > 0;
}

std::string ContainerLimits::toString() const {
  std::string out;
  out.reserve(384);

  out += "Container Limits:\n";
  out += fmt::format("  cgroup:       {}\n", cgroup::toString(cgroupVersion));

  out += "  CPU:\n";
  out += fmt::format("    Quota:      {}\n",
                     hasCpuLimit() ? fmt::format("{:.2f} cores", *cpuQuotaCores) : "unlimited");
  out += fmt::format("    Usage:      {}\n", optionalFixed(cpuUsageCores));
  out += fmt::format("    Throttled:  {}\n", optionalCount(cpuThrottledCount));

  out += "  Memory:\n";
  out += fmt::format("    Limit:      {}\n", optionalBytes(memoryLimitBytes));
  out += fmt::format("    Usage:      {}\n",
                     memoryUsageBytes ? optionalBytes(memoryUsageBytes) : std::string("n/a"));
  out += fmt::format("    OOM kills:  {}\n", optionalCount(oomKillCount));

  const auto CPU_PCT = cpuUtilizationPercentage();
  const auto MEM_PCT = memoryUtilizationPercentage();
  if (CPU_PCT || MEM_PCT) {
    out += fmt::format("  Utilization:  cpu {}%, memory {}%\n", optionalFixed(CPU_PCT),
                       optionalFixed(MEM_PCT));
  }

  return out;
}

} // namespace cgroup

} // namespace headroom
