/**
 * @file SystemLimitsResolver.cpp
 * @brief Container-vs-host limit resolution.
 */

#include "src/system/inc/SystemLimitsResolver.hpp"
#include "src/helpers/inc/Log.hpp"

#include <cmath>
#include <utility>

namespace headroom {

namespace system {

using cgroup::CgroupVersion;
using cgroup::ContainerLimits;

namespace {

inline void applySwap(SystemLimits& limits, const memory::MemorySnapshot& mem) noexcept {
  limits.swapBytes = static_cast<std::int64_t>(mem.swapTotalBytes);
  limits.currentSwapBytes = static_cast<double>(mem.swapUsedBytes);
}

} // namespace

SystemLimitsResolver::SystemLimitsResolver(
    std::shared_ptr<source::Source<cgroup::ContainerLimits>> container,
    std::shared_ptr<source::Source<cpu::CpuSnapshot>> cpu,
    std::shared_ptr<source::Source<memory::MemorySnapshot>> memory)
    : container_(std::move(container)), cpu_(std::move(cpu)), memory_(std::move(memory)) {}

Result<SystemLimits> SystemLimitsResolver::read() { return resolve(nullptr); }

Result<SystemLimits> SystemLimitsResolver::read(const cpu::CpuSnapshot& previous) {
  return resolve(&previous);
}

Result<SystemLimits> SystemLimitsResolver::resolve(const cpu::CpuSnapshot* previous) {
  const auto CONTAINER = container_->read();
  if (CONTAINER.isFailure()) {
    helpers::log::logger()->debug("Container limits unavailable, using host: {}",
                                  CONTAINER.error().toString());
    return fromHost(previous);
  }
  if (CONTAINER.value().cgroupVersion == CgroupVersion::NONE ||
      CONTAINER.value().cgroupVersion == CgroupVersion::UNKNOWN) {
    return fromHost(previous);
  }
  return fromCgroup(CONTAINER.value());
}

Result<SystemLimits> SystemLimitsResolver::fromCgroup(const ContainerLimits& container) {
  const auto MEM = memory_->read();
  if (MEM.isFailure()) {
    return Result<SystemLimits>::failure(MEM.error());
  }
  const memory::MemorySnapshot& mem = MEM.value();

  SystemLimits limits{};
  limits.source = (container.cgroupVersion == CgroupVersion::V2) ? LimitSource::CGROUP_V2
                                                                  : LimitSource::CGROUP_V1;

  const auto CPU_AVAILABLE = container.availableCpuCores();
  const double CPU_LIMIT = CPU_AVAILABLE ? *CPU_AVAILABLE : hostCpuCores();
  limits.cpuCores = static_cast<std::int64_t>(std::ceil(CPU_LIMIT));

  const auto MEM_AVAILABLE = container.availableMemoryBytes();
  limits.memoryBytes = MEM_AVAILABLE ? *MEM_AVAILABLE : static_cast<std::int64_t>(mem.totalBytes);

  limits.currentCpuCores =
      static_cast<std::int64_t>(std::ceil(container.cpuUsageCores.value_or(0.0)));
  limits.currentMemoryBytes = static_cast<double>(container.memoryUsageBytes.value_or(0));
  applySwap(limits, mem);
  return Result<SystemLimits>::success(limits);
}

Result<SystemLimits> SystemLimitsResolver::fromHost(const cpu::CpuSnapshot* previous) {
  const auto CPU = cpu_->read();
  if (CPU.isFailure()) {
    return Result<SystemLimits>::failure(CPU.error());
  }
  const auto MEM = memory_->read();
  if (MEM.isFailure()) {
    return Result<SystemLimits>::failure(MEM.error());
  }
  const cpu::CpuSnapshot& snap = CPU.value();
  const memory::MemorySnapshot& mem = MEM.value();

  SystemLimits limits{};
  limits.source = LimitSource::HOST;
  limits.cpuCores = static_cast<std::int64_t>(snap.coreCount());
  limits.memoryBytes = static_cast<std::int64_t>(mem.totalBytes);
  limits.currentMemoryBytes = static_cast<double>(mem.usedBytes);

  if (previous != nullptr) {
    const cpu::CpuDelta DELTA = cpu::CpuSnapshot::calculateDelta(*previous, snap);
    limits.currentCpuCores = static_cast<std::int64_t>(
        std::ceil(static_cast<double>(snap.coreCount()) * DELTA.usagePercentage() / 100.0));
  }

  applySwap(limits, mem);
  return Result<SystemLimits>::success(limits);
}

double SystemLimitsResolver::hostCpuCores() {
  const auto CPU = cpu_->read();
  if (CPU.isFailure() || CPU.value().coreCount() == 0) {
    return 1.0;
  }
  return static_cast<double>(CPU.value().coreCount());
}

} // namespace system

} // namespace headroom
