#ifndef HEADROOM_SYSTEM_SYSTEM_LIMITS_RESOLVER_HPP
#define HEADROOM_SYSTEM_SYSTEM_LIMITS_RESOLVER_HPP
/**
 * @file SystemLimitsResolver.hpp
 * @brief Decides between container and host limits and builds SystemLimits.
 *
 * Decision:
 *  1. Read container limits once.
 *  2. cgroup detected: cgroup limits where present, host figures otherwise.
 *  3. No cgroup: host core count and memory totals.
 *
 * A single CPU snapshot cannot express a rate, so the host path reports
 * currentCpuCores = 0 unless the caller passes an earlier snapshot to
 * read(previous).
 */

#include "src/cgroup/inc/ContainerLimits.hpp"
#include "src/cpu/inc/CpuSnapshot.hpp"
#include "src/helpers/inc/Result.hpp"
#include "src/memory/inc/MemorySnapshot.hpp"
#include "src/source/inc/Source.hpp"
#include "src/system/inc/SystemLimits.hpp"

#include <memory>

namespace headroom {

namespace system {

class SystemLimitsResolver final : public source::Source<SystemLimits> {
public:
  SystemLimitsResolver(std::shared_ptr<source::Source<cgroup::ContainerLimits>> container,
                       std::shared_ptr<source::Source<cpu::CpuSnapshot>> cpu,
                       std::shared_ptr<source::Source<memory::MemorySnapshot>> memory);

  /**
   * @brief Resolve limits; host CPU usage is reported as 0.
   * @return Limits, or the failure of the memory source (or of the CPU source
   *         on the host path).
   */
  [[nodiscard]] Result<SystemLimits> read() override;

  /**
   * @brief Resolve limits, deriving host CPU usage from @p previous.
   *
   * Host path: currentCpuCores = ceil(coreCount * usage% / 100) over the
   * interval from @p previous to a fresh snapshot. The cgroup path ignores
   * @p previous.
   */
  [[nodiscard]] Result<SystemLimits> read(const cpu::CpuSnapshot& previous);

  [[nodiscard]] const char* name() const noexcept override { return "system-limits"; }

private:
  [[nodiscard]] Result<SystemLimits> resolve(const cpu::CpuSnapshot* previous);
  [[nodiscard]] Result<SystemLimits> fromCgroup(const cgroup::ContainerLimits& container);
  [[nodiscard]] Result<SystemLimits> fromHost(const cpu::CpuSnapshot* previous);
  [[nodiscard]] double hostCpuCores();

  std::shared_ptr<source::Source<cgroup::ContainerLimits>> container_;
  std::shared_ptr<source::Source<cpu::CpuSnapshot>> cpu_;
  std::shared_ptr<source::Source<memory::MemorySnapshot>> memory_;
};

} // namespace system

} // namespace headroom

#endif // HEADROOM_SYSTEM_SYSTEM_LIMITS_RESOLVER_HPP
