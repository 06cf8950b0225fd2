#ifndef HEADROOM_CONTEXT_METRICS_CONTEXT_HPP
#define HEADROOM_CONTEXT_METRICS_CONTEXT_HPP
/**
 * @file MetricsContext.hpp
 * @brief Owner of the readers and every metric source of one application.
 * @note NOT thread-safe. Sources hold caches (cgroup version, paths, rates).
 *
 * Construct one context per application (or per test) and pass it, or the
 * sources it exposes, to whatever needs them. Independent contexts share no
 * state.
 *
 * Usage:
 * @code
 *   headroom::context::MetricsContext ctx(headroom::support::Config::fromEnvironment());
 *   auto limits = ctx.systemLimits().read();
 *   if (limits) {
 *     fmt::print("{}", limits.value().toString());
 *   }
 * @endcode
 */

#include "src/cgroup/inc/ContainerLimits.hpp"
#include "src/context/inc/SystemOverview.hpp"
#include "src/cpu/inc/CpuSnapshot.hpp"
#include "src/environment/inc/EnvironmentSnapshot.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Result.hpp"
#include "src/memory/inc/MemorySnapshot.hpp"
#include "src/network/inc/NetworkSnapshot.hpp"
#include "src/process/inc/ProcessSource.hpp"
#include "src/process/inc/ProcessTracker.hpp"
#include "src/source/inc/Source.hpp"
#include "src/storage/inc/StorageSnapshot.hpp"
#include "src/support/inc/Config.hpp"
#include "src/support/inc/FileReader.hpp"
#include "src/support/inc/ProcessRunner.hpp"
#include "src/system/inc/LoadAverage.hpp"
#include "src/system/inc/SystemLimitsResolver.hpp"
#include "src/system/inc/Uptime.hpp"

#include <sys/types.h> // pid_t

#include <memory>

namespace headroom {

namespace context {

class MetricsContext {
public:
  /// POSIX readers configured by @p config; applies config.logLevel.
  explicit MetricsContext(const support::Config& config,
                          helpers::clock::MonotonicClock clock = {});

  /// Caller-supplied readers (tests, alternate roots).
  MetricsContext(std::shared_ptr<const support::IFileReader> reader,
                 std::shared_ptr<const support::IProcessRunner> runner,
                 helpers::clock::MonotonicClock clock = {});

  MetricsContext(const MetricsContext&) = delete;
  MetricsContext& operator=(const MetricsContext&) = delete;

  [[nodiscard]] const std::shared_ptr<const support::IFileReader>& fileReader() const noexcept {
    return reader_;
  }
  [[nodiscard]] const std::shared_ptr<const support::IProcessRunner>&
  processRunner() const noexcept {
    return runner_;
  }

  /* --- Sources --- */

  [[nodiscard]] source::Source<cgroup::ContainerLimits>& container() noexcept {
    return *container_;
  }
  [[nodiscard]] source::Source<headroom::cpu::CpuSnapshot>& cpu() noexcept { return *cpu_; }
  [[nodiscard]] source::Source<headroom::memory::MemorySnapshot>& memory() noexcept {
    return *memory_;
  }
  [[nodiscard]] source::Source<system::UptimeSnapshot>& uptime() noexcept { return *uptime_; }
  [[nodiscard]] source::Source<system::LoadAverageSnapshot>& loadAverage() noexcept {
    return *loadAverage_;
  }
  [[nodiscard]] source::Source<headroom::network::NetworkSnapshot>& network() noexcept {
    return *network_;
  }
  [[nodiscard]] source::Source<headroom::storage::StorageSnapshot>& storage() noexcept {
    return *storage_;
  }
  [[nodiscard]] system::SystemLimitsResolver& systemLimits() noexcept { return *systemLimits_; }
  [[nodiscard]] process::IProcessSource& processes() noexcept { return *processes_; }
  [[nodiscard]] source::Source<headroom::environment::EnvironmentSnapshot>& environment() noexcept {
    return *environment_;
  }

  /**
   * @brief Read environment, limits, CPU, memory, storage and network in turn.
   * @return The overview, or the first family's failure unchanged.
   */
  [[nodiscard]] Result<SystemOverview> overview();

  /// New idle tracker for @p pid sharing this context's process source.
  [[nodiscard]] process::ProcessTracker track(pid_t pid, bool includeChildren = false) const;

private:
  void buildSources(const helpers::clock::MonotonicClock& clock);

  std::shared_ptr<const support::IFileReader> reader_;
  std::shared_ptr<const support::IProcessRunner> runner_;

  std::shared_ptr<source::Source<cgroup::ContainerLimits>> container_;
  std::shared_ptr<source::Source<cpu::CpuSnapshot>> cpu_;
  std::shared_ptr<source::Source<memory::MemorySnapshot>> memory_;
  std::unique_ptr<source::Source<system::UptimeSnapshot>> uptime_;
  std::unique_ptr<source::Source<system::LoadAverageSnapshot>> loadAverage_;
  std::unique_ptr<source::Source<network::NetworkSnapshot>> network_;
  std::unique_ptr<source::Source<storage::StorageSnapshot>> storage_;
  std::unique_ptr<system::SystemLimitsResolver> systemLimits_;
  std::shared_ptr<process::IProcessSource> processes_;
  std::unique_ptr<source::Source<environment::EnvironmentSnapshot>> environment_;
};

} // namespace context

} // namespace headroom

#endif // HEADROOM_CONTEXT_METRICS_CONTEXT_HPP
