/**
 * @file MetricsContext.cpp
 * @brief Source wiring.
 */

#include "src/context/inc/MetricsContext.hpp"
#include "src/cgroup/inc/ContainerSource.hpp"
#include "src/cpu/inc/CpuSource.hpp"
#include "src/environment/inc/EnvironmentSource.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/memory/inc/MemorySource.hpp"
#include "src/network/inc/NetworkSource.hpp"
#include "src/storage/inc/StorageSource.hpp"

#include <utility>

namespace headroom {

namespace context {

MetricsContext::MetricsContext(const support::Config& config,
                               helpers::clock::MonotonicClock clock)
    : reader_(std::make_shared<support::FileReader>(config)),
      runner_(std::make_shared<support::ProcessRunner>(config)) {
  helpers::log::setLevel(config.logLevel);
  buildSources(clock);
}

MetricsContext::MetricsContext(std::shared_ptr<const support::IFileReader> reader,
                               std::shared_ptr<const support::IProcessRunner> runner,
                               helpers::clock::MonotonicClock clock)
    : reader_(std::move(reader)), runner_(std::move(runner)) {
  buildSources(clock);
}

void MetricsContext::buildSources(const helpers::clock::MonotonicClock& clock) {
  container_ = cgroup::createContainerSource(reader_, clock);
  cpu_ = cpu::createCpuSource(reader_, clock);
  memory_ = memory::createMemorySource(reader_);
  uptime_ = system::createUptimeSource(reader_);
  loadAverage_ = system::createLoadAverageSource(reader_);
  network_ = network::createNetworkSource(reader_);
  storage_ = storage::createStorageSource(reader_, runner_);
  systemLimits_ = std::make_unique<system::SystemLimitsResolver>(container_, cpu_, memory_);
  processes_ = process::createProcessSource(reader_, clock);
  environment_ = environment::createEnvironmentSource(reader_);
}

Result<SystemOverview> MetricsContext::overview() {
  auto env = environment_->read();
  if (env.isFailure()) {
    return Result<SystemOverview>::failure(env.error());
  }
  auto limits = systemLimits_->read();
  if (limits.isFailure()) {
    return Result<SystemOverview>::failure(limits.error());
  }
  auto cpuSnap = cpu_->read();
  if (cpuSnap.isFailure()) {
    return Result<SystemOverview>::failure(cpuSnap.error());
  }
  auto mem = memory_->read();
  if (mem.isFailure()) {
    return Result<SystemOverview>::failure(mem.error());
  }
  auto disks = storage_->read();
  if (disks.isFailure()) {
    return Result<SystemOverview>::failure(disks.error());
  }
  auto net = network_->read();
  if (net.isFailure()) {
    return Result<SystemOverview>::failure(net.error());
  }

  SystemOverview out{};
  out.environment = std::move(env).value();
  out.limits = std::move(limits).value();
  out.cpu = std::move(cpuSnap).value();
  out.memory = std::move(mem).value();
  out.storage = std::move(disks).value();
  out.network = std::move(net).value();
  return Result<SystemOverview>::success(std::move(out));
}

process::ProcessTracker MetricsContext::track(pid_t pid, bool includeChildren) const {
  return process::ProcessTracker(processes_, pid, includeChildren);
}

} // namespace context

} // namespace headroom
