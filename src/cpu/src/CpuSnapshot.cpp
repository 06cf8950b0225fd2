/**
 * @file CpuSnapshot.cpp
 * @brief CPU snapshot analysis and delta computation.
 */

#include "src/cpu/inc/CpuSnapshot.hpp"
#include "src/helpers/inc/Clock.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/core.h>

namespace headroom {

namespace cpu {

namespace {

/// 100 * part / whole, 0 when whole is 0.
inline double sharePercent(std::uint64_t part, std::uint64_t whole) noexcept {
  if (whole == 0) {
    return 0.0;
  }
  return static_cast<double>(part) * 100.0 / static_cast<double>(whole);
}

/// max(0, a - b) for unsigned counters.
inline std::uint64_t clampedSub(std::uint64_t after, std::uint64_t before) noexcept {
  return (after >= before) ? (after - before) : 0;
}

} // namespace

/* ----------------------------- CpuTimes ----------------------------- */

std::uint64_t CpuTimes::total() const noexcept {
  return user + nice + system + idle + iowait + irq + softirq + steal;
}

std::uint64_t CpuTimes::busy() const noexcept { return clampedSub(total(), idle + iowait); }

CpuTimes CpuTimes::clampedDifference(const CpuTimes& before, const CpuTimes& after) noexcept {
  CpuTimes d{};
  d.user = clampedSub(after.user, before.user);
  d.nice = clampedSub(after.nice, before.nice);
  d.system = clampedSub(after.system, before.system);
  d.idle = clampedSub(after.idle, before.idle);
  d.iowait = clampedSub(after.iowait, before.iowait);
  d.irq = clampedSub(after.irq, before.irq);
  d.softirq = clampedSub(after.softirq, before.softirq);
  d.steal = clampedSub(after.steal, before.steal);
  return d;
}

double CpuCoreTimes::busyPercentage() const noexcept {
  return sharePercent(times.busy(), times.total());
}

/* ----------------------------- CpuDelta ----------------------------- */

double CpuCoreDelta::usagePercentage() const noexcept {
  return sharePercent(delta.busy(), delta.total());
}

double CpuDelta::usagePercentage() const noexcept {
  if (durationSeconds <= 0.0 || perCoreDelta.empty()) {
    return 0.0;
  }
  return sharePercent(totalDelta.busy(), totalDelta.total());
}

double CpuDelta::usagePercentagePerCore() const noexcept {
  if (perCoreDelta.empty()) {
    return 0.0;
  }
  return usagePercentage() / static_cast<double>(perCoreDelta.size());
}

double CpuDelta::userPercentage() const noexcept {
  return (durationSeconds <= 0.0) ? 0.0 : sharePercent(totalDelta.user, totalDelta.total());
}

double CpuDelta::systemPercentage() const noexcept {
  return (durationSeconds <= 0.0) ? 0.0 : sharePercent(totalDelta.system, totalDelta.total());
}

double CpuDelta::idlePercentage() const noexcept {
  return (durationSeconds <= 0.0) ? 0.0 : sharePercent(totalDelta.idle, totalDelta.total());
}

double CpuDelta::iowaitPercentage() const noexcept {
  return (durationSeconds <= 0.0) ? 0.0 : sharePercent(totalDelta.iowait, totalDelta.total());
}

std::optional<double> CpuDelta::coreUsagePercentage(std::size_t coreIndex) const noexcept {
  for (const CpuCoreDelta& core : perCoreDelta) {
    if (core.coreIndex == coreIndex) {
      return core.usagePercentage();
    }
  }
  return std::nullopt;
}

const CpuCoreDelta* CpuDelta::busiestCore() const noexcept {
  const auto IT = std::max_element(
      perCoreDelta.begin(), perCoreDelta.end(), [](const CpuCoreDelta& a, const CpuCoreDelta& b) {
        return a.usagePercentage() < b.usagePercentage();
      });
  return (IT == perCoreDelta.end()) ? nullptr : &*IT;
}

const CpuCoreDelta* CpuDelta::idlestCore() const noexcept {
  const auto IT = std::min_element(
      perCoreDelta.begin(), perCoreDelta.end(), [](const CpuCoreDelta& a, const CpuCoreDelta& b) {
        return a.usagePercentage() < b.usagePercentage();
      });
  return (IT == perCoreDelta.end()) ? nullptr : &*IT;
}

std::string CpuDelta::toString() const {
  std::string out;
  out += fmt::format("Interval: {:.3f} s\n", durationSeconds);
  out += fmt::format("Usage: {:.1f}% (user={:.1f}% sys={:.1f}% idle={:.1f}% iowait={:.1f}%)\n",
                     usagePercentage(), userPercentage(), systemPercentage(), idlePercentage(),
                     iowaitPercentage());
  for (const CpuCoreDelta& core : perCoreDelta) {
    out += fmt::format("  cpu{}: {:.1f}%\n", core.coreIndex, core.usagePercentage());
  }
  return out;
}

/* ----------------------------- CpuSnapshot ----------------------------- */

const CpuCoreTimes* CpuSnapshot::findCore(std::size_t coreIndex) const noexcept {
  for (const CpuCoreTimes& core : perCore) {
    if (core.coreIndex == coreIndex) {
      return &core;
    }
  }
  return nullptr;
}

std::vector<CpuCoreTimes> CpuSnapshot::findBusyCores(double thresholdPercent) const {
  std::vector<CpuCoreTimes> out;
  std::copy_if(perCore.begin(), perCore.end(), std::back_inserter(out),
               [=](const CpuCoreTimes& c) { return c.busyPercentage() >= thresholdPercent; });
  return out;
}

std::vector<CpuCoreTimes> CpuSnapshot::findIdleCores(double thresholdPercent) const {
  std::vector<CpuCoreTimes> out;
  std::copy_if(perCore.begin(), perCore.end(), std::back_inserter(out),
               [=](const CpuCoreTimes& c) { return c.busyPercentage() < thresholdPercent; });
  return out;
}

const CpuCoreTimes* CpuSnapshot::busiestCore() const noexcept {
  const auto IT = std::max_element(
      perCore.begin(), perCore.end(), [](const CpuCoreTimes& a, const CpuCoreTimes& b) {
        return a.busyPercentage() < b.busyPercentage();
      });
  return (IT == perCore.end()) ? nullptr : &*IT;
}

const CpuCoreTimes* CpuSnapshot::idlestCore() const noexcept {
  const auto IT = std::min_element(
      perCore.begin(), perCore.end(), [](const CpuCoreTimes& a, const CpuCoreTimes& b) {
        return a.busyPercentage() < b.busyPercentage();
      });
  return (IT == perCore.end()) ? nullptr : &*IT;
}

CpuDelta CpuSnapshot::calculateDelta(const CpuSnapshot& before, const CpuSnapshot& after) {
  CpuDelta delta{};
  delta.startNs = before.timestampNs;
  delta.endNs = after.timestampNs;
  delta.durationSeconds = helpers::clock::elapsedSeconds(before.timestampNs, after.timestampNs);
  delta.totalDelta = CpuTimes::clampedDifference(before.total, after.total);

  delta.perCoreDelta.reserve(before.perCore.size());
  for (const CpuCoreTimes& core : before.perCore) {
    const CpuCoreTimes* match = after.findCore(core.coreIndex);
    if (match == nullptr) {
      continue;
    }
    delta.perCoreDelta.push_back(
        CpuCoreDelta{core.coreIndex, CpuTimes::clampedDifference(core.times, match->times)});
  }
  return delta;
}

std::string CpuSnapshot::toString() const {
  std::string out;
  out += fmt::format("Timestamp: {} ns\n", timestampNs);
  out += fmt::format("Total: user={} nice={} sys={} idle={} iowait={} irq={} softirq={} steal={}\n",
                     total.user, total.nice, total.system, total.idle, total.iowait, total.irq,
                     total.softirq, total.steal);
  out += fmt::format("Cores: {}\n", perCore.size());
  return out;
}

} // namespace cpu

} // namespace headroom
