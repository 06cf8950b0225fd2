/**
 * @file ProcessSnapshot.cpp
 * @brief /proc/<pid>/stat parsing, group folding, deltas and statistics.
 */

#include "src/process/inc/ProcessSnapshot.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace headroom {

namespace process {

using headroom::helpers::format::bytesBinary;
using headroom::helpers::format::bytesBinarySigned;
using headroom::helpers::strings::parseInt64;
using headroom::helpers::strings::parseUint64;
using headroom::helpers::strings::splitWhitespace;
using headroom::helpers::strings::trim;

namespace {

/* ----------------------------- Field Indices ----------------------------- */

// Offsets into the fields after "pid (comm)"; field N of proc(5) is index N - 3.
constexpr std::size_t FIELD_PPID = 1;
constexpr std::size_t FIELD_UTIME = 11;
constexpr std::size_t FIELD_STIME = 12;
constexpr std::size_t FIELD_NUM_THREADS = 17;
constexpr std::size_t FIELD_VSIZE = 20;
constexpr std::size_t FIELD_RSS = 21;

inline std::uint64_t floorSub(std::uint64_t after, std::uint64_t before) noexcept {
  return (after > before) ? (after - before) : 0;
}

Result<ProcessSnapshot> pidStatFailure(pid_t pid, const char* what) {
  return Result<ProcessSnapshot>::failure(ErrorCode::PARSE_FAILURE,
                                          fmt::format("/proc/{}/stat: {}", pid, what));
}

} // namespace

/* ----------------------------- ProcessResourceUsage ----------------------------- */

std::string ProcessResourceUsage::toString() const {
  return fmt::format("cpu user={} sys={} ticks, rss={}, vms={}, threads={}, fds={}, processes={}",
                     cpuTimes.user, cpuTimes.system, bytesBinary(memoryRssBytes),
                     bytesBinary(memoryVmsBytes), threadCount, openFileDescriptors, processCount);
}

/* ----------------------------- ProcessGroupSnapshot ----------------------------- */

std::uint64_t ProcessGroupSnapshot::aggregateMemoryRss() const noexcept {
  std::uint64_t total = root.resources.memoryRssBytes;
  for (const ProcessSnapshot& child : children) {
    total += child.resources.memoryRssBytes;
  }
  return total;
}

std::uint64_t ProcessGroupSnapshot::aggregateMemoryVms() const noexcept {
  std::uint64_t total = root.resources.memoryVmsBytes;
  for (const ProcessSnapshot& child : children) {
    total += child.resources.memoryVmsBytes;
  }
  return total;
}

/* ----------------------------- ProcessDelta ----------------------------- */

double ProcessDelta::cpuSeconds() const noexcept {
  return static_cast<double>(cpuDelta.total()) / CLOCK_TICKS_PER_SECOND;
}

double ProcessDelta::cpuUsagePercentage() const noexcept {
  if (durationSeconds <= 0.0) {
    return 0.0;
  }
  return cpuSeconds() / durationSeconds * 100.0;
}

std::string ProcessDelta::toString() const {
  return fmt::format("pid {}: {:.2f} cpu-s over {:.3f} s ({:.1f}%), rss {}", pid, cpuSeconds(),
                     durationSeconds, cpuUsagePercentage(), bytesBinarySigned(memoryDeltaBytes));
}

/* ----------------------------- ProcessStats ----------------------------- */

std::string ProcessStats::toString() const {
  std::string out;
  out += fmt::format("PID:       {} ({} process{})\n", pid, processCount,
                     processCount == 1 ? "" : "es");
  out += fmt::format("Samples:   {} over {:.3f} s\n", sampleCount, totalDurationSeconds);
  out += fmt::format("CPU:       {:.1f}% ({:.2f} cpu-s)\n", delta.cpuUsagePercentage(),
                     delta.cpuSeconds());
  out += fmt::format("RSS:       current={} peak={} avg={}\n", bytesBinary(current.memoryRssBytes),
                     bytesBinary(peak.memoryRssBytes), bytesBinary(average.memoryRssBytes));
  out += fmt::format("VMS:       current={} peak={} avg={}\n", bytesBinary(current.memoryVmsBytes),
                     bytesBinary(peak.memoryVmsBytes), bytesBinary(average.memoryVmsBytes));
  out += fmt::format("Threads:   current={} peak={} avg={}\n", current.threadCount,
                     peak.threadCount, average.threadCount);
  out += fmt::format("FDs:       current={} peak={} avg={}\n", current.openFileDescriptors,
                     peak.openFileDescriptors, average.openFileDescriptors);
  return out;
}

/* ----------------------------- API ----------------------------- */

Result<ProcessSnapshot> parsePidStat(std::string_view content, pid_t pid, std::uint64_t pageSize,
                                     std::uint64_t timestampNs) {
  content = trim(content);
  if (content.empty()) {
    return pidStatFailure(pid, "Empty content");
  }
  const std::size_t PAREN = content.rfind(')');
  if (PAREN == std::string_view::npos) {
    return pidStatFailure(pid, "Invalid format: missing closing parenthesis");
  }

  const auto FIELDS = splitWhitespace(content.substr(PAREN + 1));
  if (FIELDS.size() < PID_STAT_MIN_FIELDS) {
    return pidStatFailure(pid, "Insufficient fields");
  }

  const auto PPID = parseInt64(FIELDS[FIELD_PPID]);
  const auto UTIME = parseUint64(FIELDS[FIELD_UTIME]);
  const auto STIME = parseUint64(FIELDS[FIELD_STIME]);
  const auto THREADS = parseInt64(FIELDS[FIELD_NUM_THREADS]);
  const auto VSIZE = parseUint64(FIELDS[FIELD_VSIZE]);
  const auto RSS = parseInt64(FIELDS[FIELD_RSS]);
  if (!PPID || !UTIME || !STIME || !THREADS || !VSIZE || !RSS) {
    return pidStatFailure(pid, "Non-numeric field");
  }

  ProcessSnapshot snap{};
  snap.pid = pid;
  snap.parentPid = static_cast<pid_t>(*PPID);
  snap.timestampNs = timestampNs;
  snap.resources.cpuTimes.user = *UTIME;
  snap.resources.cpuTimes.system = *STIME;
  snap.resources.threadCount = static_cast<std::uint64_t>(std::max<std::int64_t>(0, *THREADS));
  snap.resources.memoryVmsBytes = *VSIZE;
  snap.resources.memoryRssBytes =
      static_cast<std::uint64_t>(std::max<std::int64_t>(0, *RSS)) * pageSize;
  return Result<ProcessSnapshot>::success(snap);
}

ProcessSnapshot aggregateProcessGroup(const ProcessGroupSnapshot& group) {
  ProcessResourceUsage sum{};
  sum.cpuTimes.user = group.root.resources.cpuTimes.user;
  sum.cpuTimes.system = group.root.resources.cpuTimes.system;
  sum.threadCount = group.root.resources.threadCount;
  sum.openFileDescriptors = group.root.resources.openFileDescriptors;
  for (const ProcessSnapshot& child : group.children) {
    sum.cpuTimes.user += child.resources.cpuTimes.user;
    sum.cpuTimes.system += child.resources.cpuTimes.system;
    sum.threadCount += child.resources.threadCount;
    sum.openFileDescriptors += child.resources.openFileDescriptors;
  }
  sum.memoryRssBytes = group.aggregateMemoryRss();
  sum.memoryVmsBytes = group.aggregateMemoryVms();
  sum.processCount = group.totalProcessCount();

  ProcessSnapshot out{};
  out.pid = group.rootPid;
  out.parentPid = group.root.parentPid;
  out.resources = sum;
  out.timestampNs = group.timestampNs;
  return out;
}

ProcessDelta calculateProcessDelta(const ProcessSnapshot& start,
                                   const ProcessSnapshot& end) noexcept {
  ProcessDelta d{};
  d.pid = start.pid;
  d.cpuDelta.user = floorSub(end.resources.cpuTimes.user, start.resources.cpuTimes.user);
  d.cpuDelta.system = floorSub(end.resources.cpuTimes.system, start.resources.cpuTimes.system);
  d.memoryDeltaBytes = static_cast<std::int64_t>(end.resources.memoryRssBytes) -
                       static_cast<std::int64_t>(start.resources.memoryRssBytes);
  d.startNs = start.timestampNs;
  d.endNs = end.timestampNs;
  d.durationSeconds = helpers::clock::elapsedSeconds(start.timestampNs, end.timestampNs);
  return d;
}

ProcessStats calculateProcessStats(const ProcessSnapshot& start,
                                   const std::vector<ProcessSnapshot>& samples,
                                   const ProcessSnapshot& end) {
  std::vector<const ProcessSnapshot*> all;
  all.reserve(samples.size() + 2);
  all.push_back(&start);
  for (const ProcessSnapshot& s : samples) {
    all.push_back(&s);
  }
  all.push_back(&end);

  ProcessResourceUsage peak{};
  peak.processCount = 0;
  ProcessResourceUsage total{};
  total.processCount = 0;
  for (const ProcessSnapshot* snap : all) {
    const ProcessResourceUsage& r = snap->resources;
    peak.cpuTimes.user = std::max(peak.cpuTimes.user, r.cpuTimes.user);
    peak.cpuTimes.system = std::max(peak.cpuTimes.system, r.cpuTimes.system);
    peak.memoryRssBytes = std::max(peak.memoryRssBytes, r.memoryRssBytes);
    peak.memoryVmsBytes = std::max(peak.memoryVmsBytes, r.memoryVmsBytes);
    peak.threadCount = std::max(peak.threadCount, r.threadCount);
    peak.openFileDescriptors = std::max(peak.openFileDescriptors, r.openFileDescriptors);
    peak.processCount = std::max(peak.processCount, r.processCount);

    total.cpuTimes.user += r.cpuTimes.user;
    total.cpuTimes.system += r.cpuTimes.system;
    total.memoryRssBytes += r.memoryRssBytes;
    total.memoryVmsBytes += r.memoryVmsBytes;
    total.threadCount += r.threadCount;
    total.openFileDescriptors += r.openFileDescriptors;
    total.processCount += r.processCount;
  }

  const std::uint64_t N = all.size();
  ProcessResourceUsage average{};
  average.cpuTimes.user = total.cpuTimes.user / N;
  average.cpuTimes.system = total.cpuTimes.system / N;
  average.memoryRssBytes = total.memoryRssBytes / N;
  average.memoryVmsBytes = total.memoryVmsBytes / N;
  average.threadCount = total.threadCount / N;
  average.openFileDescriptors = total.openFileDescriptors / N;
  average.processCount = total.processCount / N;

  ProcessStats stats{};
  stats.pid = start.pid;
  stats.current = end.resources;
  stats.peak = peak;
  stats.average = average;
  stats.delta = calculateProcessDelta(start, end);
  stats.sampleCount = all.size();
  stats.totalDurationSeconds = helpers::clock::elapsedSeconds(start.timestampNs, end.timestampNs);
  stats.processCount = end.resources.processCount;
  return stats;
}

} // namespace process

} // namespace headroom
