#ifndef HEADROOM_PROCESS_PROCESS_SNAPSHOT_HPP
#define HEADROOM_PROCESS_PROCESS_SNAPSHOT_HPP
/**
 * @file ProcessSnapshot.hpp
 * @brief Per-process resource usage, process groups, deltas and statistics.
 * @note Thread-safe: Value types and pure functions.
 *
 * A process group is a root process plus every descendant. Groups can be
 * folded into a single synthetic ProcessSnapshot so delta and statistics code
 * treats one process and a tree the same way.
 */

#include "src/cpu/inc/CpuSnapshot.hpp"
#include "src/helpers/inc/Result.hpp"

#include <sys/types.h> // pid_t

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace headroom {

namespace process {

/* ----------------------------- Constants ----------------------------- */

/// Kernel USER_HZ: units of utime/stime in /proc/<pid>/stat.
inline constexpr double CLOCK_TICKS_PER_SECOND = 100.0;

/// Fields required after the ")" that closes the command name.
inline constexpr std::size_t PID_STAT_MIN_FIELDS = 22;

/* ----------------------------- ProcessResourceUsage ----------------------------- */

/**
 * @brief Resources held by one process, or summed over a group.
 *
 * Only cpuTimes.user and cpuTimes.system are populated; the other tick
 * fields have no meaning for a process and stay 0.
 */
struct ProcessResourceUsage {
  cpu::CpuTimes cpuTimes{};              ///< utime/stime in ticks
  std::uint64_t memoryRssBytes{0};       ///< Resident set size
  std::uint64_t memoryVmsBytes{0};       ///< Virtual memory size
  std::uint64_t threadCount{0};          ///< Threads
  std::uint64_t openFileDescriptors{0};  ///< Entries in /proc/<pid>/fd (0 if unlistable)
  std::uint64_t processCount{1};         ///< 1, or the group size when folded

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ProcessSnapshot ----------------------------- */

struct ProcessSnapshot {
  pid_t pid{0};
  pid_t parentPid{0};
  ProcessResourceUsage resources{};
  std::uint64_t timestampNs{0}; ///< Monotonic capture time
};

/* ----------------------------- ProcessGroupSnapshot ----------------------------- */

struct ProcessGroupSnapshot {
  pid_t rootPid{0};
  ProcessSnapshot root{};
  std::vector<ProcessSnapshot> children; ///< All descendants, not only direct children
  std::uint64_t timestampNs{0};

  /// 1 + children.
  [[nodiscard]] std::size_t totalProcessCount() const noexcept { return 1 + children.size(); }

  /// Root plus children RSS.
  [[nodiscard]] std::uint64_t aggregateMemoryRss() const noexcept;

  /// Root plus children VMS.
  [[nodiscard]] std::uint64_t aggregateMemoryVms() const noexcept;
};

/* ----------------------------- ProcessDelta ----------------------------- */

struct ProcessDelta {
  pid_t pid{0};
  cpu::CpuTimes cpuDelta{};          ///< user/system tick deltas, floored at 0
  std::int64_t memoryDeltaBytes{0};  ///< RSS change, may be negative
  double durationSeconds{0.0};
  std::uint64_t startNs{0};
  std::uint64_t endNs{0};

  /// CPU time consumed, in seconds.
  [[nodiscard]] double cpuSeconds() const noexcept;

  /**
   * @brief cpuSeconds / duration * 100; 0 when duration is 0.
   *
   * Not normalized by core count: a process busy on 4 cores reports 400.
   */
  [[nodiscard]] double cpuUsagePercentage() const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ProcessStats ----------------------------- */

/**
 * @brief Statistics over a tracking session.
 *
 * Peak is the per-field maximum and average the per-field mean over
 * [start] + samples + [end].
 */
struct ProcessStats {
  pid_t pid{0};
  ProcessResourceUsage current{}; ///< Final capture
  ProcessResourceUsage peak{};
  ProcessResourceUsage average{};
  ProcessDelta delta{};           ///< Start to final capture
  std::size_t sampleCount{0};     ///< Captures including start and end
  double totalDurationSeconds{0.0};
  std::uint64_t processCount{1};  ///< Group size of the final capture

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse /proc/<pid>/stat.
 *
 * The command name may contain spaces and parentheses; fields are counted
 * from the last ')'.
 *
 * @param content     File content.
 * @param pid         Process the content belongs to.
 * @param pageSize    Bytes per page, for the rss field.
 * @param timestampNs Capture time.
 * @return Snapshot with openFileDescriptors = 0, or PARSE_FAILURE.
 */
[[nodiscard]] Result<ProcessSnapshot> parsePidStat(std::string_view content, pid_t pid,
                                                   std::uint64_t pageSize,
                                                   std::uint64_t timestampNs);

/**
 * @brief Fold a group into one snapshot of the root pid.
 *
 * CPU ticks, threads and descriptors are summed; RSS and VMS come from the
 * group's aggregate methods; processCount is the group size.
 */
[[nodiscard]] ProcessSnapshot aggregateProcessGroup(const ProcessGroupSnapshot& group);

/// Delta from @p start to @p end, attributed to @p start's pid.
[[nodiscard]] ProcessDelta calculateProcessDelta(const ProcessSnapshot& start,
                                                 const ProcessSnapshot& end) noexcept;

/// Statistics over [start] + samples + [end].
[[nodiscard]] ProcessStats calculateProcessStats(const ProcessSnapshot& start,
                                                 const std::vector<ProcessSnapshot>& samples,
                                                 const ProcessSnapshot& end);

} // namespace process

} // namespace headroom

#endif // HEADROOM_PROCESS_PROCESS_SNAPSHOT_HPP
