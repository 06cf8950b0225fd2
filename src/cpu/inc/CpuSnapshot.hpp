#ifndef HEADROOM_CPU_CPU_SNAPSHOT_HPP
#define HEADROOM_CPU_CPU_SNAPSHOT_HPP
/**
 * @file CpuSnapshot.hpp
 * @brief CPU tick counters, point-in-time snapshots and deltas between them.
 * @note Thread-safe: Immutable value types and pure functions.
 *
 * Design: snapshot + delta.
 *  - A CpuSnapshot holds raw cumulative ticks (aggregate and per core) and the
 *    monotonic time of capture. A new one is created on every read.
 *  - CpuSnapshot::calculateDelta() subtracts two snapshots field by field,
 *    clamping at 0 so counter resets never produce negative ticks.
 *  - Percentages are computed from the delta; the caller controls the interval.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace headroom {

namespace cpu {

/* ----------------------------- CpuTimes ----------------------------- */

/**
 * @brief CPU time counters in ticks (USER_HZ, normally 1/100 s).
 *
 * Fields match the first eight /proc/stat columns:
 *   user nice system idle iowait irq softirq steal
 */
struct CpuTimes {
  std::uint64_t user{0};    ///< Time in user mode
  std::uint64_t nice{0};    ///< Time in user mode with low priority
  std::uint64_t system{0};  ///< Time in kernel mode
  std::uint64_t idle{0};    ///< Time in idle task
  std::uint64_t iowait{0};  ///< Time waiting for I/O
  std::uint64_t irq{0};     ///< Time servicing hardware interrupts
  std::uint64_t softirq{0}; ///< Time servicing software interrupts
  std::uint64_t steal{0};   ///< Time stolen by hypervisor

  /// Sum of all fields.
  [[nodiscard]] std::uint64_t total() const noexcept;

  /// total - idle - iowait.
  [[nodiscard]] std::uint64_t busy() const noexcept;

  /// Field-wise max(0, after - before).
  [[nodiscard]] static CpuTimes clampedDifference(const CpuTimes& before,
                                                  const CpuTimes& after) noexcept;

  [[nodiscard]] bool operator==(const CpuTimes& other) const noexcept = default;
};

/**
 * @brief Cumulative counters for one logical CPU.
 */
struct CpuCoreTimes {
  std::size_t coreIndex{0}; ///< N in "cpuN"
  CpuTimes times{};

  /// busy/total * 100 since boot (0 if total is 0).
  [[nodiscard]] double busyPercentage() const noexcept;
};

/* ----------------------------- Delta ----------------------------- */

/**
 * @brief Tick deltas for one logical CPU.
 */
struct CpuCoreDelta {
  std::size_t coreIndex{0};
  CpuTimes delta{};

  /// busy/total * 100 over the interval (0 if total is 0).
  [[nodiscard]] double usagePercentage() const noexcept;
};

/**
 * @brief Difference between two CpuSnapshots.
 *
 * usagePercentage() is system-wide and normalized: a fully busy N-core machine
 * reports 100. usagePercentagePerCore() divides that by the core count.
 */
struct CpuDelta {
  CpuTimes totalDelta{};                  ///< Aggregate tick deltas
  std::vector<CpuCoreDelta> perCoreDelta; ///< Cores present in both snapshots
  double durationSeconds{0.0};            ///< Elapsed wall time between captures
  std::uint64_t startNs{0};               ///< Capture time of the earlier snapshot
  std::uint64_t endNs{0};                 ///< Capture time of the later snapshot

  [[nodiscard]] std::size_t coreCount() const noexcept { return perCoreDelta.size(); }

  /// busy/total * 100 across all CPUs (0 without cores or elapsed time).
  [[nodiscard]] double usagePercentage() const noexcept;

  /// usagePercentage() / coreCount (0 without cores).
  [[nodiscard]] double usagePercentagePerCore() const noexcept;

  [[nodiscard]] double userPercentage() const noexcept;
  [[nodiscard]] double systemPercentage() const noexcept;
  [[nodiscard]] double idlePercentage() const noexcept;
  [[nodiscard]] double iowaitPercentage() const noexcept;

  /// Usage of one core; nullopt if the core is not in the delta.
  [[nodiscard]] std::optional<double> coreUsagePercentage(std::size_t coreIndex) const noexcept;

  /// Core with the highest usage, or nullptr without cores.
  [[nodiscard]] const CpuCoreDelta* busiestCore() const noexcept;

  /// Core with the lowest usage, or nullptr without cores.
  [[nodiscard]] const CpuCoreDelta* idlestCore() const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Snapshot ----------------------------- */

/**
 * @brief Cumulative CPU counters at one instant.
 */
struct CpuSnapshot {
  CpuTimes total{};                  ///< Aggregate "cpu" line
  std::vector<CpuCoreTimes> perCore; ///< "cpuN" lines, ordered by appearance
  std::uint64_t timestampNs{0};      ///< Monotonic capture time

  [[nodiscard]] std::size_t coreCount() const noexcept { return perCore.size(); }

  /// Counters of core @p coreIndex, or nullptr.
  [[nodiscard]] const CpuCoreTimes* findCore(std::size_t coreIndex) const noexcept;

  /// Cores whose busy share since boot is >= @p thresholdPercent.
  [[nodiscard]] std::vector<CpuCoreTimes> findBusyCores(double thresholdPercent) const;

  /// Cores whose busy share since boot is < @p thresholdPercent.
  [[nodiscard]] std::vector<CpuCoreTimes> findIdleCores(double thresholdPercent) const;

  /// Core with the highest busy share since boot, or nullptr without cores.
  [[nodiscard]] const CpuCoreTimes* busiestCore() const noexcept;

  /// Core with the lowest busy share since boot, or nullptr without cores.
  [[nodiscard]] const CpuCoreTimes* idlestCore() const noexcept;

  /**
   * @brief Tick deltas from @p before to @p after.
   *
   * Cores absent from @p after are dropped. Duration is 0 if @p after was
   * captured before @p before.
   */
  [[nodiscard]] static CpuDelta calculateDelta(const CpuSnapshot& before,
                                               const CpuSnapshot& after);

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

} // namespace cpu

} // namespace headroom

#endif // HEADROOM_CPU_CPU_SNAPSHOT_HPP
