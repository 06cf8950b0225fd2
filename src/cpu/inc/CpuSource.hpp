#ifndef HEADROOM_CPU_CPU_SOURCE_HPP
#define HEADROOM_CPU_CPU_SOURCE_HPP
/**
 * @file CpuSource.hpp
 * @brief /proc/stat parsing and the CPU snapshot fallback chain.
 * @note Linux-first. Non-Linux builds get only the minimal source.
 *
 * Chain (most precise first):
 *  1. ProcStatCpuSource  - /proc/stat aggregate and per-core ticks
 *  2. MinimalCpuSource   - zero ticks, core count from get_nprocs()
 */

#include "src/cpu/inc/CpuSnapshot.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Result.hpp"
#include "src/source/inc/Source.hpp"
#include "src/support/inc/FileReader.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

namespace headroom {

namespace cpu {

/* ----------------------------- Constants ----------------------------- */

inline constexpr const char* PROC_STAT_PATH = "/proc/stat";

/// Shortest interval measureCpuUsage() will sleep.
inline constexpr double MIN_MEASURE_INTERVAL_SEC = 0.1;

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse /proc/stat content.
 *
 * "cpu " is the aggregate line and "cpuN" lines are per core. Other lines
 * (intr, ctxt, btime, ...) are ignored.
 *
 * @param content     /proc/stat text.
 * @param timestampNs Capture time to stamp on the snapshot.
 * @return Snapshot, or PARSE_FAILURE when a cpu line has fewer than 8 counters
 *         or no aggregate line exists.
 */
[[nodiscard]] Result<CpuSnapshot> parseProcStat(std::string_view content,
                                                std::uint64_t timestampNs);

/* ----------------------------- Sources ----------------------------- */

class ProcStatCpuSource final : public source::Source<CpuSnapshot> {
public:
  explicit ProcStatCpuSource(std::shared_ptr<const support::IFileReader> reader,
                             helpers::clock::MonotonicClock clock = {});

  [[nodiscard]] Result<CpuSnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "proc-stat"; }

private:
  std::shared_ptr<const support::IFileReader> reader_;
  helpers::clock::MonotonicClock clock_;
};

/**
 * @brief Last-resort source: correct core count, all ticks zero.
 *
 * Deltas between two minimal snapshots report 0% usage.
 */
class MinimalCpuSource final : public source::Source<CpuSnapshot> {
public:
  explicit MinimalCpuSource(helpers::clock::MonotonicClock clock = {});

  [[nodiscard]] Result<CpuSnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "minimal"; }

private:
  helpers::clock::MonotonicClock clock_;
};

/* ----------------------------- Factory ----------------------------- */

/// Online logical CPUs, at least 1.
[[nodiscard]] std::size_t onlineCpuCount() noexcept;

/**
 * @brief CPU snapshot chain for the compiled platform.
 */
[[nodiscard]] std::unique_ptr<source::Source<CpuSnapshot>>
createCpuSource(std::shared_ptr<const support::IFileReader> reader,
                helpers::clock::MonotonicClock clock = {});

/**
 * @brief Take two snapshots @p seconds apart and return their delta.
 *
 * Sleeps for max(@p seconds, MIN_MEASURE_INTERVAL_SEC); a NaN or infinite @p seconds
 * sleeps for the minimum. Blocking, not cancellable.
 */
[[nodiscard]] Result<CpuDelta> measureCpuUsage(source::Source<CpuSnapshot>& source,
                                               double seconds);

} // namespace cpu

} // namespace headroom

#endif // HEADROOM_CPU_CPU_SOURCE_HPP
