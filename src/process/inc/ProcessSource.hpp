#ifndef HEADROOM_PROCESS_PROCESS_SOURCE_HPP
#define HEADROOM_PROCESS_PROCESS_SOURCE_HPP
/**
 * @file ProcessSource.hpp
 * @brief Per-process and process-group readers.
 */

#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Result.hpp"
#include "src/process/inc/ProcessSnapshot.hpp"
#include "src/support/inc/FileReader.hpp"

#include <sys/types.h> // pid_t

#include <cstdint>
#include <memory>

namespace headroom {

namespace process {

/* ----------------------------- IProcessSource ----------------------------- */

/**
 * @brief Reader of one process or a process tree.
 */
class IProcessSource {
public:
  virtual ~IProcessSource() = default;

  /// Snapshot of @p pid.
  [[nodiscard]] virtual Result<ProcessSnapshot> read(pid_t pid) = 0;

  /// Snapshot of @p rootPid and all of its descendants.
  [[nodiscard]] virtual Result<ProcessGroupSnapshot> readProcessGroup(pid_t rootPid) = 0;

  [[nodiscard]] virtual const char* name() const noexcept = 0;
};

/* ----------------------------- ProcfsProcessSource ----------------------------- */

/**
 * @brief /proc/<pid>/stat and /proc/<pid>/fd reader.
 *
 * Descendants are found with one pass over the numeric /proc entries,
 * building a parent map and walking it from the root. Processes that exit
 * during the pass are skipped.
 */
class ProcfsProcessSource final : public IProcessSource {
public:
  /**
   * @param reader   File access.
   * @param clock    Capture timestamps; system monotonic clock if empty.
   * @param pageSize Bytes per page; sysconf(_SC_PAGESIZE) if 0.
   */
  explicit ProcfsProcessSource(std::shared_ptr<const support::IFileReader> reader,
                               helpers::clock::MonotonicClock clock = {},
                               std::uint64_t pageSize = 0);

  [[nodiscard]] Result<ProcessSnapshot> read(pid_t pid) override;
  [[nodiscard]] Result<ProcessGroupSnapshot> readProcessGroup(pid_t rootPid) override;

  [[nodiscard]] const char* name() const noexcept override { return "procfs"; }

  [[nodiscard]] std::uint64_t pageSize() const noexcept { return pageSize_; }

private:
  [[nodiscard]] std::uint64_t countOpenFds(pid_t pid) const;

  std::shared_ptr<const support::IFileReader> reader_;
  helpers::clock::MonotonicClock clock_;
  std::uint64_t pageSize_;
};

/* ----------------------------- UnsupportedProcessSource ----------------------------- */

/**
 * @brief Placeholder for platforms without a process reader.
 */
class UnsupportedProcessSource final : public IProcessSource {
public:
  [[nodiscard]] Result<ProcessSnapshot> read(pid_t pid) override;
  [[nodiscard]] Result<ProcessGroupSnapshot> readProcessGroup(pid_t rootPid) override;

  [[nodiscard]] const char* name() const noexcept override { return "unsupported"; }
};

/* ----------------------------- Factory ----------------------------- */

[[nodiscard]] std::unique_ptr<IProcessSource>
createProcessSource(std::shared_ptr<const support::IFileReader> reader,
                    helpers::clock::MonotonicClock clock = {});

} // namespace process

} // namespace headroom

#endif // HEADROOM_PROCESS_PROCESS_SOURCE_HPP
