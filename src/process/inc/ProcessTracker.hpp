#ifndef HEADROOM_PROCESS_PROCESS_TRACKER_HPP
#define HEADROOM_PROCESS_PROCESS_TRACKER_HPP
/**
 * @file ProcessTracker.hpp
 * @brief Start/sample/stop tracking of one process or process tree.
 * @note NOT thread-safe. One tracker per tracked subject; independent
 *       trackers share nothing.
 *
 * States:
 *   Idle --start()--> Started --sample()*--> Started --stop()--> Idle
 *
 * stop() computes statistics over [start] + samples + [final] and returns the
 * tracker to Idle so it can be started again. getDelta() peeks at the current
 * delta without changing state.
 *
 * With includeChildren every capture reads the whole process group and folds
 * it into one snapshot (see aggregateProcessGroup()).
 */

#include "src/helpers/inc/Result.hpp"
#include "src/process/inc/ProcessSnapshot.hpp"
#include "src/process/inc/ProcessSource.hpp"

#include <sys/types.h> // pid_t

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace headroom {

namespace process {

class ProcessTracker {
public:
  ProcessTracker(std::shared_ptr<IProcessSource> source, pid_t pid,
                 bool includeChildren = false);

  /**
   * @brief Capture and store the start snapshot.
   * @return Snapshot, INVALID_STATE "Tracker is already started", or the
   *         capture failure (state unchanged).
   */
  [[nodiscard]] Result<ProcessSnapshot> start();

  /**
   * @brief Capture and append a sample.
   * @return Snapshot, INVALID_STATE "Tracker has not been started", or the
   *         capture failure.
   */
  [[nodiscard]] Result<ProcessSnapshot> sample();

  /**
   * @brief Capture the final snapshot, compute statistics and reset to Idle.
   *
   * On a capture failure the tracker stays Started.
   */
  [[nodiscard]] Result<ProcessStats> stop();

  /// Delta from the start snapshot to a fresh capture; state unchanged.
  [[nodiscard]] Result<ProcessDelta> getDelta();

  [[nodiscard]] bool isTracking() const noexcept { return startSnapshot_.has_value(); }

  /// Samples taken since start(), excluding start itself.
  [[nodiscard]] std::size_t sampleCount() const noexcept { return samples_.size(); }

  [[nodiscard]] pid_t pid() const noexcept { return pid_; }

  [[nodiscard]] bool includesChildren() const noexcept { return includeChildren_; }

private:
  [[nodiscard]] Result<ProcessSnapshot> capture();

  std::shared_ptr<IProcessSource> source_;
  pid_t pid_;
  bool includeChildren_;
  std::optional<ProcessSnapshot> startSnapshot_;
  std::vector<ProcessSnapshot> samples_;
};

} // namespace process

} // namespace headroom

#endif // HEADROOM_PROCESS_PROCESS_TRACKER_HPP
