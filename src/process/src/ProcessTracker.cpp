/**
 * @file ProcessTracker.cpp
 * @brief Process tracking state machine.
 */

#include "src/process/inc/ProcessTracker.hpp"

#include <utility>

namespace headroom {

namespace process {

namespace {

constexpr const char* ALREADY_STARTED = "Tracker is already started";
constexpr const char* NOT_STARTED = "Tracker has not been started";

} // namespace

ProcessTracker::ProcessTracker(std::shared_ptr<IProcessSource> source, pid_t pid,
                               bool includeChildren)
    : source_(std::move(source)), pid_(pid), includeChildren_(includeChildren) {}

Result<ProcessSnapshot> ProcessTracker::capture() {
  if (!includeChildren_) {
    return source_->read(pid_);
  }
  const auto GROUP = source_->readProcessGroup(pid_);
  if (GROUP.isFailure()) {
    return Result<ProcessSnapshot>::failure(GROUP.error());
  }
  return Result<ProcessSnapshot>::success(aggregateProcessGroup(GROUP.value()));
}

Result<ProcessSnapshot> ProcessTracker::start() {
  if (isTracking()) {
    return Result<ProcessSnapshot>::failure(ErrorCode::INVALID_STATE, ALREADY_STARTED);
  }
  auto snap = capture();
  if (snap.isSuccess()) {
    startSnapshot_ = snap.value();
  }
  return snap;
}

Result<ProcessSnapshot> ProcessTracker::sample() {
  if (!isTracking()) {
    return Result<ProcessSnapshot>::failure(ErrorCode::INVALID_STATE, NOT_STARTED);
  }
  auto snap = capture();
  if (snap.isSuccess()) {
    samples_.push_back(snap.value());
  }
  return snap;
}

Result<ProcessStats> ProcessTracker::stop() {
  if (!isTracking()) {
    return Result<ProcessStats>::failure(ErrorCode::INVALID_STATE, NOT_STARTED);
  }
  const auto END = capture();
  if (END.isFailure()) {
    return Result<ProcessStats>::failure(END.error());
  }

  ProcessStats stats = calculateProcessStats(*startSnapshot_, samples_, END.value());
  stats.pid = pid_;

  startSnapshot_.reset();
  samples_.clear();
  return Result<ProcessStats>::success(std::move(stats));
}

Result<ProcessDelta> ProcessTracker::getDelta() {
  if (!isTracking()) {
    return Result<ProcessDelta>::failure(ErrorCode::INVALID_STATE, NOT_STARTED);
  }
  const auto NOW = capture();
  if (NOW.isFailure()) {
    return Result<ProcessDelta>::failure(NOW.error());
  }
  ProcessDelta delta = calculateProcessDelta(*startSnapshot_, NOW.value());
  delta.pid = pid_;
  return Result<ProcessDelta>::success(delta);
}

} // namespace process

} // namespace headroom
