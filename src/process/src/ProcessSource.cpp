/**
 * @file ProcessSource.cpp
 * @brief procfs process reader.
 */

#include "src/process/inc/ProcessSource.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/support/inc/Platform.hpp"

#include <unistd.h> // sysconf

#include <deque>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace headroom {

namespace process {

using headroom::helpers::strings::isAllDigits;
using headroom::helpers::strings::parseInt64;

namespace {

constexpr std::uint64_t FALLBACK_PAGE_SIZE = 4096;

std::uint64_t systemPageSize() noexcept {
  const long N = ::sysconf(_SC_PAGESIZE);
  return (N > 0) ? static_cast<std::uint64_t>(N) : FALLBACK_PAGE_SIZE;
}

inline std::string statPath(pid_t pid) { return fmt::format("/proc/{}/stat", pid); }

inline std::string fdPath(pid_t pid) { return fmt::format("/proc/{}/fd", pid); }

} // namespace

/* ----------------------------- ProcfsProcessSource ----------------------------- */

ProcfsProcessSource::ProcfsProcessSource(std::shared_ptr<const support::IFileReader> reader,
                                         helpers::clock::MonotonicClock clock,
                                         std::uint64_t pageSize)
    : reader_(std::move(reader)), clock_(helpers::clock::orSystemClock(std::move(clock))),
      pageSize_(pageSize != 0 ? pageSize : systemPageSize()) {}

std::uint64_t ProcfsProcessSource::countOpenFds(pid_t pid) const {
  const auto ENTRIES = reader_->list(fdPath(pid));
  if (ENTRIES.isFailure()) {
    return 0;
  }
  return ENTRIES.value().size();
}

Result<ProcessSnapshot> ProcfsProcessSource::read(pid_t pid) {
  const auto CONTENT = reader_->read(statPath(pid));
  if (CONTENT.isFailure()) {
    return Result<ProcessSnapshot>::failure(CONTENT.error());
  }
  auto snap = parsePidStat(CONTENT.value(), pid, pageSize_, clock_());
  if (snap.isFailure()) {
    return snap;
  }
  snap.value().resources.openFileDescriptors = countOpenFds(pid);
  return snap;
}

Result<ProcessGroupSnapshot> ProcfsProcessSource::readProcessGroup(pid_t rootPid) {
  auto root = read(rootPid);
  if (root.isFailure()) {
    return Result<ProcessGroupSnapshot>::failure(root.error());
  }

  const auto ENTRIES = reader_->list("/proc");
  if (ENTRIES.isFailure()) {
    return Result<ProcessGroupSnapshot>::failure(ENTRIES.error());
  }

  // parent -> children, from every process still alive during the pass.
  std::map<pid_t, std::vector<ProcessSnapshot>> byParent;
  for (const std::string& entry : ENTRIES.value()) {
    if (!isAllDigits(entry)) {
      continue;
    }
    const auto PID = parseInt64(entry);
    if (!PID || static_cast<pid_t>(*PID) == rootPid) {
      continue;
    }
    const pid_t CHILD = static_cast<pid_t>(*PID);
    const auto CONTENT = reader_->read(statPath(CHILD));
    if (CONTENT.isFailure()) {
      continue;
    }
    auto snap = parsePidStat(CONTENT.value(), CHILD, pageSize_, clock_());
    if (snap.isFailure()) {
      helpers::log::logger()->debug("Skipping pid {}: {}", CHILD, snap.error().toString());
      continue;
    }
    byParent[snap.value().parentPid].push_back(std::move(snap).value());
  }

  ProcessGroupSnapshot group{};
  group.rootPid = rootPid;
  group.root = std::move(root).value();
  group.timestampNs = group.root.timestampNs;

  std::deque<pid_t> pending{rootPid};
  while (!pending.empty()) {
    const pid_t PARENT = pending.front();
    pending.pop_front();
    const auto IT = byParent.find(PARENT);
    if (IT == byParent.end()) {
      continue;
    }
    for (ProcessSnapshot& child : IT->second) {
      child.resources.openFileDescriptors = countOpenFds(child.pid);
      pending.push_back(child.pid);
      group.children.push_back(std::move(child));
    }
    byParent.erase(IT);
  }
  return Result<ProcessGroupSnapshot>::success(std::move(group));
}

/* ----------------------------- UnsupportedProcessSource ----------------------------- */

Result<ProcessSnapshot> UnsupportedProcessSource::read(pid_t pid) {
  return Result<ProcessSnapshot>::failure(
      ErrorCode::UNSUPPORTED_PLATFORM,
      fmt::format("Process metrics for pid {} are not supported on {}", pid,
                  support::toString(support::currentPlatform())));
}

Result<ProcessGroupSnapshot> UnsupportedProcessSource::readProcessGroup(pid_t rootPid) {
  return Result<ProcessGroupSnapshot>::failure(
      ErrorCode::UNSUPPORTED_PLATFORM,
      fmt::format("Process group metrics for pid {} are not supported on {}", rootPid,
                  support::toString(support::currentPlatform())));
}

/* ----------------------------- Factory ----------------------------- */

std::unique_ptr<IProcessSource>
createProcessSource(std::shared_ptr<const support::IFileReader> reader,
                    helpers::clock::MonotonicClock clock) {
  if constexpr (support::currentPlatform() == support::Platform::LINUX) {
    return std::make_unique<ProcfsProcessSource>(std::move(reader), std::move(clock));
  } else {
    return std::make_unique<UnsupportedProcessSource>();
  }
}

} // namespace process

} // namespace headroom
