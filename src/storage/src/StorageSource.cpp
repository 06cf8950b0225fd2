/**
 * @file StorageSource.cpp
 * @brief statvfs and df storage sources.
 */

#include "src/storage/inc/StorageSource.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/source/inc/FallbackSource.hpp"
#include "src/support/inc/Platform.hpp"

#include <sys/statvfs.h> // statvfs

#include <utility>
#include <vector>

namespace headroom {

namespace storage {

/* ----------------------------- statvfs ----------------------------- */

std::optional<FilesystemUsage> statvfsUsage(const std::string& mountPoint) {
  struct statvfs st{};
  if (::statvfs(mountPoint.c_str(), &st) != 0) {
    return std::nullopt;
  }
  const std::uint64_t FRSIZE = (st.f_frsize != 0) ? st.f_frsize : st.f_bsize;
  FilesystemUsage u{};
  u.totalBytes = static_cast<std::uint64_t>(st.f_blocks) * FRSIZE;
  u.freeBytes = static_cast<std::uint64_t>(st.f_bfree) * FRSIZE;
  u.availableBytes = static_cast<std::uint64_t>(st.f_bavail) * FRSIZE;
  u.totalInodes = static_cast<std::uint64_t>(st.f_files);
  u.freeInodes = static_cast<std::uint64_t>(st.f_ffree);
  return u;
}

/* ----------------------------- StatvfsStorageSource ----------------------------- */

StatvfsStorageSource::StatvfsStorageSource(std::shared_ptr<const support::IFileReader> reader,
                                           FilesystemQuery query)
    : reader_(std::move(reader)),
      query_(query ? std::move(query) : FilesystemQuery(&statvfsUsage)) {}

Result<StorageSnapshot> StatvfsStorageSource::read() {
  const auto MOUNTS = reader_->read(PROC_MOUNTS_PATH);
  if (MOUNTS.isFailure()) {
    return Result<StorageSnapshot>::failure(MOUNTS.error());
  }

  StorageSnapshot snap{};
  for (const MountEntry& e : parseMounts(MOUNTS.value())) {
    const auto USAGE = query_(e.mountPoint);
    if (!USAGE) {
      helpers::log::logger()->debug("Skipping mount {}: not queryable", e.mountPoint);
      continue;
    }
    MountPoint m{};
    m.device = e.device;
    m.mountPoint = e.mountPoint;
    m.fsType = e.fsType;
    m.totalBytes = USAGE->totalBytes;
    m.usedBytes =
        (USAGE->totalBytes > USAGE->freeBytes) ? USAGE->totalBytes - USAGE->freeBytes : 0;
    m.availableBytes = USAGE->availableBytes;
    m.totalInodes = USAGE->totalInodes;
    m.freeInodes = USAGE->freeInodes;
    m.usedInodes =
        (USAGE->totalInodes > USAGE->freeInodes) ? USAGE->totalInodes - USAGE->freeInodes : 0;
    snap.mountPoints.push_back(std::move(m));
  }

  const auto DISKSTATS = reader_->read(PROC_DISKSTATS_PATH);
  if (DISKSTATS.isSuccess()) {
    auto disks = parseDiskstats(DISKSTATS.value());
    if (disks.isSuccess()) {
      snap.diskIo = std::move(disks).value();
    }
  }
  return Result<StorageSnapshot>::success(std::move(snap));
}

/* ----------------------------- DfStorageSource ----------------------------- */

DfStorageSource::DfStorageSource(std::shared_ptr<const support::IProcessRunner> runner)
    : runner_(std::move(runner)) {}

Result<StorageSnapshot> DfStorageSource::read() {
  const auto OUTPUT = runner_->execute(DF_COMMAND);
  if (OUTPUT.isFailure()) {
    return Result<StorageSnapshot>::failure(OUTPUT.error());
  }
  auto mounts = parseDfOutput(OUTPUT.value());
  if (mounts.isFailure()) {
    return Result<StorageSnapshot>::failure(mounts.error());
  }
  StorageSnapshot snap{};
  snap.mountPoints = std::move(mounts).value();
  return Result<StorageSnapshot>::success(std::move(snap));
}

/* ----------------------------- Factory ----------------------------- */

std::unique_ptr<source::Source<StorageSnapshot>>
createStorageSource(std::shared_ptr<const support::IFileReader> reader,
                    std::shared_ptr<const support::IProcessRunner> runner) {
  std::vector<std::unique_ptr<source::Source<StorageSnapshot>>> chain;
  if constexpr (support::currentPlatform() == support::Platform::LINUX) {
    chain.push_back(std::make_unique<StatvfsStorageSource>(std::move(reader)));
  }
  chain.push_back(std::make_unique<DfStorageSource>(std::move(runner)));
  return std::make_unique<source::FallbackSource<StorageSnapshot>>("storage", std::move(chain));
}

} // namespace storage

} // namespace headroom
