/**
 * @file MemorySource.cpp
 * @brief /proc/meminfo and sysinfo(2) memory sources.
 */

#include "src/memory/inc/MemorySource.hpp"
#include "src/source/inc/FallbackSource.hpp"
#include "src/support/inc/Platform.hpp"

#include <sys/sysinfo.h> // sysinfo

#include <cerrno>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace headroom {

namespace memory {

/* ----------------------------- ProcMeminfoSource ----------------------------- */

ProcMeminfoSource::ProcMeminfoSource(std::shared_ptr<const support::IFileReader> reader)
    : reader_(std::move(reader)) {}

Result<MemorySnapshot> ProcMeminfoSource::read() {
  const auto CONTENT = reader_->read(PROC_MEMINFO_PATH);
  if (CONTENT.isFailure()) {
    return Result<MemorySnapshot>::failure(CONTENT.error());
  }
  return parseMeminfo(CONTENT.value());
}

/* ----------------------------- SysinfoMemorySource ----------------------------- */

Result<MemorySnapshot> SysinfoMemorySource::read() {
  struct sysinfo si{};
  if (::sysinfo(&si) != 0) {
    const int ERR = errno;
    return Result<MemorySnapshot>::failure(
        ErrorCode::SYSTEM_ERROR,
        fmt::format("sysinfo failed: {}", std::error_code(ERR, std::generic_category()).message()));
  }

  const std::uint64_t UNIT = (si.mem_unit == 0) ? 1 : si.mem_unit;
  MemorySnapshot snap{};
  snap.totalBytes = static_cast<std::uint64_t>(si.totalram) * UNIT;
  snap.freeBytes = static_cast<std::uint64_t>(si.freeram) * UNIT;
  snap.buffersBytes = static_cast<std::uint64_t>(si.bufferram) * UNIT;
  snap.availableBytes = snap.freeBytes;
  const std::uint64_t RECLAIMABLE = snap.freeBytes + snap.buffersBytes;
  snap.usedBytes = (snap.totalBytes > RECLAIMABLE) ? (snap.totalBytes - RECLAIMABLE) : 0;
  snap.swapTotalBytes = static_cast<std::uint64_t>(si.totalswap) * UNIT;
  snap.swapFreeBytes = static_cast<std::uint64_t>(si.freeswap) * UNIT;
  snap.swapUsedBytes =
      (snap.swapTotalBytes > snap.swapFreeBytes) ? (snap.swapTotalBytes - snap.swapFreeBytes) : 0;
  return Result<MemorySnapshot>::success(snap);
}

/* ----------------------------- Factory ----------------------------- */

std::unique_ptr<source::Source<MemorySnapshot>>
createMemorySource(std::shared_ptr<const support::IFileReader> reader) {
  std::vector<std::unique_ptr<source::Source<MemorySnapshot>>> chain;
  if constexpr (support::currentPlatform() == support::Platform::LINUX) {
    chain.push_back(std::make_unique<ProcMeminfoSource>(std::move(reader)));
  }
  chain.push_back(std::make_unique<SysinfoMemorySource>());
  return std::make_unique<source::FallbackSource<MemorySnapshot>>("memory", std::move(chain));
}

} // namespace memory

} // namespace headroom
