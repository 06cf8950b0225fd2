#ifndef HEADROOM_STORAGE_STORAGE_SOURCE_HPP
#define HEADROOM_STORAGE_STORAGE_SOURCE_HPP
/**
 * @file StorageSource.hpp
 * @brief Storage snapshot sources and their fallback chain.
 *
 * Chain:
 *  1. StatvfsStorageSource - /proc/mounts + statvfs(3), disk I/O from /proc/diskstats
 *  2. DfStorageSource      - `df -kP` through the process runner (no inodes, no I/O)
 */

#include "src/helpers/inc/Result.hpp"
#include "src/source/inc/Source.hpp"
#include "src/storage/inc/StorageSnapshot.hpp"
#include "src/support/inc/FileReader.hpp"
#include "src/support/inc/ProcessRunner.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace headroom {

namespace storage {

inline constexpr const char* PROC_MOUNTS_PATH = "/proc/mounts";
inline constexpr const char* PROC_DISKSTATS_PATH = "/proc/diskstats";
inline constexpr const char* DF_COMMAND = "df -kP";

/**
 * @brief Capacity figures of one filesystem.
 */
struct FilesystemUsage {
  std::uint64_t totalBytes{0};
  std::uint64_t freeBytes{0};      ///< Free including root-reserved blocks
  std::uint64_t availableBytes{0}; ///< Free to unprivileged users
  std::uint64_t totalInodes{0};
  std::uint64_t freeInodes{0};
};

/// Capacity query for a mount path; nullopt when the path cannot be queried.
using FilesystemQuery = std::function<std::optional<FilesystemUsage>(const std::string&)>;

/// statvfs(3)-backed filesystem query.
[[nodiscard]] std::optional<FilesystemUsage> statvfsUsage(const std::string& mountPoint);

class StatvfsStorageSource final : public source::Source<StorageSnapshot> {
public:
  explicit StatvfsStorageSource(std::shared_ptr<const support::IFileReader> reader,
                                FilesystemQuery query = {});

  /**
   * @brief Read mounts and their capacity.
   *
   * Mounts the query cannot reach are skipped. Missing or malformed
   * diskstats leaves diskIo empty.
   */
  [[nodiscard]] Result<StorageSnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "statvfs"; }

private:
  std::shared_ptr<const support::IFileReader> reader_;
  FilesystemQuery query_;
};

class DfStorageSource final : public source::Source<StorageSnapshot> {
public:
  explicit DfStorageSource(std::shared_ptr<const support::IProcessRunner> runner);

  [[nodiscard]] Result<StorageSnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "df"; }

private:
  std::shared_ptr<const support::IProcessRunner> runner_;
};

[[nodiscard]] std::unique_ptr<source::Source<StorageSnapshot>>
createStorageSource(std::shared_ptr<const support::IFileReader> reader,
                    std::shared_ptr<const support::IProcessRunner> runner);

} // namespace storage

} // namespace headroom

#endif // HEADROOM_STORAGE_STORAGE_SOURCE_HPP
