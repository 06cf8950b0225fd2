#ifndef HEADROOM_STORAGE_STORAGE_SNAPSHOT_HPP
#define HEADROOM_STORAGE_STORAGE_SNAPSHOT_HPP
/**
 * @file StorageSnapshot.hpp
 * @brief Mounted filesystem capacity and whole-disk I/O counters.
 * @note Thread-safe: Value types and pure parsers.
 */

#include "src/helpers/inc/Result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace headroom {

namespace storage {

/* ----------------------------- Constants ----------------------------- */

/// /proc/diskstats sector unit, independent of the device's physical sector size.
inline constexpr std::uint64_t DISKSTATS_SECTOR_BYTES = 512;

/* ----------------------------- MountEntry ----------------------------- */

/**
 * @brief One /proc/mounts line.
 */
struct MountEntry {
  std::string device;     ///< Source device ("/dev/sda1", "overlay")
  std::string mountPoint; ///< Mount path, octal escapes decoded
  std::string fsType;     ///< Filesystem type ("ext4")

  /// True if the source is a /dev/ node.
  [[nodiscard]] bool isBlockDevice() const noexcept;
};

/// True for filesystem types that hold persistent data (ext4, xfs, btrfs, ...).
[[nodiscard]] bool isDiskFilesystem(std::string_view fsType) noexcept;

/// True for kernel pseudo filesystems (proc, sysfs, cgroup, tmpfs, ...).
[[nodiscard]] bool isPseudoFilesystem(std::string_view fsType) noexcept;

/* ----------------------------- MountPoint ----------------------------- */

/**
 * @brief Capacity of one mounted filesystem.
 */
struct MountPoint {
  std::string device;
  std::string mountPoint;
  std::string fsType;              ///< Empty when the source does not report it (df)
  std::uint64_t totalBytes{0};
  std::uint64_t usedBytes{0};
  std::uint64_t availableBytes{0}; ///< Available to unprivileged users
  std::uint64_t totalInodes{0};
  std::uint64_t usedInodes{0};
  std::uint64_t freeInodes{0};

  /// used/total * 100 (0 if total is 0).
  [[nodiscard]] double usedPercentage() const noexcept;
};

/* ----------------------------- DiskIoStats ----------------------------- */

/**
 * @brief Cumulative I/O counters of one whole disk from /proc/diskstats.
 */
struct DiskIoStats {
  std::string device;
  std::uint64_t readsCompleted{0};
  std::uint64_t readBytes{0};
  std::uint64_t writesCompleted{0};
  std::uint64_t writeBytes{0};
  std::uint64_t ioTimeMs{0};         ///< Time spent doing I/O
  std::uint64_t weightedIoTimeMs{0}; ///< I/O time weighted by queue depth
};

/* ----------------------------- StorageSnapshot ----------------------------- */

struct StorageSnapshot {
  std::vector<MountPoint> mountPoints;
  std::vector<DiskIoStats> diskIo; ///< Empty when diskstats is unavailable

  [[nodiscard]] std::uint64_t totalBytes() const noexcept;
  [[nodiscard]] std::uint64_t usedBytes() const noexcept;
  [[nodiscard]] std::uint64_t availableBytes() const noexcept;

  /// usedBytes/totalBytes * 100 across all mounts (0 if total is 0).
  [[nodiscard]] double usedPercentage() const noexcept;

  /**
   * @brief Mount containing @p path: the longest mount point that equals it
   *        or is a parent directory of it.
   * @return Mount, or nullptr if none matches.
   */
  [[nodiscard]] const MountPoint* findMountPoint(std::string_view path) const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse /proc/mounts, keeping block-backed and disk filesystems only.
 */
[[nodiscard]] std::vector<MountEntry> parseMounts(std::string_view content);

/**
 * @brief Parse /proc/diskstats, keeping whole disks only.
 *
 * Partitions (sdXN, nvmeXnYpZ, mmcblkXpY) and lines with fewer than 14
 * fields are skipped.
 *
 * @return Disks, or PARSE_FAILURE on empty content.
 */
[[nodiscard]] Result<std::vector<DiskIoStats>> parseDiskstats(std::string_view content);

/**
 * @brief Parse POSIX `df -kP` output (1024-byte blocks).
 *
 * Pseudo filesystems are skipped. Mount points containing spaces are kept intact.
 *
 * @return Mounts, or PARSE_FAILURE when the header is missing.
 */
[[nodiscard]] Result<std::vector<MountPoint>> parseDfOutput(std::string_view content);

} // namespace storage

} // namespace headroom

#endif // HEADROOM_STORAGE_STORAGE_SNAPSHOT_HPP
