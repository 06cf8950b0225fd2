/**
 * @file StorageSnapshot.cpp
 * @brief Mount, diskstats and df parsers and StorageSnapshot totals.
 */

#include "src/storage/inc/StorageSnapshot.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <array>
#include <cstddef>
#include <utility>

#include <fmt/core.h>

namespace headroom {

namespace storage {

namespace {

using headroom::helpers::format::bytesBinary;
using headroom::helpers::strings::isAllDigits;
using headroom::helpers::strings::isDigit;
using headroom::helpers::strings::parseUint64;
using headroom::helpers::strings::splitLines;
using headroom::helpers::strings::splitWhitespace;
using headroom::helpers::strings::startsWith;
using headroom::helpers::strings::trim;

constexpr std::size_t DISKSTATS_MIN_FIELDS = 14;
constexpr std::size_t DF_MIN_FIELDS = 6;
constexpr std::uint64_t KIB = 1024;

constexpr std::array<std::string_view, 13> DISK_FS_TYPES = {
    "ext2", "ext3", "ext4", "xfs", "btrfs", "zfs", "vfat",
    "exfat", "ntfs", "ntfs3", "f2fs", "overlay", "fuseblk",
};

constexpr std::array<std::string_view, 19> PSEUDO_FS_TYPES = {
    "proc", "sysfs", "devpts", "tmpfs", "devtmpfs", "cgroup", "cgroup2",
    "pstore", "bpf", "tracefs", "debugfs", "securityfs", "fusectl", "configfs",
    "mqueue", "hugetlbfs", "autofs", "binfmt_misc", "ramfs",
};

/// Decode the \ooo escapes /proc/mounts uses for space, tab, newline and backslash.
std::string decodeMountPath(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size() && isDigit(s[i + 1]) && isDigit(s[i + 2]) &&
        isDigit(s[i + 3])) {
      const int CODE = (s[i + 1] - '0') * 64 + (s[i + 2] - '0') * 8 + (s[i + 3] - '0');
      out += static_cast<char>(CODE);
      i += 3;
    } else {
      out += s[i];
    }
  }
  return out;
}

/// "sda1" -> true. Whole disk "sda" -> false.
bool isSdPartition(std::string_view dev) noexcept {
  if (dev.size() < 4 || !startsWith(dev, "sd")) {
    return false;
  }
  const char LETTER = dev[2];
  return LETTER >= 'a' && LETTER <= 'z' && isAllDigits(dev.substr(3));
}

/// "<prefix>N...pM" with digits on both sides of the last 'p'.
bool isPrefixedPartition(std::string_view dev, std::string_view prefix) noexcept {
  if (!startsWith(dev, prefix)) {
    return false;
  }
  const std::size_t P = dev.rfind('p');
  if (P == std::string_view::npos || P <= prefix.size()) {
    return false;
  }
  return isAllDigits(dev.substr(P + 1)) && isDigit(dev[P - 1]);
}

/// "nvme0n1p1" -> true. Namespace "nvme0n1" -> false.
bool isNvmePartition(std::string_view dev) noexcept {
  if (!isPrefixedPartition(dev, "nvme")) {
    return false;
  }
  return dev.find('n', 4) != std::string_view::npos;
}

bool isPartition(std::string_view dev) noexcept {
  return isSdPartition(dev) || isNvmePartition(dev) || isPrefixedPartition(dev, "mmcblk");
}

} // namespace

/* ----------------------------- MountEntry ----------------------------- */

bool MountEntry::isBlockDevice() const noexcept { return startsWith(device, "/dev/"); }

bool isDiskFilesystem(std::string_view fsType) noexcept {
  for (const std::string_view T : DISK_FS_TYPES) {
    if (fsType == T) {
      return true;
    }
  }
  return false;
}

bool isPseudoFilesystem(std::string_view fsType) noexcept {
  for (const std::string_view T : PSEUDO_FS_TYPES) {
    if (fsType == T) {
      return true;
    }
  }
  return false;
}

/* ----------------------------- MountPoint ----------------------------- */

double MountPoint::usedPercentage() const noexcept {
  if (totalBytes == 0) {
    return 0.0;
  }
  return static_cast<double>(usedBytes) * 100.0 / static_cast<double>(totalBytes);
}

/* ----------------------------- StorageSnapshot ----------------------------- */

std::uint64_t StorageSnapshot::totalBytes() const noexcept {
  std::uint64_t sum = 0;
  for (const MountPoint& m : mountPoints) {
    sum += m.totalBytes;
  }
  return sum;
}

std::uint64_t StorageSnapshot::usedBytes() const noexcept {
  std::uint64_t sum = 0;
  for (const MountPoint& m : mountPoints) {
    sum += m.usedBytes;
  }
  return sum;
}

std::uint64_t StorageSnapshot::availableBytes() const noexcept {
  std::uint64_t sum = 0;
  for (const MountPoint& m : mountPoints) {
    sum += m.availableBytes;
  }
  return sum;
}

double StorageSnapshot::usedPercentage() const noexcept {
  const std::uint64_t TOTAL = totalBytes();
  if (TOTAL == 0) {
    return 0.0;
  }
  return static_cast<double>(usedBytes()) * 100.0 / static_cast<double>(TOTAL);
}

const MountPoint* StorageSnapshot::findMountPoint(std::string_view path) const noexcept {
  const MountPoint* best = nullptr;
  for (const MountPoint& m : mountPoints) {
    const std::string_view MP = m.mountPoint;
    if (!startsWith(path, MP)) {
      continue;
    }
    // "/data" must not match "/database".
    const bool BOUNDARY =
        path.size() == MP.size() || MP == "/" || (!MP.empty() && MP.back() == '/') ||
        path[MP.size()] == '/';
    if (!BOUNDARY) {
      continue;
    }
    if (best == nullptr || MP.size() > best->mountPoint.size()) {
      best = &m;
    }
  }
  return best;
}

std::string StorageSnapshot::toString() const {
  std::string out;
  out += fmt::format("Mounts: {} ({} / {} used, {:.1f}%)\n", mountPoints.size(),
                     bytesBinary(usedBytes()), bytesBinary(totalBytes()), usedPercentage());
  for (const MountPoint& m : mountPoints) {
    out += fmt::format("  {} on {} ({}): {} / {} ({:.1f}%)\n", m.device, m.mountPoint,
                       m.fsType.empty() ? "?" : m.fsType, bytesBinary(m.usedBytes),
                       bytesBinary(m.totalBytes), m.usedPercentage());
  }
  for (const DiskIoStats& d : diskIo) {
    out += fmt::format("  {}: read={} ({} ops) write={} ({} ops)\n", d.device,
                       bytesBinary(d.readBytes), d.readsCompleted, bytesBinary(d.writeBytes),
                       d.writesCompleted);
  }
  return out;
}

/* ----------------------------- Parsing ----------------------------- */

std::vector<MountEntry> parseMounts(std::string_view content) {
  std::vector<MountEntry> out;
  for (const std::string_view RAW : splitLines(content)) {
    const std::string_view LINE = trim(RAW);
    if (LINE.empty() || LINE.front() == '#') {
      continue;
    }
    // device mountpoint fstype options freq passno
    const auto FIELDS = splitWhitespace(LINE);
    if (FIELDS.size() < 3) {
      continue;
    }
    MountEntry e{};
    e.device = decodeMountPath(FIELDS[0]);
    e.mountPoint = decodeMountPath(FIELDS[1]);
    e.fsType = std::string(FIELDS[2]);
    if (isPseudoFilesystem(e.fsType)) {
      continue;
    }
    if (!e.isBlockDevice() && !isDiskFilesystem(e.fsType)) {
      continue;
    }
    out.push_back(std::move(e));
  }
  return out;
}

Result<std::vector<DiskIoStats>> parseDiskstats(std::string_view content) {
  if (trim(content).empty()) {
    return Result<std::vector<DiskIoStats>>::failure(ErrorCode::PARSE_FAILURE,
                                                     "diskstats content is empty");
  }

  std::vector<DiskIoStats> out;
  for (const std::string_view LINE : splitLines(content)) {
    // major minor name reads merged sectors ms writes merged sectors ms inflight io_ms weighted_ms
    const auto FIELDS = splitWhitespace(LINE);
    if (FIELDS.size() < DISKSTATS_MIN_FIELDS) {
      continue;
    }
    const std::string_view DEVICE = FIELDS[2];
    if (isPartition(DEVICE)) {
      continue;
    }

    DiskIoStats d{};
    d.device = std::string(DEVICE);
    d.readsCompleted = parseUint64(FIELDS[3]).value_or(0);
    d.readBytes = parseUint64(FIELDS[5]).value_or(0) * DISKSTATS_SECTOR_BYTES;
    d.writesCompleted = parseUint64(FIELDS[7]).value_or(0);
    d.writeBytes = parseUint64(FIELDS[9]).value_or(0) * DISKSTATS_SECTOR_BYTES;
    d.ioTimeMs = parseUint64(FIELDS[12]).value_or(0);
    d.weightedIoTimeMs = parseUint64(FIELDS[13]).value_or(0);
    out.push_back(std::move(d));
  }
  return Result<std::vector<DiskIoStats>>::success(std::move(out));
}

Result<std::vector<MountPoint>> parseDfOutput(std::string_view content) {
  const auto LINES = splitLines(content);
  if (LINES.empty() || !startsWith(trim(LINES[0]), "Filesystem")) {
    return Result<std::vector<MountPoint>>::failure(ErrorCode::PARSE_FAILURE,
                                                    "Missing df header line");
  }

  std::vector<MountPoint> out;
  for (std::size_t i = 1; i < LINES.size(); ++i) {
    // Filesystem 1024-blocks Used Available Capacity Mounted-on
    const auto FIELDS = splitWhitespace(LINES[i]);
    if (FIELDS.size() < DF_MIN_FIELDS) {
      continue;
    }
    if (isPseudoFilesystem(FIELDS[0])) {
      continue;
    }
    const auto TOTAL = parseUint64(FIELDS[1]);
    const auto USED = parseUint64(FIELDS[2]);
    const auto AVAIL = parseUint64(FIELDS[3]);
    if (!TOTAL || !USED || !AVAIL) {
      continue;
    }

    // Rejoin a mount point that contains spaces.
    const std::string_view LINE = LINES[i];
    const std::size_t MP_BEGIN = static_cast<std::size_t>(FIELDS[5].data() - LINE.data());

    MountPoint m{};
    m.device = std::string(FIELDS[0]);
    m.mountPoint = std::string(trim(LINE.substr(MP_BEGIN)));
    m.totalBytes = *TOTAL * KIB;
    m.usedBytes = *USED * KIB;
    m.availableBytes = *AVAIL * KIB;
    out.push_back(std::move(m));
  }
  return Result<std::vector<MountPoint>>::success(std::move(out));
}

} // namespace storage

} // namespace headroom
