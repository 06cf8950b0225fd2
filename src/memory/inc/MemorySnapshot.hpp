#ifndef HEADROOM_MEMORY_MEMORY_SNAPSHOT_HPP
#define HEADROOM_MEMORY_MEMORY_SNAPSHOT_HPP
/**
 * @file MemorySnapshot.hpp
 * @brief Physical and swap memory usage at one instant.
 * @note Thread-safe: Value type and pure parser.
 */

#include "src/helpers/inc/Result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace headroom {

namespace memory {

/* ----------------------------- MemorySnapshot ----------------------------- */

/**
 * @brief System memory counters in bytes.
 *
 * "used" excludes reclaimable buffers and page cache, matching free(1).
 */
struct MemorySnapshot {
  std::uint64_t totalBytes{0};     ///< MemTotal
  std::uint64_t freeBytes{0};      ///< MemFree
  std::uint64_t availableBytes{0}; ///< MemAvailable (MemFree on old kernels)
  std::uint64_t usedBytes{0};      ///< total - free - buffers - cached, floored at 0
  std::uint64_t buffersBytes{0};   ///< Buffers
  std::uint64_t cachedBytes{0};    ///< Cached
  std::uint64_t swapTotalBytes{0}; ///< SwapTotal
  std::uint64_t swapFreeBytes{0};  ///< SwapFree
  std::uint64_t swapUsedBytes{0};  ///< swapTotal - swapFree, floored at 0

  /// used/total * 100 (0 if total is 0).
  [[nodiscard]] double usedPercentage() const noexcept;

  /// available/total * 100 (0 if total is 0).
  [[nodiscard]] double availablePercentage() const noexcept;

  /// swapUsed/swapTotal * 100 (0 without swap).
  [[nodiscard]] double swapUsedPercentage() const noexcept;

  [[nodiscard]] bool hasSwap() const noexcept { return swapTotalBytes > 0; }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse /proc/meminfo content ("Key:   value kB" lines).
 * @return Snapshot, or PARSE_FAILURE when MemTotal or MemFree is missing.
 */
[[nodiscard]] Result<MemorySnapshot> parseMeminfo(std::string_view content);

} // namespace memory

} // namespace headroom

#endif // HEADROOM_MEMORY_MEMORY_SNAPSHOT_HPP
