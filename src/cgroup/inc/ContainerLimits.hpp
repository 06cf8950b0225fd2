#ifndef HEADROOM_CGROUP_CONTAINER_LIMITS_HPP
#define HEADROOM_CGROUP_CONTAINER_LIMITS_HPP
/**
 * @file ContainerLimits.hpp
 * @brief cgroup version and the container CPU/memory limits derived from it.
 * @note Thread-safe: Plain value types.
 *
 * Every limit field is optional. A field is absent when its cgroup file is
 * missing, unreadable, malformed, or reports "unlimited". When cgroupVersion is
 * NONE every field is absent.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace headroom {

namespace cgroup {

/* ----------------------------- Constants ----------------------------- */

/**
 * @brief cgroup v1 memory.limit_in_bytes values at or above this mean "no limit".
 *
 * The kernel reports LONG_MAX rounded down to the page size
 * (9223372036854771712 on 4 KiB pages).
 */
inline constexpr std::int64_t V1_MEMORY_UNLIMITED_THRESHOLD = 9'000'000'000'000'000'000;

/// cgroup v2 token for "no limit" in cpu.max and memory.max.
inline constexpr const char* V2_UNLIMITED_TOKEN = "max";

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief cgroup hierarchy in effect for this process.
 */
enum class CgroupVersion : std::uint8_t {
  NONE = 0, ///< No cgroup filesystem visible
  V1,       ///< Legacy per-controller hierarchies
  V2,       ///< Unified hierarchy
  UNKNOWN,  ///< Not yet determined
};

/**
 * @brief Convert CgroupVersion to human-readable string.
 * @return Static string ("none", "v1", "v2", "unknown").
 */
[[nodiscard]] const char* toString(CgroupVersion version) noexcept;

/* ----------------------------- Main Struct ----------------------------- */

/**
 * @brief Container resource limits and usage read from cgroupfs.
 */
struct ContainerLimits {
  /// Hierarchy the values were read from.
  CgroupVersion cgroupVersion{CgroupVersion::NONE};

  /* --- CPU --- */

  /// quota/period in cores, clamped to the host core count; absent if unlimited.
  std::optional<double> cpuQuotaCores{};

  /// Cores in use, derived from two usage samples; absent on the first read.
  std::optional<double> cpuUsageCores{};

  /// Cumulative count of throttled periods.
  std::optional<std::uint64_t> cpuThrottledCount{};

  /* --- Memory --- */

  /// Hard memory limit in bytes; absent if unlimited.
  std::optional<std::int64_t> memoryLimitBytes{};

  /// Current memory usage in bytes.
  std::optional<std::int64_t> memoryUsageBytes{};

  /// Cumulative OOM kill (v2) or under-OOM (v1) counter.
  std::optional<std::uint64_t> oomKillCount{};

  /* --- Computed Values --- */

  [[nodiscard]] bool hasCpuLimit() const noexcept { return cpuQuotaCores.has_value(); }

  [[nodiscard]] bool hasMemoryLimit() const noexcept { return memoryLimitBytes.has_value(); }

  /// Usage as a percentage of the quota, capped at 100; absent without both values.
  [[nodiscard]] std::optional<double> cpuUtilizationPercentage() const noexcept;

  /// Usage as a percentage of the limit, capped at 100; absent without both values.
  [[nodiscard]] std::optional<double> memoryUtilizationPercentage() const noexcept;

  /// max(0, quota - usage); absent without both values.
  [[nodiscard]] std::optional<double> availableCpuCores() const noexcept;

  /// max(0, limit - usage); absent without both values.
  [[nodiscard]] std::optional<std::int64_t> availableMemoryBytes() const noexcept;

  /// True if at least one period was throttled.
  [[nodiscard]] bool isCpuThrottled() const noexcept;

  /// True if at least one OOM event was recorded.
  [[nodiscard]] bool hasOomKills() const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

} // namespace cgroup

} // namespace headroom

#endif // HEADROOM_CGROUP_CONTAINER_LIMITS_HPP
