#ifndef HEADROOM_SYSTEM_SYSTEM_LIMITS_HPP
#define HEADROOM_SYSTEM_SYSTEM_LIMITS_HPP
/**
 * @file SystemLimits.hpp
 * @brief Effective CPU/memory capacity and current usage, container-aware.
 * @note Thread-safe: Plain value type; every accessor is a pure function of the fields.
 *
 * Limits come from cgroups when the process runs inside one, otherwise from
 * host totals. Utilization may exceed 100 when over-provisioned; headroom is
 * floored at 0.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace headroom {

namespace system {

/* ----------------------------- Constants ----------------------------- */

/// Default utilization (percent) at which pressure is reported.
inline constexpr double DEFAULT_PRESSURE_THRESHOLD = 80.0;

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Where the limits were taken from.
 */
enum class LimitSource : std::uint8_t {
  HOST = 0,  ///< Host totals (bare metal or VM)
  CGROUP_V1, ///< cgroup v1 controllers
  CGROUP_V2, ///< cgroup v2 unified hierarchy
};

/// @return Static string ("host", "cgroup_v1", "cgroup_v2").
[[nodiscard]] const char* toString(LimitSource source) noexcept;

/* ----------------------------- SystemLimits ----------------------------- */

struct SystemLimits {
  LimitSource source{LimitSource::HOST};

  std::int64_t cpuCores{0};                 ///< Whole-core ceiling of the CPU limit
  std::int64_t memoryBytes{0};              ///< Memory limit in bytes
  std::int64_t currentCpuCores{0};          ///< Whole cores in use (ceiling)
  double currentMemoryBytes{0.0};           ///< Memory in use
  std::optional<std::int64_t> swapBytes{};  ///< Swap capacity, if known
  std::optional<double> currentSwapBytes{}; ///< Swap in use, if known

  /// max(0, cpuCores - currentCpuCores).
  [[nodiscard]] std::int64_t availableCpuCores() const noexcept;

  /// max(0, memoryBytes - currentMemoryBytes).
  [[nodiscard]] std::int64_t availableMemoryBytes() const noexcept;

  /// currentCpuCores / cpuCores * 100 (0 when cpuCores is 0). May exceed 100.
  [[nodiscard]] double cpuUtilization() const noexcept;

  /// currentMemoryBytes / memoryBytes * 100 (0 when memoryBytes is 0).
  [[nodiscard]] double memoryUtilization() const noexcept;

  /// Swap in use as a percentage; absent when swap figures are unknown.
  [[nodiscard]] std::optional<double> swapUtilization() const noexcept;

  /// max(0, 100 - cpuUtilization()).
  [[nodiscard]] double cpuHeadroom() const noexcept;

  /// max(0, 100 - memoryUtilization()).
  [[nodiscard]] double memoryHeadroom() const noexcept;

  /// True if @p additionalCores more cores fit under the limit.
  [[nodiscard]] bool canScaleCpu(std::int64_t additionalCores) const noexcept;

  /// True if @p additionalBytes more bytes fit under the limit.
  [[nodiscard]] bool canScaleMemory(std::int64_t additionalBytes) const noexcept;

  [[nodiscard]] bool
  isCpuPressure(double thresholdPercent = DEFAULT_PRESSURE_THRESHOLD) const noexcept;

  [[nodiscard]] bool
  isMemoryPressure(double thresholdPercent = DEFAULT_PRESSURE_THRESHOLD) const noexcept;

  /// True when limits came from a cgroup.
  [[nodiscard]] bool isContainerized() const noexcept { return source != LimitSource::HOST; }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

} // namespace system

} // namespace headroom

#endif // HEADROOM_SYSTEM_SYSTEM_LIMITS_HPP
