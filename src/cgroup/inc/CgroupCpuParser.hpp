#ifndef HEADROOM_CGROUP_CGROUP_CPU_PARSER_HPP
#define HEADROOM_CGROUP_CGROUP_CPU_PARSER_HPP
/**
 * @file CgroupCpuParser.hpp
 * @brief CPU quota, usage rate and throttling from cgroup v1 and v2 files.
 * @note Linux-only.
 * @note NOT thread-safe: Each parser owns a RateCache.
 *
 * Files:
 *  - v1: cpu.cfs_quota_us, cpu.cfs_period_us, cpuacct.usage (ns), cpu.stat
 *  - v2: cpu.max ("<quota|max> <period>"), cpu.stat (usage_usec, nr_throttled)
 *
 * Every method degrades to nullopt on a missing file, a malformed value or an
 * unlimited setting. Nothing here fails the caller.
 */

#include "src/cgroup/inc/CgroupPathResolver.hpp"
#include "src/cgroup/inc/RateCache.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/support/inc/FileReader.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace headroom {

namespace cgroup {

/* ----------------------------- Constants ----------------------------- */

/// cpuacct.usage units per second.
inline constexpr double V1_USAGE_SCALE = 1e9;

/// cpu.stat usage_usec units per second.
inline constexpr double V2_USAGE_SCALE = 1e6;

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief quota/period in cores, clamped to @p hostCpuCores when that is positive.
 * @return nullopt when quota or period is not positive (no limit).
 */
[[nodiscard]] std::optional<double> computeCpuQuota(std::int64_t quota, std::int64_t period,
                                                    double hostCpuCores) noexcept;

/// v1 quota from the raw cpu.cfs_quota_us and cpu.cfs_period_us contents.
[[nodiscard]] std::optional<double> parseV1CpuQuota(std::string_view quotaContent,
                                                    std::string_view periodContent,
                                                    double hostCpuCores) noexcept;

/// v2 quota from the raw cpu.max content; "max" yields nullopt.
[[nodiscard]] std::optional<double> parseV2CpuMax(std::string_view content,
                                                  double hostCpuCores) noexcept;

/* ----------------------------- CgroupV1CpuParser ----------------------------- */

class CgroupV1CpuParser {
public:
  CgroupV1CpuParser(std::shared_ptr<const support::IFileReader> reader,
                    std::shared_ptr<CgroupV1PathResolver> resolver,
                    helpers::clock::MonotonicClock clock = {});

  /// CFS quota in cores (cpu controller, then cpuacct).
  [[nodiscard]] std::optional<double> parseQuota(double hostCpuCores);

  /// Cores in use from cpuacct.usage; nullopt until the second call.
  [[nodiscard]] std::optional<double> parseUsage();

  /// nr_throttled from cpu.stat.
  [[nodiscard]] std::optional<std::uint64_t> parseThrottled();

  /// Drop usage history.
  void reset() noexcept { usageCache_.reset(); }

private:
  [[nodiscard]] std::optional<std::string> resolveCpuFile(std::string_view file);
  [[nodiscard]] std::optional<std::string> readFile(const std::optional<std::string>& path) const;

  std::shared_ptr<const support::IFileReader> reader_;
  std::shared_ptr<CgroupV1PathResolver> resolver_;
  RateCache usageCache_;
};

/* ----------------------------- CgroupV2CpuParser ----------------------------- */

class CgroupV2CpuParser {
public:
  CgroupV2CpuParser(std::shared_ptr<const support::IFileReader> reader,
                    std::shared_ptr<CgroupV2PathResolver> resolver,
                    helpers::clock::MonotonicClock clock = {});

  /// cpu.max quota in cores.
  [[nodiscard]] std::optional<double> parseQuota(double hostCpuCores);

  /// Cores in use from cpu.stat usage_usec; nullopt until the second call.
  [[nodiscard]] std::optional<double> parseUsage();

  /// nr_throttled from cpu.stat.
  [[nodiscard]] std::optional<std::uint64_t> parseThrottled();

  void reset() noexcept { usageCache_.reset(); }

private:
  [[nodiscard]] std::optional<std::string> readFile(std::string_view file,
                                                    std::string* resolvedPath = nullptr);

  std::shared_ptr<const support::IFileReader> reader_;
  std::shared_ptr<CgroupV2PathResolver> resolver_;
  RateCache usageCache_;
};

} // namespace cgroup

} // namespace headroom

#endif // HEADROOM_CGROUP_CGROUP_CPU_PARSER_HPP
