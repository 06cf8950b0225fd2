#ifndef HEADROOM_SUPPORT_CONFIG_HPP
#define HEADROOM_SUPPORT_CONFIG_HPP
/**
 * @file Config.hpp
 * @brief Runtime configuration for readers, runners and logging.
 *
 * Environment overrides (read by Config::fromEnvironment()):
 *  - HEADROOM_PROC_ROOT: directory that stands in for "/" under /proc
 *  - HEADROOM_SYS_ROOT:  directory that stands in for "/" under /sys
 *  - HEADROOM_LOG_LEVEL: spdlog level name for the "headroom" logger
 *
 * The roots let a monitoring sidecar read a host or container's pseudo-files
 * from a bind mount (e.g. HEADROOM_PROC_ROOT=/host maps /proc/stat to
 * /host/proc/stat).
 */

#include <string>
#include <vector>

namespace headroom {

namespace support {

/* ----------------------------- Defaults ----------------------------- */

/// Path prefixes FileReader accepts by default: /proc/, /sys/, and the os-release
/// and container marker files.
[[nodiscard]] std::vector<std::string> defaultAllowedPathPrefixes();

/// Command prefixes ProcessRunner accepts by default.
[[nodiscard]] std::vector<std::string> defaultAllowedCommandPrefixes();

/* ----------------------------- Config ----------------------------- */

/**
 * @brief Library-wide runtime settings.
 */
struct Config {
  std::string procRoot{}; ///< Remap root for /proc (empty = real /proc)
  std::string sysRoot{};  ///< Remap root for /sys (empty = real /sys)
  std::vector<std::string> allowedPathPrefixes{defaultAllowedPathPrefixes()};
  std::vector<std::string> allowedCommandPrefixes{defaultAllowedCommandPrefixes()};
  std::string logLevel{"warn"};

  /// Defaults overlaid with HEADROOM_* environment variables.
  [[nodiscard]] static Config fromEnvironment();

  /// Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

} // namespace support

} // namespace headroom

#endif // HEADROOM_SUPPORT_CONFIG_HPP
