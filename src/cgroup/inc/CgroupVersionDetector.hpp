#ifndef HEADROOM_CGROUP_CGROUP_VERSION_DETECTOR_HPP
#define HEADROOM_CGROUP_CGROUP_VERSION_DETECTOR_HPP
/**
 * @file CgroupVersionDetector.hpp
 * @brief One-time detection of the cgroup hierarchy in effect.
 * @note Linux-only. Reads /sys/fs/cgroup/cgroup.controllers, /proc/self/cgroup.
 * @note NOT thread-safe: Caches on first detect(). Share one instance per context.
 *
 * Detection order:
 *  1. /sys/fs/cgroup/cgroup.controllers readable -> V2
 *  2. /proc/self/cgroup readable                 -> V1
 *  3. otherwise                                  -> NONE
 */

#include "src/cgroup/inc/ContainerLimits.hpp"
#include "src/support/inc/FileReader.hpp"

#include <memory>
#include <optional>

namespace headroom {

namespace cgroup {

/* ----------------------------- Constants ----------------------------- */

/// Mount point of the cgroup filesystem(s).
inline constexpr const char* CGROUP_MOUNT_ROOT = "/sys/fs/cgroup";

/// Present only at the root of a cgroup v2 unified hierarchy.
inline constexpr const char* CGROUP_V2_CONTROLLERS_PATH = "/sys/fs/cgroup/cgroup.controllers";

/// Membership of the calling process.
inline constexpr const char* PROC_SELF_CGROUP_PATH = "/proc/self/cgroup";

/* ----------------------------- CgroupVersionDetector ----------------------------- */

class CgroupVersionDetector {
public:
  explicit CgroupVersionDetector(std::shared_ptr<const support::IFileReader> reader);

  /// Detected version. Touches the file system only on the first call after
  /// construction or reset().
  [[nodiscard]] CgroupVersion detect();

  /// Forget the cached version.
  void reset() noexcept { cached_.reset(); }

  /// True once detect() has run.
  [[nodiscard]] bool isCached() const noexcept { return cached_.has_value(); }

private:
  std::shared_ptr<const support::IFileReader> reader_;
  std::optional<CgroupVersion> cached_{};
};

} // namespace cgroup

} // namespace headroom

#endif // HEADROOM_CGROUP_CGROUP_VERSION_DETECTOR_HPP
