#ifndef HEADROOM_CGROUP_CGROUP_PATH_RESOLVER_HPP
#define HEADROOM_CGROUP_CGROUP_PATH_RESOLVER_HPP
/**
 * @file CgroupPathResolver.hpp
 * @brief Locate cgroup control files for the calling process (v1 and v2).
 * @note Linux-only. Parses /proc/self/cgroup once per resolver instance.
 * @note NOT thread-safe: Lazily caches the parsed membership.
 *
 * /proc/self/cgroup lines have the form "hierarchy-id:controller-list:path":
 *
 *   v1:  4:cpu,cpuacct:/docker/3f2a...
 *        9:memory:/docker/3f2a...
 *   v2:  0::/system.slice/app.service
 *
 * A resolved path is returned only if the file is readable.
 */

#include "src/support/inc/FileReader.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace headroom {

namespace cgroup {

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Where one v1 controller is mounted and the process's cgroup within it.
 */
struct CgroupV1Mapping {
  std::string mount{}; ///< Directory under /sys/fs/cgroup (the controller name)
  std::string path{};  ///< Cgroup path relative to the controller root
};

/// Controller name to mapping.
using CgroupV1Mappings = std::map<std::string, CgroupV1Mapping>;

/**
 * @brief Parse v1 membership lines. Lines with an empty controller list
 *        (including the v2 "0::" line) are skipped.
 */
[[nodiscard]] CgroupV1Mappings parseCgroupV1Mappings(std::string_view content);

/**
 * @brief Extract the unified-hierarchy path from a "0::<path>" line.
 * @return Path, or nullopt if no such line exists.
 */
[[nodiscard]] std::optional<std::string> parseCgroupV2UnifiedPath(std::string_view content);

/* ----------------------------- CgroupV1PathResolver ----------------------------- */

class CgroupV1PathResolver {
public:
  explicit CgroupV1PathResolver(std::shared_ptr<const support::IFileReader> reader);

  /**
   * @brief Path of @p file for @p controller.
   *
   * Tries /sys/fs/cgroup/<mount><path>/<file> from the membership mapping,
   * then /sys/fs/cgroup/<controller>/<file>.
   *
   * @return Readable path, or nullopt.
   */
  [[nodiscard]] std::optional<std::string> resolvePath(std::string_view controller,
                                                       std::string_view file);

  /// Parsed membership (reads /proc/self/cgroup on first use).
  [[nodiscard]] const CgroupV1Mappings& mappings();

  void reset() noexcept { mappings_.reset(); }

private:
  std::shared_ptr<const support::IFileReader> reader_;
  std::optional<CgroupV1Mappings> mappings_{};
};

/* ----------------------------- CgroupV2PathResolver ----------------------------- */

class CgroupV2PathResolver {
public:
  explicit CgroupV2PathResolver(std::shared_ptr<const support::IFileReader> reader);

  /**
   * @brief Path of @p file in the process's unified cgroup.
   * @return Readable /sys/fs/cgroup<unified>/<file>, or nullopt.
   */
  [[nodiscard]] std::optional<std::string> resolvePath(std::string_view file);

  /// Unified-hierarchy path (reads /proc/self/cgroup on first use).
  [[nodiscard]] const std::optional<std::string>& unifiedPath();

  void reset() noexcept {
    unifiedPath_.reset();
    resolved_ = false;
  }

private:
  std::shared_ptr<const support::IFileReader> reader_;
  std::optional<std::string> unifiedPath_{};
  bool resolved_{false};
};

} // namespace cgroup

} // namespace headroom

#endif // HEADROOM_CGROUP_CGROUP_PATH_RESOLVER_HPP
