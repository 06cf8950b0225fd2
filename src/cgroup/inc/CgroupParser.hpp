#ifndef HEADROOM_CGROUP_CGROUP_PARSER_HPP
#define HEADROOM_CGROUP_CGROUP_PARSER_HPP
/**
 * @file CgroupParser.hpp
 * @brief Detection, path resolution and per-field parsing into ContainerLimits.
 * @note Linux-only.
 * @note NOT thread-safe: Owns the detector, resolvers and rate caches.
 *
 * One CgroupParser per application context. Its caches live as long as it does;
 * construct a new one (or call reset()) for an independent view.
 */

#include "src/cgroup/inc/CgroupCpuParser.hpp"
#include "src/cgroup/inc/CgroupMemoryParser.hpp"
#include "src/cgroup/inc/CgroupPathResolver.hpp"
#include "src/cgroup/inc/CgroupVersionDetector.hpp"
#include "src/cgroup/inc/ContainerLimits.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/support/inc/FileReader.hpp"

#include <memory>

namespace headroom {

namespace cgroup {

/* ----------------------------- CgroupParser ----------------------------- */

class CgroupParser {
public:
  /**
   * @param reader File access for every cgroup and /proc read.
   * @param clock  Clock for usage rates (system monotonic clock when empty).
   */
  explicit CgroupParser(std::shared_ptr<const support::IFileReader> reader,
                        helpers::clock::MonotonicClock clock = {});

  /**
   * @brief Read every limit field for the detected hierarchy.
   *
   * Returns ContainerLimits{NONE} with all fields absent when no cgroup is
   * visible. Fields that cannot be read are absent; this never fails.
   *
   * @param hostCpuCores Upper bound for the CPU quota.
   */
  [[nodiscard]] ContainerLimits parse(double hostCpuCores);

  /// Cached hierarchy detection.
  [[nodiscard]] CgroupVersion version() { return detector_->detect(); }

  /// Drop the detection, membership and usage-rate caches.
  void reset() noexcept;

private:
  [[nodiscard]] ContainerLimits parseV1(double hostCpuCores);
  [[nodiscard]] ContainerLimits parseV2(double hostCpuCores);

  std::shared_ptr<CgroupVersionDetector> detector_;
  std::shared_ptr<CgroupV1PathResolver> v1Resolver_;
  std::shared_ptr<CgroupV2PathResolver> v2Resolver_;
  CgroupV1CpuParser v1Cpu_;
  CgroupV1MemoryParser v1Memory_;
  CgroupV2CpuParser v2Cpu_;
  CgroupV2MemoryParser v2Memory_;
};

} // namespace cgroup

} // namespace headroom

#endif // HEADROOM_CGROUP_CGROUP_PARSER_HPP
