/**
 * @file CgroupParser.cpp
 * @brief cgroup coordinator.
 */

#include "src/cgroup/inc/CgroupParser.hpp"

namespace headroom {

namespace cgroup {

CgroupParser::CgroupParser(std::shared_ptr<const support::IFileReader> reader,
                           helpers::clock::MonotonicClock clock)
    : detector_(std::make_shared<CgroupVersionDetector>(reader)),
      v1Resolver_(std::make_shared<CgroupV1PathResolver>(reader)),
      v2Resolver_(std::make_shared<CgroupV2PathResolver>(reader)),
      v1Cpu_(reader, v1Resolver_, clock), v1Memory_(reader, v1Resolver_),
      v2Cpu_(reader, v2Resolver_, clock), v2Memory_(reader, v2Resolver_) {}

ContainerLimits CgroupParser::parse(double hostCpuCores) {
  switch (detector_->detect()) {
  case CgroupVersion::V1:
    return parseV1(hostCpuCores);
  case CgroupVersion::V2:
    return parseV2(hostCpuCores);
  case CgroupVersion::NONE:
  case CgroupVersion::UNKNOWN:
  default:
    return ContainerLimits{};
  }
}

ContainerLimits CgroupParser::parseV1(double hostCpuCores) {
  ContainerLimits limits{};
  limits.cgroupVersion = CgroupVersion::V1;
  limits.cpuQuotaCores = v1Cpu_.parseQuota(hostCpuCores);
  limits.cpuUsageCores = v1Cpu_.parseUsage();
  limits.cpuThrottledCount = v1Cpu_.parseThrottled();
  limits.memoryLimitBytes = v1Memory_.parseLimit();
  limits.memoryUsageBytes = v1Memory_.parseUsage();
  limits.oomKillCount = v1Memory_.parseOomKills();
  return limits;
}

ContainerLimits CgroupParser::parseV2(double hostCpuCores) {
  ContainerLimits limits{};
  limits.cgroupVersion = CgroupVersion::V2;
  limits.cpuQuotaCores = v2Cpu_.parseQuota(hostCpuCores);
  limits.cpuUsageCores = v2Cpu_.parseUsage();
  limits.cpuThrottledCount = v2Cpu_.parseThrottled();
  limits.memoryLimitBytes = v2Memory_.parseLimit();
  limits.memoryUsageBytes = v2Memory_.parseUsage();
  limits.oomKillCount = v2Memory_.parseOomKills();
  return limits;
}

void CgroupParser::reset() noexcept {
  detector_->reset();
  v1Resolver_->reset();
  v2Resolver_->reset();
  v1Cpu_.reset();
  v2Cpu_.reset();
}

} // namespace cgroup

} // namespace headroom
