/**
 * @file CgroupVersionDetector.cpp
 * @brief cgroup hierarchy detection.
 */

#include "src/cgroup/inc/CgroupVersionDetector.hpp"
#include "src/helpers/inc/Log.hpp"

#include <utility>

namespace headroom {

namespace cgroup {

CgroupVersionDetector::CgroupVersionDetector(std::shared_ptr<const support::IFileReader> reader)
    : reader_(std::move(reader)) {}

CgroupVersion CgroupVersionDetector::detect() {
  if (cached_) {
    return *cached_;
  }

  CgroupVersion version = CgroupVersion::NONE;
  if (reader_->exists(CGROUP_V2_CONTROLLERS_PATH)) {
    version = CgroupVersion::V2;
  } else if (reader_->exists(PROC_SELF_CGROUP_PATH)) {
    version = CgroupVersion::V1;
  }

  helpers::log::logger()->debug("Detected cgroup version: {}", toString(version));
  cached_ = version;
  return version;
}

} // namespace cgroup

} // namespace headroom
