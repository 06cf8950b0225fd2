/**
 * @file CgroupPathResolver.cpp
 * @brief /proc/self/cgroup parsing and control-file path construction.
 */

#include "src/cgroup/inc/CgroupPathResolver.hpp"
#include "src/cgroup/inc/CgroupVersionDetector.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <utility>

#include <fmt/core.h>

namespace headroom {

namespace cgroup {

namespace {

using headroom::helpers::strings::split;
using headroom::helpers::strings::splitLines;
using headroom::helpers::strings::trim;
using headroom::helpers::strings::trimRightChar;

/// "<root>/<mount><relative>/<file>" with trailing slashes of @p relative removed.
std::string joinCgroupPath(std::string_view mount, std::string_view relative,
                           std::string_view file) {
  std::string out(CGROUP_MOUNT_ROOT);
  if (!mount.empty()) {
    out += '/';
    out += mount;
  }
  out += trimRightChar(relative, '/');
  out += '/';
  out += file;
  return out;
}

} // namespace

/* ----------------------------- Parsing ----------------------------- */

CgroupV1Mappings parseCgroupV1Mappings(std::string_view content) {
  CgroupV1Mappings out;
  for (const std::string_view RAW : splitLines(content)) {
    const std::string_view LINE = trim(RAW);
    if (LINE.empty()) {
      continue;
    }
    const auto PARTS = split(LINE, ':', 3);
    if (PARTS.size() < 3 || PARTS[1].empty()) {
      continue;
    }
    for (const std::string_view CTRL : split(PARTS[1], ',')) {
      if (CTRL.empty()) {
        continue;
      }
      out[std::string(CTRL)] = CgroupV1Mapping{std::string(CTRL), std::string(PARTS[2])};
    }
  }
  return out;
}

std::optional<std::string> parseCgroupV2UnifiedPath(std::string_view content) {
  for (const std::string_view RAW : splitLines(content)) {
    const auto PARTS = split(trim(RAW), ':', 3);
    if (PARTS.size() == 3 && PARTS[0] == "0" && PARTS[1].empty()) {
      return std::string(PARTS[2]);
    }
  }
  return std::nullopt;
}

/* ----------------------------- CgroupV1PathResolver ----------------------------- */

CgroupV1PathResolver::CgroupV1PathResolver(std::shared_ptr<const support::IFileReader> reader)
    : reader_(std::move(reader)) {}

const CgroupV1Mappings& CgroupV1PathResolver::mappings() {
  if (!mappings_) {
    const auto CONTENT = reader_->read(PROC_SELF_CGROUP_PATH);
    if (CONTENT.isSuccess()) {
      mappings_ = parseCgroupV1Mappings(CONTENT.value());
    } else {
      helpers::log::logger()->debug("cgroup v1 membership unavailable: {}",
                                    CONTENT.error().toString());
      mappings_ = CgroupV1Mappings{};
    }
  }
  return *mappings_;
}

std::optional<std::string> CgroupV1PathResolver::resolvePath(std::string_view controller,
                                                             std::string_view file) {
  const CgroupV1Mappings& MAP = mappings();
  const auto IT = MAP.find(std::string(controller));
  if (IT != MAP.end()) {
    std::string path = joinCgroupPath(IT->second.mount, IT->second.path, file);
    if (reader_->exists(path)) {
      return path;
    }
  }

  // Containers commonly mount their own cgroup at the controller root.
  std::string fallback = joinCgroupPath(controller, "", file);
  if (reader_->exists(fallback)) {
    return fallback;
  }
  return std::nullopt;
}

/* ----------------------------- CgroupV2PathResolver ----------------------------- */

CgroupV2PathResolver::CgroupV2PathResolver(std::shared_ptr<const support::IFileReader> reader)
    : reader_(std::move(reader)) {}

const std::optional<std::string>& CgroupV2PathResolver::unifiedPath() {
  if (!resolved_) {
    const auto CONTENT = reader_->read(PROC_SELF_CGROUP_PATH);
    if (CONTENT.isSuccess()) {
      unifiedPath_ = parseCgroupV2UnifiedPath(CONTENT.value());
    }
    resolved_ = true;
  }
  return unifiedPath_;
}

std::optional<std::string> CgroupV2PathResolver::resolvePath(std::string_view file) {
  const auto& UNIFIED = unifiedPath();
  if (!UNIFIED) {
    return std::nullopt;
  }
  std::string path = joinCgroupPath("", *UNIFIED, file);
  if (!reader_->exists(path)) {
    return std::nullopt;
  }
  return path;
}

} // namespace cgroup

} // namespace headroom
