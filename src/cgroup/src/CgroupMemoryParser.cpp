/**
 * @file CgroupMemoryParser.cpp
 * @brief cgroup v1/v2 memory limit, usage and OOM parsers.
 */

#include "src/cgroup/inc/CgroupMemoryParser.hpp"
#include "src/cgroup/inc/ContainerLimits.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>
#include <utility>

namespace headroom {

namespace cgroup {

using headroom::helpers::strings::findKeyedValue;
using headroom::helpers::strings::parseInt64;
using headroom::helpers::strings::trim;

namespace {

std::optional<std::string> readIfResolved(const support::IFileReader& reader,
                                          const std::optional<std::string>& path) {
  if (!path) {
    return std::nullopt;
  }
  auto res = reader.read(*path);
  if (res.isFailure()) {
    helpers::log::logger()->debug("cgroup file unavailable: {}", res.error().toString());
    return std::nullopt;
  }
  return std::move(res).value();
}

} // namespace

/* ----------------------------- Parsing ----------------------------- */

std::optional<std::int64_t> parseV1MemoryLimit(std::string_view content) noexcept {
  const auto VALUE = parseInt64(content);
  if (!VALUE || *VALUE <= 0 || *VALUE >= V1_MEMORY_UNLIMITED_THRESHOLD) {
    return std::nullopt;
  }
  return VALUE;
}

std::optional<std::int64_t> parseV2MemoryLimit(std::string_view content) noexcept {
  if (trim(content) == V2_UNLIMITED_TOKEN) {
    return std::nullopt;
  }
  const auto VALUE = parseInt64(content);
  if (!VALUE || *VALUE <= 0) {
    return std::nullopt;
  }
  return VALUE;
}

std::optional<std::int64_t> parseMemoryUsage(std::string_view content) noexcept {
  const auto VALUE = parseInt64(content);
  if (!VALUE) {
    return std::nullopt;
  }
  return std::max<std::int64_t>(0, *VALUE);
}

/* ----------------------------- CgroupV1MemoryParser ----------------------------- */

CgroupV1MemoryParser::CgroupV1MemoryParser(std::shared_ptr<const support::IFileReader> reader,
                                           std::shared_ptr<CgroupV1PathResolver> resolver)
    : reader_(std::move(reader)), resolver_(std::move(resolver)) {}

std::optional<std::string> CgroupV1MemoryParser::readFile(std::string_view file) {
  return readIfResolved(*reader_, resolver_->resolvePath("memory", file));
}

std::optional<std::int64_t> CgroupV1MemoryParser::parseLimit() {
  const auto CONTENT = readFile("memory.limit_in_bytes");
  return CONTENT ? parseV1MemoryLimit(*CONTENT) : std::nullopt;
}

std::optional<std::int64_t> CgroupV1MemoryParser::parseUsage() {
  const auto CONTENT = readFile("memory.usage_in_bytes");
  return CONTENT ? parseMemoryUsage(*CONTENT) : std::nullopt;
}

std::optional<std::uint64_t> CgroupV1MemoryParser::parseOomKills() {
  const auto CONTENT = readFile("memory.oom_control");
  return CONTENT ? findKeyedValue(*CONTENT, "under_oom") : std::nullopt;
}

/* ----------------------------- CgroupV2MemoryParser ----------------------------- */

CgroupV2MemoryParser::CgroupV2MemoryParser(std::shared_ptr<const support::IFileReader> reader,
                                           std::shared_ptr<CgroupV2PathResolver> resolver)
    : reader_(std::move(reader)), resolver_(std::move(resolver)) {}

std::optional<std::string> CgroupV2MemoryParser::readFile(std::string_view file) {
  return readIfResolved(*reader_, resolver_->resolvePath(file));
}

std::optional<std::int64_t> CgroupV2MemoryParser::parseLimit() {
  const auto CONTENT = readFile("memory.max");
  return CONTENT ? parseV2MemoryLimit(*CONTENT) : std::nullopt;
}

std::optional<std::int64_t> CgroupV2MemoryParser::parseUsage() {
  const auto CONTENT = readFile("memory.current");
  return CONTENT ? parseMemoryUsage(*CONTENT) : std::nullopt;
}

std::optional<std::uint64_t> CgroupV2MemoryParser::parseOomKills() {
  const auto CONTENT = readFile("memory.events");
  return CONTENT ? findKeyedValue(*CONTENT, "oom_kill") : std::nullopt;
}

} // namespace cgroup

} // namespace headroom
