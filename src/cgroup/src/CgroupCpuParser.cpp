/**
 * @file CgroupCpuParser.cpp
 * @brief cgroup v1/v2 CPU quota, usage and throttling parsers.
 */

#include "src/cgroup/inc/CgroupCpuParser.hpp"
#include "src/cgroup/inc/ContainerLimits.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>
#include <utility>

namespace headroom {

namespace cgroup {

namespace {

using headroom::helpers::strings::findKeyedValue;
using headroom::helpers::strings::parseInt64;
using headroom::helpers::strings::parseUint64;
using headroom::helpers::strings::trim;

/// Read @p path through @p reader, logging and discarding failures.
std::optional<std::string> readOptional(const support::IFileReader& reader,
                                        const std::string& path) {
  auto res = reader.read(path);
  if (res.isFailure()) {
    helpers::log::logger()->debug("cgroup file unavailable: {}", res.error().toString());
    return std::nullopt;
  }
  return std::move(res).value();
}

} // namespace

/* ----------------------------- Parsing ----------------------------- */

std::optional<double> computeCpuQuota(std::int64_t quota, std::int64_t period,
                                      double hostCpuCores) noexcept {
  if (quota <= 0 || period <= 0) {
    return std::nullopt;
  }
  const double LIMIT = static_cast<double>(quota) / static_cast<double>(period);
  if (hostCpuCores > 0.0) {
    return std::min(LIMIT, hostCpuCores);
  }
  return LIMIT;
}

std::optional<double> parseV1CpuQuota(std::string_view quotaContent,
                                      std::string_view periodContent,
                                      double hostCpuCores) noexcept {
  const auto QUOTA = parseInt64(quotaContent);
  const auto PERIOD = parseInt64(periodContent);
  if (!QUOTA || !PERIOD) {
    return std::nullopt;
  }
  return computeCpuQuota(*QUOTA, *PERIOD, hostCpuCores);
}

std::optional<double> parseV2CpuMax(std::string_view content, double hostCpuCores) noexcept {
  const std::string_view LINE = trim(content);
  const std::size_t SPACE = LINE.find(' ');
  if (SPACE == std::string_view::npos) {
    return std::nullopt;
  }

  const std::string_view QUOTA_TOKEN = LINE.substr(0, SPACE);
  if (QUOTA_TOKEN == V2_UNLIMITED_TOKEN) {
    return std::nullopt;
  }

  const auto QUOTA = parseInt64(QUOTA_TOKEN);
  const auto PERIOD = parseInt64(LINE.substr(SPACE + 1));
  if (!QUOTA || !PERIOD) {
    return std::nullopt;
  }
  return computeCpuQuota(*QUOTA, *PERIOD, hostCpuCores);
}

/* ----------------------------- CgroupV1CpuParser ----------------------------- */

CgroupV1CpuParser::CgroupV1CpuParser(std::shared_ptr<const support::IFileReader> reader,
                                     std::shared_ptr<CgroupV1PathResolver> resolver,
                                     helpers::clock::MonotonicClock clock)
    : reader_(std::move(reader)), resolver_(std::move(resolver)),
      usageCache_(std::move(clock)) {}

std::optional<std::string> CgroupV1CpuParser::resolveCpuFile(std::string_view file) {
  if (auto path = resolver_->resolvePath("cpu", file)) {
    return path;
  }
  return resolver_->resolvePath("cpuacct", file);
}

std::optional<std::string>
CgroupV1CpuParser::readFile(const std::optional<std::string>& path) const {
  if (!path) {
    return std::nullopt;
  }
  return readOptional(*reader_, *path);
}

std::optional<double> CgroupV1CpuParser::parseQuota(double hostCpuCores) {
  const auto QUOTA = readFile(resolveCpuFile("cpu.cfs_quota_us"));
  const auto PERIOD = readFile(resolveCpuFile("cpu.cfs_period_us"));
  if (!QUOTA || !PERIOD) {
    return std::nullopt;
  }
  return parseV1CpuQuota(*QUOTA, *PERIOD, hostCpuCores);
}

std::optional<double> CgroupV1CpuParser::parseUsage() {
  auto path = resolver_->resolvePath("cpuacct", "cpuacct.usage");
  if (!path) {
    path = resolver_->resolvePath("cpu", "cpuacct.usage");
  }
  const auto CONTENT = readFile(path);
  if (!CONTENT) {
    return std::nullopt;
  }
  const auto USAGE_NS = parseUint64(*CONTENT);
  if (!USAGE_NS) {
    return std::nullopt;
  }
  return usageCache_.computeRate(*path, static_cast<double>(*USAGE_NS), V1_USAGE_SCALE);
}

std::optional<std::uint64_t> CgroupV1CpuParser::parseThrottled() {
  const auto CONTENT = readFile(resolveCpuFile("cpu.stat"));
  if (!CONTENT) {
    return std::nullopt;
  }
  return findKeyedValue(*CONTENT, "nr_throttled");
}

/* ----------------------------- CgroupV2CpuParser ----------------------------- */

CgroupV2CpuParser::CgroupV2CpuParser(std::shared_ptr<const support::IFileReader> reader,
                                     std::shared_ptr<CgroupV2PathResolver> resolver,
                                     helpers::clock::MonotonicClock clock)
    : reader_(std::move(reader)), resolver_(std::move(resolver)),
      usageCache_(std::move(clock)) {}

std::optional<std::string> CgroupV2CpuParser::readFile(std::string_view file,
                                                       std::string* resolvedPath) {
  const auto PATH = resolver_->resolvePath(file);
  if (!PATH) {
    return std::nullopt;
  }
  if (resolvedPath != nullptr) {
    *resolvedPath = *PATH;
  }
  return readOptional(*reader_, *PATH);
}

std::optional<double> CgroupV2CpuParser::parseQuota(double hostCpuCores) {
  const auto CONTENT = readFile("cpu.max");
  if (!CONTENT) {
    return std::nullopt;
  }
  return parseV2CpuMax(*CONTENT, hostCpuCores);
}

std::optional<double> CgroupV2CpuParser::parseUsage() {
  std::string path;
  const auto CONTENT = readFile("cpu.stat", &path);
  if (!CONTENT) {
    return std::nullopt;
  }
  const auto USAGE_US = findKeyedValue(*CONTENT, "usage_usec");
  if (!USAGE_US) {
    return std::nullopt;
  }
  return usageCache_.computeRate(path, static_cast<double>(*USAGE_US), V2_USAGE_SCALE);
}

std::optional<std::uint64_t> CgroupV2CpuParser::parseThrottled() {
  const auto CONTENT = readFile("cpu.stat");
  if (!CONTENT) {
    return std::nullopt;
  }
  return findKeyedValue(*CONTENT, "nr_throttled");
}

} // namespace cgroup

} // namespace headroom
