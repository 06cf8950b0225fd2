/**
 * @file Uptime.cpp
 * @brief /proc/uptime and sysinfo(2) uptime sources.
 */

#include "src/system/inc/Uptime.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/source/inc/FallbackSource.hpp"
#include "src/support/inc/Platform.hpp"

#include <sys/sysinfo.h> // sysinfo

#include <cerrno>
#include <ctime>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace headroom {

namespace system {

using headroom::helpers::strings::parseDouble;
using headroom::helpers::strings::splitWhitespace;

namespace {

inline constexpr std::uint64_t SECONDS_PER_MINUTE = 60;
inline constexpr std::uint64_t SECONDS_PER_HOUR = 3600;
inline constexpr std::uint64_t SECONDS_PER_DAY = 86400;

inline std::uint64_t wholeSeconds(double seconds) noexcept {
  return (seconds > 0.0) ? static_cast<std::uint64_t>(seconds) : 0;
}

inline std::int64_t nowUnix() noexcept { return static_cast<std::int64_t>(std::time(nullptr)); }

} // namespace

/* ----------------------------- UptimeSnapshot ----------------------------- */

std::uint64_t UptimeSnapshot::days() const noexcept {
  return wholeSeconds(totalSeconds) / SECONDS_PER_DAY;
}

std::uint64_t UptimeSnapshot::hours() const noexcept {
  return (wholeSeconds(totalSeconds) % SECONDS_PER_DAY) / SECONDS_PER_HOUR;
}

std::uint64_t UptimeSnapshot::minutes() const noexcept {
  return (wholeSeconds(totalSeconds) % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE;
}

std::string UptimeSnapshot::toString() const {
  return fmt::format("{}d {}h {}m", days(), hours(), minutes());
}

Result<UptimeSnapshot> parseProcUptime(std::string_view content, std::int64_t nowUnix) {
  const auto TOKENS = splitWhitespace(content);
  const auto SECONDS = TOKENS.empty() ? std::nullopt : parseDouble(TOKENS[0]);
  if (!SECONDS || *SECONDS < 0.0) {
    return Result<UptimeSnapshot>::failure(ErrorCode::PARSE_FAILURE, "Invalid uptime format");
  }
  UptimeSnapshot snap{};
  snap.totalSeconds = *SECONDS;
  snap.bootTimeUnix = nowUnix - static_cast<std::int64_t>(*SECONDS);
  return Result<UptimeSnapshot>::success(snap);
}

/* ----------------------------- Sources ----------------------------- */

ProcUptimeSource::ProcUptimeSource(std::shared_ptr<const support::IFileReader> reader)
    : reader_(std::move(reader)) {}

Result<UptimeSnapshot> ProcUptimeSource::read() {
  const auto CONTENT = reader_->read(PROC_UPTIME_PATH);
  if (CONTENT.isFailure()) {
    return Result<UptimeSnapshot>::failure(CONTENT.error());
  }
  return parseProcUptime(CONTENT.value(), nowUnix());
}

Result<UptimeSnapshot> SysinfoUptimeSource::read() {
  struct sysinfo si{};
  if (::sysinfo(&si) != 0) {
    const int ERR = errno;
    return Result<UptimeSnapshot>::failure(
        ErrorCode::SYSTEM_ERROR,
        fmt::format("sysinfo failed: {}", std::error_code(ERR, std::generic_category()).message()));
  }
  UptimeSnapshot snap{};
  snap.totalSeconds = static_cast<double>(si.uptime);
  snap.bootTimeUnix = nowUnix() - static_cast<std::int64_t>(si.uptime);
  return Result<UptimeSnapshot>::success(snap);
}

std::unique_ptr<source::Source<UptimeSnapshot>>
createUptimeSource(std::shared_ptr<const support::IFileReader> reader) {
  std::vector<std::unique_ptr<source::Source<UptimeSnapshot>>> chain;
  if constexpr (support::currentPlatform() == support::Platform::LINUX) {
    chain.push_back(std::make_unique<ProcUptimeSource>(std::move(reader)));
  }
  chain.push_back(std::make_unique<SysinfoUptimeSource>());
  return std::make_unique<source::FallbackSource<UptimeSnapshot>>("uptime", std::move(chain));
}

} // namespace system

} // namespace headroom
