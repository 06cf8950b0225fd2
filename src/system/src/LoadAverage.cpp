/**
 * @file LoadAverage.cpp
 * @brief /proc/loadavg and getloadavg(3) sources.
 */

#include "src/system/inc/LoadAverage.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/source/inc/FallbackSource.hpp"
#include "src/support/inc/Platform.hpp"

#include <array>
#include <cstdlib> // getloadavg
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace headroom {

namespace system {

using headroom::helpers::strings::parseDouble;
using headroom::helpers::strings::parseUint64;
using headroom::helpers::strings::split;
using headroom::helpers::strings::splitWhitespace;

/* ----------------------------- LoadAverageSnapshot ----------------------------- */

LoadAverageSnapshot LoadAverageSnapshot::normalized(std::size_t cores) const noexcept {
  if (cores == 0) {
    return *this;
  }
  const double N = static_cast<double>(cores);
  LoadAverageSnapshot out = *this;
  out.oneMinute /= N;
  out.fiveMinutes /= N;
  out.fifteenMinutes /= N;
  return out;
}

std::string LoadAverageSnapshot::toString() const {
  return fmt::format("{:.2f} {:.2f} {:.2f}", oneMinute, fiveMinutes, fifteenMinutes);
}

Result<LoadAverageSnapshot> parseProcLoadavg(std::string_view content) {
  const auto TOKENS = splitWhitespace(content);
  if (TOKENS.size() < 3) {
    return Result<LoadAverageSnapshot>::failure(ErrorCode::PARSE_FAILURE,
                                                "Invalid loadavg format");
  }
  const auto ONE = parseDouble(TOKENS[0]);
  const auto FIVE = parseDouble(TOKENS[1]);
  const auto FIFTEEN = parseDouble(TOKENS[2]);
  if (!ONE || !FIVE || !FIFTEEN) {
    return Result<LoadAverageSnapshot>::failure(ErrorCode::PARSE_FAILURE,
                                                "Invalid loadavg format");
  }

  LoadAverageSnapshot snap{};
  snap.oneMinute = *ONE;
  snap.fiveMinutes = *FIVE;
  snap.fifteenMinutes = *FIFTEEN;

  // "running/total"
  if (TOKENS.size() >= 4) {
    const auto TASKS = split(TOKENS[3], '/');
    if (TASKS.size() == 2) {
      snap.runningTasks = parseUint64(TASKS[0]);
      snap.totalTasks = parseUint64(TASKS[1]);
    }
  }
  return Result<LoadAverageSnapshot>::success(snap);
}

/* ----------------------------- Sources ----------------------------- */

ProcLoadavgSource::ProcLoadavgSource(std::shared_ptr<const support::IFileReader> reader)
    : reader_(std::move(reader)) {}

Result<LoadAverageSnapshot> ProcLoadavgSource::read() {
  const auto CONTENT = reader_->read(PROC_LOADAVG_PATH);
  if (CONTENT.isFailure()) {
    return Result<LoadAverageSnapshot>::failure(CONTENT.error());
  }
  return parseProcLoadavg(CONTENT.value());
}

Result<LoadAverageSnapshot> GetloadavgSource::read() {
  std::array<double, 3> loads{};
  if (::getloadavg(loads.data(), 3) != 3) {
    return Result<LoadAverageSnapshot>::failure(ErrorCode::SYSTEM_ERROR, "getloadavg failed");
  }
  LoadAverageSnapshot snap{};
  snap.oneMinute = loads[0];
  snap.fiveMinutes = loads[1];
  snap.fifteenMinutes = loads[2];
  return Result<LoadAverageSnapshot>::success(snap);
}

std::unique_ptr<source::Source<LoadAverageSnapshot>>
createLoadAverageSource(std::shared_ptr<const support::IFileReader> reader) {
  std::vector<std::unique_ptr<source::Source<LoadAverageSnapshot>>> chain;
  if constexpr (support::currentPlatform() == support::Platform::LINUX) {
    chain.push_back(std::make_unique<ProcLoadavgSource>(std::move(reader)));
  }
  chain.push_back(std::make_unique<GetloadavgSource>());
  return std::make_unique<source::FallbackSource<LoadAverageSnapshot>>("load average",
                                                                       std::move(chain));
}

} // namespace system

} // namespace headroom
