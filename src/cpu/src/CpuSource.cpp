/**
 * @file CpuSource.cpp
 * @brief /proc/stat parser and CPU snapshot sources.
 * @note Parses cpu and cpuN lines for the time breakdown.
 */

#include "src/cpu/inc/CpuSource.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/source/inc/FallbackSource.hpp"
#include "src/support/inc/Platform.hpp"

#include <sys/sysinfo.h> // get_nprocs

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace headroom {

namespace cpu {

namespace {

using headroom::helpers::strings::isAllDigits;
using headroom::helpers::strings::parseUint64;
using headroom::helpers::strings::splitLines;
using headroom::helpers::strings::splitWhitespace;
using headroom::helpers::strings::startsWith;

/// Counters consumed from each cpu line; guest columns are already in user/nice.
inline constexpr std::size_t CPU_FIELD_COUNT = 8;

/// Parse the counters that follow a "cpu"/"cpuN" label.
/// Format: "cpu[N] user nice system idle iowait irq softirq steal [guest guest_nice]"
bool parseCpuCounters(const std::vector<std::string_view>& tokens, CpuTimes& out) {
  if (tokens.size() < CPU_FIELD_COUNT + 1) {
    return false;
  }
  std::array<std::uint64_t, CPU_FIELD_COUNT> vals{};
  for (std::size_t i = 0; i < CPU_FIELD_COUNT; ++i) {
    const auto V = parseUint64(tokens[i + 1]);
    if (!V) {
      return false;
    }
    vals[i] = *V;
  }
  out.user = vals[0];
  out.nice = vals[1];
  out.system = vals[2];
  out.idle = vals[3];
  out.iowait = vals[4];
  out.irq = vals[5];
  out.softirq = vals[6];
  out.steal = vals[7];
  return true;
}

} // namespace

/* ----------------------------- Parsing ----------------------------- */

Result<CpuSnapshot> parseProcStat(std::string_view content, std::uint64_t timestampNs) {
  CpuSnapshot snap{};
  snap.timestampNs = timestampNs;
  bool haveTotal = false;

  for (const std::string_view LINE : splitLines(content)) {
    if (!startsWith(LINE, "cpu")) {
      continue;
    }
    const auto TOKENS = splitWhitespace(LINE);
    if (TOKENS.empty()) {
      continue;
    }
    const std::string_view LABEL = TOKENS[0];
    const bool IS_TOTAL = (LABEL == "cpu");
    if (!IS_TOTAL && !isAllDigits(LABEL.substr(3))) {
      continue;
    }

    CpuTimes times{};
    if (!parseCpuCounters(TOKENS, times)) {
      return Result<CpuSnapshot>::failure(ErrorCode::PARSE_FAILURE,
                                          fmt::format("Invalid CPU line format: {}", LINE));
    }

    if (IS_TOTAL) {
      snap.total = times;
      haveTotal = true;
    } else {
      const auto INDEX = parseUint64(LABEL.substr(3));
      snap.perCore.push_back(CpuCoreTimes{static_cast<std::size_t>(INDEX.value_or(0)), times});
    }
  }

  if (!haveTotal) {
    return Result<CpuSnapshot>::failure(ErrorCode::PARSE_FAILURE, "No total CPU line found");
  }
  return Result<CpuSnapshot>::success(std::move(snap));
}

/* ----------------------------- ProcStatCpuSource ----------------------------- */

ProcStatCpuSource::ProcStatCpuSource(std::shared_ptr<const support::IFileReader> reader,
                                     helpers::clock::MonotonicClock clock)
    : reader_(std::move(reader)), clock_(helpers::clock::orSystemClock(std::move(clock))) {}

Result<CpuSnapshot> ProcStatCpuSource::read() {
  const auto CONTENT = reader_->read(PROC_STAT_PATH);
  if (CONTENT.isFailure()) {
    return Result<CpuSnapshot>::failure(CONTENT.error());
  }
  return parseProcStat(CONTENT.value(), clock_());
}

/* ----------------------------- MinimalCpuSource ----------------------------- */

MinimalCpuSource::MinimalCpuSource(helpers::clock::MonotonicClock clock)
    : clock_(helpers::clock::orSystemClock(std::move(clock))) {}

Result<CpuSnapshot> MinimalCpuSource::read() {
  CpuSnapshot snap{};
  snap.timestampNs = clock_();
  const std::size_t CORES = onlineCpuCount();
  snap.perCore.reserve(CORES);
  for (std::size_t i = 0; i < CORES; ++i) {
    snap.perCore.push_back(CpuCoreTimes{i, CpuTimes{}});
  }
  return Result<CpuSnapshot>::success(std::move(snap));
}

/* ----------------------------- Factory ----------------------------- */

std::size_t onlineCpuCount() noexcept {
  const int N = ::get_nprocs();
  return (N > 0) ? static_cast<std::size_t>(N) : 1;
}

std::unique_ptr<source::Source<CpuSnapshot>>
createCpuSource(std::shared_ptr<const support::IFileReader> reader,
                helpers::clock::MonotonicClock clock) {
  std::vector<std::unique_ptr<source::Source<CpuSnapshot>>> chain;
  if constexpr (support::currentPlatform() == support::Platform::LINUX) {
    chain.push_back(std::make_unique<ProcStatCpuSource>(std::move(reader), clock));
  }
  chain.push_back(std::make_unique<MinimalCpuSource>(std::move(clock)));
  return std::make_unique<source::FallbackSource<CpuSnapshot>>("cpu", std::move(chain));
}

Result<CpuDelta> measureCpuUsage(source::Source<CpuSnapshot>& source, double seconds) {
  auto before = source.read();
  if (before.isFailure()) {
    return Result<CpuDelta>::failure(before.error());
  }

  const double INTERVAL = std::isfinite(seconds) ? std::max(seconds, MIN_MEASURE_INTERVAL_SEC)
                                                 : MIN_MEASURE_INTERVAL_SEC;
  helpers::clock::sleepForSeconds(INTERVAL);

  auto after = source.read();
  if (after.isFailure()) {
    return Result<CpuDelta>::failure(after.error());
  }
  return Result<CpuDelta>::success(CpuSnapshot::calculateDelta(before.value(), after.value()));
}

} // namespace cpu

} // namespace headroom
