/**
 * @file hr-track.cpp
 * @brief Track resource usage of a process (optionally with its children).
 *
 * Starts a tracking session, samples at a fixed interval, then stops and
 * reports current, peak and average usage plus the CPU consumed.
 */

#include "src/context/inc/MetricsContext.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/process/inc/ProcessSnapshot.hpp"
#include "src/process/inc/ProcessTracker.hpp"
#include "src/support/inc/Config.hpp"

#include <sys/types.h>
#include <unistd.h> // getpid

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace proc = headroom::process;
namespace fmtx = headroom::helpers::format;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_PID = 2,
  ARG_CHILDREN = 3,
  ARG_SAMPLES = 4,
  ARG_INTERVAL = 5,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Track CPU, memory, thread and file descriptor usage of a process.\n"
    "Defaults to tracking this tool's own process.";

constexpr std::int64_t DEFAULT_SAMPLES = 5;
constexpr double DEFAULT_INTERVAL_SEC = 1.0;

/// Build argument definitions.
headroom::helpers::args::ArgMap buildArgMap() {
  headroom::helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_PID] = {"--pid", 1, false, "Process ID to track (default: self)"};
  map[ARG_CHILDREN] = {"--children", 0, false, "Include all descendant processes"};
  map[ARG_SAMPLES] = {"--samples", 1, false, "Intermediate samples to take (default: 5)"};
  map[ARG_INTERVAL] = {"--interval", 1, false, "Seconds between samples (default: 1.0)"};
  return map;
}

/* ----------------------------- Human Output ----------------------------- */

void printUsageRow(std::string_view label, const proc::ProcessResourceUsage& usage) {
  fmt::print("  {:<8} rss={:<12} vms={:<12} threads={:<5} fds={:<5} procs={}\n", label,
             fmtx::bytesBinary(usage.memoryRssBytes), fmtx::bytesBinary(usage.memoryVmsBytes),
             usage.threadCount, usage.openFileDescriptors, usage.processCount);
}

void printHuman(const proc::ProcessStats& stats) {
  fmt::print("=== Process {} ===\n", stats.pid);
  fmt::print("  Samples:   {}\n", stats.sampleCount);
  fmt::print("  Duration:  {:.2f} s\n", stats.totalDurationSeconds);
  fmt::print("  Processes: {}\n", stats.processCount);
  fmt::print("  CPU time:  {:.2f} s ({:.1f}%)\n", stats.delta.cpuSeconds(),
             stats.delta.cpuUsagePercentage());
  fmt::print("  RSS delta: {}\n", fmtx::bytesBinarySigned(stats.delta.memoryDeltaBytes));

  fmt::print("\n=== Usage ===\n");
  printUsageRow("current", stats.current);
  printUsageRow("peak", stats.peak);
  printUsageRow("average", stats.average);
}

/* ----------------------------- JSON Output ----------------------------- */

void printUsageJson(std::string_view key, const proc::ProcessResourceUsage& usage, bool last) {
  fmt::print("  \"{}\": {{\n", key);
  fmt::print("    \"userTicks\": {},\n", usage.cpuTimes.user);
  fmt::print("    \"systemTicks\": {},\n", usage.cpuTimes.system);
  fmt::print("    \"memoryRssBytes\": {},\n", usage.memoryRssBytes);
  fmt::print("    \"memoryVmsBytes\": {},\n", usage.memoryVmsBytes);
  fmt::print("    \"threadCount\": {},\n", usage.threadCount);
  fmt::print("    \"openFileDescriptors\": {},\n", usage.openFileDescriptors);
  fmt::print("    \"processCount\": {}\n", usage.processCount);
  fmt::print("  }}{}\n", last ? "" : ",");
}

void printJson(const proc::ProcessStats& stats) {
  fmt::print("{{\n");
  fmt::print("  \"pid\": {},\n", stats.pid);
  fmt::print("  \"sampleCount\": {},\n", stats.sampleCount);
  fmt::print("  \"totalDurationSeconds\": {:.3f},\n", stats.totalDurationSeconds);
  fmt::print("  \"processCount\": {},\n", stats.processCount);
  fmt::print("  \"cpuSeconds\": {:.3f},\n", stats.delta.cpuSeconds());
  fmt::print("  \"cpuUsagePercentage\": {:.2f},\n", stats.delta.cpuUsagePercentage());
  fmt::print("  \"memoryDeltaBytes\": {},\n", stats.delta.memoryDeltaBytes);
  printUsageJson("current", stats.current, false);
  printUsageJson("peak", stats.peak, false);
  printUsageJson("average", stats.average, true);
  fmt::print("}}\n");
}

} // namespace

int main(int argc, char* argv[]) {
  const headroom::helpers::args::ArgMap ARG_MAP = buildArgMap();
  headroom::helpers::args::ParsedArgs pargs;
  bool jsonOutput = false;
  bool includeChildren = false;
  pid_t pid = ::getpid();
  std::int64_t samples = DEFAULT_SAMPLES;
  double interval = DEFAULT_INTERVAL_SEC;

  if (argc > 1) {
    std::vector<std::string_view> args;
    args.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      args.emplace_back(argv[i]);
    }

    std::string error;
    if (!headroom::helpers::args::parseArgs(args, ARG_MAP, pargs, error)) {
      fmt::print(stderr, "Error: {}\n\n", error);
      headroom::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 1;
    }

    if (headroom::helpers::args::has(pargs, ARG_HELP)) {
      headroom::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }

    jsonOutput = headroom::helpers::args::has(pargs, ARG_JSON);
    includeChildren = headroom::helpers::args::has(pargs, ARG_CHILDREN);

    if (headroom::helpers::args::has(pargs, ARG_PID)) {
      const auto VALUE = headroom::helpers::args::intValue(pargs, ARG_PID);
      if (!VALUE || *VALUE <= 0) {
        fmt::print(stderr, "Error: --pid expects a positive integer\n");
        return 1;
      }
      pid = static_cast<pid_t>(*VALUE);
    }
    if (headroom::helpers::args::has(pargs, ARG_SAMPLES)) {
      const auto VALUE = headroom::helpers::args::intValue(pargs, ARG_SAMPLES);
      if (!VALUE || *VALUE < 0) {
        fmt::print(stderr, "Error: --samples expects a non-negative integer\n");
        return 1;
      }
      samples = *VALUE;
    }
    if (headroom::helpers::args::has(pargs, ARG_INTERVAL)) {
      const auto VALUE = headroom::helpers::args::doubleValue(pargs, ARG_INTERVAL);
      if (!VALUE || !std::isfinite(*VALUE) || *VALUE < 0.0) {
        fmt::print(stderr, "Error: --interval expects a non-negative number\n");
        return 1;
      }
      interval = *VALUE;
    }
  }

  headroom::context::MetricsContext ctx(headroom::support::Config::fromEnvironment());
  proc::ProcessTracker tracker = ctx.track(pid, includeChildren);

  const auto STARTED = tracker.start();
  if (STARTED.isFailure()) {
    fmt::print(stderr, "Error: {}\n", STARTED.error().toString());
    return 1;
  }

  for (std::int64_t i = 0; i < samples; ++i) {
    headroom::helpers::clock::sleepForSeconds(interval);
    const auto SAMPLE = tracker.sample();
    if (SAMPLE.isFailure()) {
      fmt::print(stderr, "Error: {}\n", SAMPLE.error().toString());
      return 1;
    }
  }
  headroom::helpers::clock::sleepForSeconds(interval);

  const auto STATS = tracker.stop();
  if (STATS.isFailure()) {
    fmt::print(stderr, "Error: {}\n", STATS.error().toString());
    return 1;
  }

  if (jsonOutput) {
    printJson(STATS.value());
  } else {
    printHuman(STATS.value());
  }

  return 0;
}
