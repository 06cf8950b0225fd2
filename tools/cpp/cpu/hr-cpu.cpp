/**
 * @file hr-cpu.cpp
 * @brief Measure CPU utilization over an interval.
 *
 * Takes two CPU snapshots the requested interval apart and reports the
 * aggregate time breakdown and per-core usage.
 */

#include "src/context/inc/MetricsContext.hpp"
#include "src/cpu/inc/CpuSnapshot.hpp"
#include "src/cpu/inc/CpuSource.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/support/inc/Config.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace cpu = headroom::cpu;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_INTERVAL = 2,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Measure CPU utilization across all cores over an interval.";

/// Default measurement interval in seconds.
constexpr double DEFAULT_INTERVAL_SEC = 1.0;

/// Build argument definitions.
headroom::helpers::args::ArgMap buildArgMap() {
  headroom::helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_INTERVAL] = {"--interval", 1, false, "Sampling interval in seconds (default: 1.0)"};
  return map;
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const cpu::CpuDelta& delta) {
  fmt::print("=== CPU Usage ({:.2f} s) ===\n", delta.durationSeconds);
  fmt::print("  Total:   {:5.1f}%\n", delta.usagePercentage());
  fmt::print("  User:    {:5.1f}%\n", delta.userPercentage());
  fmt::print("  System:  {:5.1f}%\n", delta.systemPercentage());
  fmt::print("  Idle:    {:5.1f}%\n", delta.idlePercentage());
  fmt::print("  IOwait:  {:5.1f}%\n", delta.iowaitPercentage());

  if (delta.perCoreDelta.empty()) {
    return;
  }

  fmt::print("\n=== Per Core ===\n");
  for (const cpu::CpuCoreDelta& core : delta.perCoreDelta) {
    fmt::print("  cpu{:<4} {:5.1f}%\n", core.coreIndex, core.usagePercentage());
  }

  const cpu::CpuCoreDelta* busiest = delta.busiestCore();
  const cpu::CpuCoreDelta* idlest = delta.idlestCore();
  if (busiest != nullptr && idlest != nullptr) {
    fmt::print("\n  Busiest: cpu{} ({:.1f}%)  Idlest: cpu{} ({:.1f}%)\n", busiest->coreIndex,
               busiest->usagePercentage(), idlest->coreIndex, idlest->usagePercentage());
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const cpu::CpuDelta& delta) {
  fmt::print("{{\n");
  fmt::print("  \"durationSeconds\": {:.3f},\n", delta.durationSeconds);
  fmt::print("  \"usagePercentage\": {:.2f},\n", delta.usagePercentage());
  fmt::print("  \"userPercentage\": {:.2f},\n", delta.userPercentage());
  fmt::print("  \"systemPercentage\": {:.2f},\n", delta.systemPercentage());
  fmt::print("  \"idlePercentage\": {:.2f},\n", delta.idlePercentage());
  fmt::print("  \"iowaitPercentage\": {:.2f},\n", delta.iowaitPercentage());
  fmt::print("  \"cores\": [");
  for (std::size_t i = 0; i < delta.perCoreDelta.size(); ++i) {
    const cpu::CpuCoreDelta& core = delta.perCoreDelta[i];
    if (i > 0) {
      fmt::print(",");
    }
    fmt::print("\n    {{\"core\": {}, \"usagePercentage\": {:.2f}}}", core.coreIndex,
               core.usagePercentage());
  }
  fmt::print("{}]\n", delta.perCoreDelta.empty() ? "" : "\n  ");
  fmt::print("}}\n");
}

} // namespace

int main(int argc, char* argv[]) {
  const headroom::helpers::args::ArgMap ARG_MAP = buildArgMap();
  headroom::helpers::args::ParsedArgs pargs;
  bool jsonOutput = false;
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

    if (headroom::helpers::args::has(pargs, ARG_INTERVAL)) {
      const auto VALUE = headroom::helpers::args::doubleValue(pargs, ARG_INTERVAL);
      if (!VALUE || !std::isfinite(*VALUE) || *VALUE <= 0.0) {
        fmt::print(stderr, "Error: --interval expects a positive number\n");
        return 1;
      }
      interval = *VALUE;
    }
  }

  headroom::context::MetricsContext ctx(headroom::support::Config::fromEnvironment());

  const auto DELTA = cpu::measureCpuUsage(ctx.cpu(), interval);
  if (DELTA.isFailure()) {
    fmt::print(stderr, "Error: {}\n", DELTA.error().toString());
    return 1;
  }

  if (jsonOutput) {
    printJson(DELTA.value());
  } else {
    printHuman(DELTA.value());
  }

  return 0;
}
