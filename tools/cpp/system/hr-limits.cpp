/**
 * @file hr-limits.cpp
 * @brief Display the host environment, container limits and the effective system limits.
 *
 * Shows the OS, kernel, virtualization and container runtime, the detected
 * cgroup version with its raw limits, and the unified CPU/memory limits that
 * capacity planning should respect.
 */

#include "src/cgroup/inc/ContainerLimits.hpp"
#include "src/context/inc/MetricsContext.hpp"
#include "src/environment/inc/EnvironmentSnapshot.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/support/inc/Config.hpp"
#include "src/system/inc/SystemLimits.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace cg = headroom::cgroup;
namespace env = headroom::environment;
namespace sys = headroom::system;
namespace fmtx = headroom::helpers::format;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Display container (cgroup) limits and the effective system limits.\n"
    "Inside a container the cgroup limits win; on a host the totals are used.";

/// Build argument definitions.
headroom::helpers::args::ArgMap buildArgMap() {
  headroom::helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  return map;
}

template <typename T> std::string jsonOptional(const std::optional<T>& value) {
  return value ? fmt::format("{}", *value) : std::string("null");
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const env::EnvironmentSnapshot& environment, const cg::ContainerLimits& container,
                const sys::SystemLimits& limits) {
  fmt::print("=== Environment ===\n");
  fmt::print("  OS:               {} {}\n", environment.os.name, environment.os.version);
  fmt::print("  Kernel:           {}\n", environment.kernel.release);
  fmt::print("  Architecture:     {}\n", environment.architecture.raw);
  fmt::print("  Virtualization:   {}\n",
             environment.virtualization.isVirtualMachine()
                 ? env::toString(environment.virtualization.vendor)
                 : "bare metal");
  fmt::print("  Container:        {}\n", env::toString(environment.containerization.type));

  fmt::print("\n=== Container ===\n");
  fmt::print("  cgroup:           {}\n", cg::toString(container.cgroupVersion));
  fmt::print("  CPU quota:        {} cores\n", fmtx::optionalFixed(container.cpuQuotaCores));
  fmt::print("  CPU usage:        {} cores\n", fmtx::optionalFixed(container.cpuUsageCores));
  fmt::print("  CPU throttled:    {}\n", fmtx::optionalCount(container.cpuThrottledCount));
  fmt::print("  Memory limit:     {}\n", fmtx::optionalBytes(container.memoryLimitBytes));
  fmt::print("  Memory usage:     {}\n", fmtx::optionalBytes(container.memoryUsageBytes));
  fmt::print("  OOM kills:        {}\n", fmtx::optionalCount(container.oomKillCount));

  fmt::print("\n=== System Limits ===\n");
  fmt::print("  Source:           {}\n", sys::toString(limits.source));
  fmt::print("  CPU cores:        {} (in use {}, available {})\n", limits.cpuCores,
             limits.currentCpuCores, limits.availableCpuCores());
  fmt::print("  Memory:           {} (in use {}, available {})\n",
             fmtx::bytesBinarySigned(limits.memoryBytes),
             fmtx::bytesBinarySigned(static_cast<std::int64_t>(limits.currentMemoryBytes)),
             fmtx::bytesBinarySigned(limits.availableMemoryBytes()));
  fmt::print("  CPU utilization:  {} (headroom {})\n", fmtx::percent(limits.cpuUtilization()),
             fmtx::percent(limits.cpuHeadroom()));
  fmt::print("  Mem utilization:  {} (headroom {})\n", fmtx::percent(limits.memoryUtilization()),
             fmtx::percent(limits.memoryHeadroom()));
  const auto SWAP = limits.swapUtilization();
  fmt::print("  Swap utilization: {}\n", SWAP ? fmtx::percent(*SWAP) : std::string("n/a"));
  fmt::print("  Pressure:         cpu={} memory={}\n", limits.isCpuPressure() ? "yes" : "no",
             limits.isMemoryPressure() ? "yes" : "no");
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const env::EnvironmentSnapshot& environment, const cg::ContainerLimits& container,
               const sys::SystemLimits& limits) {
  fmt::print("{{\n");

  fmt::print("  \"environment\": {{\n");
  fmt::print("    \"osFamily\": \"{}\",\n", env::toString(environment.os.family));
  fmt::print("    \"osName\": \"{}\",\n", environment.os.name);
  fmt::print("    \"osVersion\": \"{}\",\n", environment.os.version);
  fmt::print("    \"kernelRelease\": \"{}\",\n", environment.kernel.release);
  fmt::print("    \"architecture\": \"{}\",\n", env::toString(environment.architecture.kind));
  fmt::print("    \"virtualization\": \"{}\",\n",
             env::toString(environment.virtualization.type));
  fmt::print("    \"virtualizationVendor\": \"{}\",\n",
             env::toString(environment.virtualization.vendor));
  fmt::print("    \"container\": \"{}\"\n", env::toString(environment.containerization.type));
  fmt::print("  }},\n");

  fmt::print("  \"container\": {{\n");
  fmt::print("    \"cgroupVersion\": \"{}\",\n", cg::toString(container.cgroupVersion));
  fmt::print("    \"cpuQuotaCores\": {},\n", jsonOptional(container.cpuQuotaCores));
  fmt::print("    \"cpuUsageCores\": {},\n", jsonOptional(container.cpuUsageCores));
  fmt::print("    \"cpuThrottledCount\": {},\n", jsonOptional(container.cpuThrottledCount));
  fmt::print("    \"memoryLimitBytes\": {},\n", jsonOptional(container.memoryLimitBytes));
  fmt::print("    \"memoryUsageBytes\": {},\n", jsonOptional(container.memoryUsageBytes));
  fmt::print("    \"oomKillCount\": {}\n", jsonOptional(container.oomKillCount));
  fmt::print("  }},\n");

  fmt::print("  \"limits\": {{\n");
  fmt::print("    \"source\": \"{}\",\n", sys::toString(limits.source));
  fmt::print("    \"cpuCores\": {},\n", limits.cpuCores);
  fmt::print("    \"memoryBytes\": {},\n", limits.memoryBytes);
  fmt::print("    \"currentCpuCores\": {},\n", limits.currentCpuCores);
  fmt::print("    \"currentMemoryBytes\": {:.0f},\n", limits.currentMemoryBytes);
  fmt::print("    \"swapBytes\": {},\n", jsonOptional(limits.swapBytes));
  fmt::print("    \"currentSwapBytes\": {}\n", jsonOptional(limits.currentSwapBytes));
  fmt::print("  }},\n");

  fmt::print("  \"derived\": {{\n");
  fmt::print("    \"availableCpuCores\": {},\n", limits.availableCpuCores());
  fmt::print("    \"availableMemoryBytes\": {},\n", limits.availableMemoryBytes());
  fmt::print("    \"cpuUtilization\": {:.2f},\n", limits.cpuUtilization());
  fmt::print("    \"memoryUtilization\": {:.2f},\n", limits.memoryUtilization());
  fmt::print("    \"cpuHeadroom\": {:.2f},\n", limits.cpuHeadroom());
  fmt::print("    \"memoryHeadroom\": {:.2f},\n", limits.memoryHeadroom());
  fmt::print("    \"isContainerized\": {},\n", limits.isContainerized());
  fmt::print("    \"isCpuPressure\": {},\n", limits.isCpuPressure());
  fmt::print("    \"isMemoryPressure\": {}\n", limits.isMemoryPressure());
  fmt::print("  }}\n");

  fmt::print("}}\n");
}

} // namespace

int main(int argc, char* argv[]) {
  const headroom::helpers::args::ArgMap ARG_MAP = buildArgMap();
  headroom::helpers::args::ParsedArgs pargs;
  bool jsonOutput = false;

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
  }

  headroom::context::MetricsContext ctx(headroom::support::Config::fromEnvironment());

  const auto ENVIRONMENT = ctx.environment().read();
  if (ENVIRONMENT.isFailure()) {
    fmt::print(stderr, "Error: {}\n", ENVIRONMENT.error().toString());
    return 1;
  }
  const auto CONTAINER = ctx.container().read();
  if (CONTAINER.isFailure()) {
    fmt::print(stderr, "Error: {}\n", CONTAINER.error().toString());
    return 1;
  }
  const auto LIMITS = ctx.systemLimits().read();
  if (LIMITS.isFailure()) {
    fmt::print(stderr, "Error: {}\n", LIMITS.error().toString());
    return 1;
  }

  if (jsonOutput) {
    printJson(ENVIRONMENT.value(), CONTAINER.value(), LIMITS.value());
  } else {
    printHuman(ENVIRONMENT.value(), CONTAINER.value(), LIMITS.value());
  }

  return 0;
}
