/**
 * @file ContainerSource.cpp
 * @brief Container limit sources.
 */

#include "src/cgroup/inc/ContainerSource.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/support/inc/Platform.hpp"

#include <utility>

namespace headroom {

namespace cgroup {

using headroom::helpers::strings::splitLines;
using headroom::helpers::strings::startsWith;

std::size_t countCpuinfoProcessors(std::string_view content) {
  std::size_t count = 0;
  for (const std::string_view LINE : splitLines(content)) {
    if (startsWith(LINE, "processor")) {
      ++count;
    }
  }
  return (count == 0) ? 1 : count;
}

/* ----------------------------- CgroupContainerSource ----------------------------- */

CgroupContainerSource::CgroupContainerSource(std::shared_ptr<const support::IFileReader> reader,
                                             helpers::clock::MonotonicClock clock)
    : reader_(reader), parser_(std::move(reader), std::move(clock)) {}

double CgroupContainerSource::hostCpuCores() const {
  const auto CONTENT = reader_->read(PROC_CPUINFO_PATH);
  if (CONTENT.isFailure()) {
    helpers::log::logger()->debug("Host core count defaults to 1: {}",
                                  CONTENT.error().toString());
    return 1.0;
  }
  return static_cast<double>(countCpuinfoProcessors(CONTENT.value()));
}

Result<ContainerLimits> CgroupContainerSource::read() {
  return Result<ContainerLimits>::success(parser_.parse(hostCpuCores()));
}

/* ----------------------------- Factory ----------------------------- */

std::unique_ptr<source::Source<ContainerLimits>>
createContainerSource(std::shared_ptr<const support::IFileReader> reader,
                      helpers::clock::MonotonicClock clock) {
  if constexpr (support::currentPlatform() == support::Platform::LINUX) {
    return std::make_unique<CgroupContainerSource>(std::move(reader), std::move(clock));
  } else {
    return std::make_unique<NoContainerSource>();
  }
}

} // namespace cgroup

} // namespace headroom
