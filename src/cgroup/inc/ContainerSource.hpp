#ifndef HEADROOM_CGROUP_CONTAINER_SOURCE_HPP
#define HEADROOM_CGROUP_CONTAINER_SOURCE_HPP
/**
 * @file ContainerSource.hpp
 * @brief Source<ContainerLimits> implementations and the platform factory.
 *
 * Container sources never fail on a supported platform: missing data is
 * reported as absent fields. On platforms without cgroups the factory returns
 * NoContainerSource, which always yields ContainerLimits{NONE}.
 */

#include "src/cgroup/inc/CgroupParser.hpp"
#include "src/cgroup/inc/ContainerLimits.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/source/inc/Source.hpp"
#include "src/support/inc/FileReader.hpp"

#include <cstddef>
#include <memory>
#include <string_view>

namespace headroom {

namespace cgroup {

/// Path of the CPU description used to count host cores.
inline constexpr const char* PROC_CPUINFO_PATH = "/proc/cpuinfo";

/**
 * @brief Number of "processor" entries in /proc/cpuinfo content, at least 1.
 */
[[nodiscard]] std::size_t countCpuinfoProcessors(std::string_view content);

/* ----------------------------- CgroupContainerSource ----------------------------- */

/**
 * @brief Reads container limits from cgroupfs (Linux).
 */
class CgroupContainerSource final : public source::Source<ContainerLimits> {
public:
  explicit CgroupContainerSource(std::shared_ptr<const support::IFileReader> reader,
                                 helpers::clock::MonotonicClock clock = {});

  [[nodiscard]] Result<ContainerLimits> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "cgroup"; }

  /// Host core count from /proc/cpuinfo (1 if unreadable).
  [[nodiscard]] double hostCpuCores() const;

  /// The coordinator, for cache control.
  [[nodiscard]] CgroupParser& parser() noexcept { return parser_; }

private:
  std::shared_ptr<const support::IFileReader> reader_;
  CgroupParser parser_;
};

/* ----------------------------- NoContainerSource ----------------------------- */

/**
 * @brief Container source for platforms without cgroups.
 */
class NoContainerSource final : public source::Source<ContainerLimits> {
public:
  [[nodiscard]] Result<ContainerLimits> read() override {
    return Result<ContainerLimits>::success(ContainerLimits{});
  }

  [[nodiscard]] const char* name() const noexcept override { return "none"; }
};

/* ----------------------------- Factory ----------------------------- */

/**
 * @brief Container source for the compiled platform.
 */
[[nodiscard]] std::unique_ptr<source::Source<ContainerLimits>>
createContainerSource(std::shared_ptr<const support::IFileReader> reader,
                      helpers::clock::MonotonicClock clock = {});

} // namespace cgroup

} // namespace headroom

#endif // HEADROOM_CGROUP_CONTAINER_SOURCE_HPP
