#ifndef HEADROOM_ENVIRONMENT_ENVIRONMENT_SOURCE_HPP
#define HEADROOM_ENVIRONMENT_ENVIRONMENT_SOURCE_HPP
/**
 * @file EnvironmentSource.hpp
 * @brief Environment snapshot sources and their fallback chain.
 *
 * Chain:
 *  1. LinuxEnvironmentSource - os-release, /proc/sys/kernel, DMI, cpuinfo,
 *                              container marker files, /proc/self/cgroup
 *  2. UnameEnvironmentSource - uname(2) only; bare metal, no container
 *
 * Architecture always comes from uname(2).
 */

#include "src/environment/inc/EnvironmentSnapshot.hpp"
#include "src/helpers/inc/Result.hpp"
#include "src/source/inc/Source.hpp"
#include "src/support/inc/FileReader.hpp"

#include <memory>
#include <string>

namespace headroom {

namespace environment {

inline constexpr const char* OS_RELEASE_PATH = "/etc/os-release";
inline constexpr const char* OS_RELEASE_FALLBACK_PATH = "/usr/lib/os-release";
inline constexpr const char* KERNEL_OSRELEASE_PATH = "/proc/sys/kernel/osrelease";
inline constexpr const char* KERNEL_VERSION_PATH = "/proc/sys/kernel/version";
inline constexpr const char* DMI_PRODUCT_NAME_PATH = "/sys/class/dmi/id/product_name";
inline constexpr const char* DMI_SYS_VENDOR_PATH = "/sys/class/dmi/id/sys_vendor";
inline constexpr const char* DOCKERENV_PATH = "/.dockerenv";
inline constexpr const char* CONTAINERENV_PATH = "/run/.containerenv";

/* ----------------------------- uname ----------------------------- */

struct UnameInfo {
  std::string sysname{};
  std::string release{};
  std::string version{};
  std::string machine{};
};

/// uname(2), or SYSTEM_ERROR.
[[nodiscard]] Result<UnameInfo> readUname();

/* ----------------------------- Sources ----------------------------- */

class LinuxEnvironmentSource final : public source::Source<EnvironmentSnapshot> {
public:
  explicit LinuxEnvironmentSource(std::shared_ptr<const support::IFileReader> reader);

  /**
   * @brief Read every component.
   *
   * Fails only when the kernel release is unreadable. Every other file is
   * optional: missing os-release names the OS after the uname sysname, and
   * missing DMI, cpuinfo or cgroup files classify as bare metal and no
   * container.
   */
  [[nodiscard]] Result<EnvironmentSnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "linux"; }

private:
  std::shared_ptr<const support::IFileReader> reader_;
};

class UnameEnvironmentSource final : public source::Source<EnvironmentSnapshot> {
public:
  [[nodiscard]] Result<EnvironmentSnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "uname"; }
};

/// Environment chain for the compiled platform.
[[nodiscard]] std::unique_ptr<source::Source<EnvironmentSnapshot>>
createEnvironmentSource(std::shared_ptr<const support::IFileReader> reader);

} // namespace environment

} // namespace headroom

#endif // HEADROOM_ENVIRONMENT_ENVIRONMENT_SOURCE_HPP
