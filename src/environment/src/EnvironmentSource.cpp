/**
 * @file EnvironmentSource.cpp
 * @brief procfs/sysfs and uname(2) environment sources.
 */

#include "src/environment/inc/EnvironmentSource.hpp"
#include "src/cgroup/inc/CgroupVersionDetector.hpp"
#include "src/cgroup/inc/ContainerSource.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/source/inc/FallbackSource.hpp"
#include "src/support/inc/Platform.hpp"

#include <sys/utsname.h> // uname

#include <cerrno>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace headroom {

namespace environment {

using headroom::helpers::strings::trim;

namespace {

/// Trimmed content of @p path, or empty when unreadable.
std::string readTrimmed(const support::IFileReader& reader, const char* path) {
  const auto CONTENT = reader.read(path);
  if (CONTENT.isFailure()) {
    return {};
  }
  return std::string(trim(CONTENT.value()));
}

OsFamily familyOf(support::Platform platform) noexcept {
  switch (platform) {
  case support::Platform::LINUX:
    return OsFamily::LINUX;
  case support::Platform::MACOS:
    return OsFamily::MACOS;
  case support::Platform::FREEBSD:
    return OsFamily::FREEBSD;
  case support::Platform::WINDOWS:
    return OsFamily::WINDOWS;
  case support::Platform::OTHER:
    return OsFamily::UNKNOWN;
  }
  return OsFamily::UNKNOWN;
}

Architecture architectureOf(const UnameInfo& info) {
  Architecture arch{};
  arch.raw = info.machine;
  arch.kind = classifyArchitecture(info.machine);
  return arch;
}

} // namespace

/* ----------------------------- uname ----------------------------- */

Result<UnameInfo> readUname() {
  struct utsname uts{};
  if (::uname(&uts) != 0) {
    const int ERR = errno;
    return Result<UnameInfo>::failure(
        ErrorCode::SYSTEM_ERROR,
        fmt::format("uname failed: {}", std::error_code(ERR, std::generic_category()).message()));
  }
  UnameInfo info{};
  info.sysname = uts.sysname;
  info.release = uts.release;
  info.version = uts.version;
  info.machine = uts.machine;
  return Result<UnameInfo>::success(std::move(info));
}

/* ----------------------------- LinuxEnvironmentSource ----------------------------- */

LinuxEnvironmentSource::LinuxEnvironmentSource(std::shared_ptr<const support::IFileReader> reader)
    : reader_(std::move(reader)) {}

Result<EnvironmentSnapshot> LinuxEnvironmentSource::read() {
  const auto RELEASE = reader_->read(KERNEL_OSRELEASE_PATH);
  if (RELEASE.isFailure()) {
    return Result<EnvironmentSnapshot>::failure(RELEASE.error());
  }
  const auto UNAME = readUname();
  if (UNAME.isFailure()) {
    return Result<EnvironmentSnapshot>::failure(UNAME.error());
  }

  EnvironmentSnapshot snap{};

  auto osRelease = reader_->read(OS_RELEASE_PATH);
  if (osRelease.isFailure()) {
    osRelease = reader_->read(OS_RELEASE_FALLBACK_PATH);
  }
  if (osRelease.isSuccess()) {
    snap.os = parseOsRelease(osRelease.value());
  } else {
    helpers::log::logger()->debug("os-release unavailable, naming OS after uname: {}",
                                  osRelease.error().toString());
    snap.os.family = OsFamily::LINUX;
    snap.os.name = UNAME.value().sysname;
    snap.os.version = "unknown";
  }

  snap.kernel.release = std::string(trim(RELEASE.value()));
  snap.kernel.version = readTrimmed(*reader_, KERNEL_VERSION_PATH);
  if (snap.kernel.version.empty()) {
    snap.kernel.version = UNAME.value().version;
  }
  snap.architecture = architectureOf(UNAME.value());

  const std::string CPUINFO = reader_->read(cgroup::PROC_CPUINFO_PATH).valueOr("");
  snap.virtualization = classifyVirtualization(readTrimmed(*reader_, DMI_PRODUCT_NAME_PATH),
                                               readTrimmed(*reader_, DMI_SYS_VENDOR_PATH), CPUINFO);

  const std::string SELF_CGROUP = reader_->read(cgroup::PROC_SELF_CGROUP_PATH).valueOr("");
  snap.containerization = classifyContainerization(
      reader_->exists(DOCKERENV_PATH), reader_->exists(CONTAINERENV_PATH), SELF_CGROUP);

  helpers::log::logger()->debug("Environment: {} {}, kernel {}, {}, container {}", snap.os.name,
                                snap.os.version, snap.kernel.release,
                                toString(snap.virtualization.type),
                                toString(snap.containerization.type));
  return Result<EnvironmentSnapshot>::success(std::move(snap));
}

/* ----------------------------- UnameEnvironmentSource ----------------------------- */

Result<EnvironmentSnapshot> UnameEnvironmentSource::read() {
  const auto UNAME = readUname();
  if (UNAME.isFailure()) {
    return Result<EnvironmentSnapshot>::failure(UNAME.error());
  }
  const UnameInfo& INFO = UNAME.value();

  EnvironmentSnapshot snap{};
  snap.os.family = familyOf(support::currentPlatform());
  snap.os.name = INFO.sysname;
  snap.os.version = "unknown";
  snap.kernel.release = INFO.release;
  snap.kernel.version = INFO.version;
  snap.architecture = architectureOf(INFO);
  return Result<EnvironmentSnapshot>::success(std::move(snap));
}

/* ----------------------------- Factory ----------------------------- */

std::unique_ptr<source::Source<EnvironmentSnapshot>>
createEnvironmentSource(std::shared_ptr<const support::IFileReader> reader) {
  std::vector<std::unique_ptr<source::Source<EnvironmentSnapshot>>> chain;
  if constexpr (support::currentPlatform() == support::Platform::LINUX) {
    chain.push_back(std::make_unique<LinuxEnvironmentSource>(std::move(reader)));
  }
  chain.push_back(std::make_unique<UnameEnvironmentSource>());
  return std::make_unique<source::FallbackSource<EnvironmentSnapshot>>("environment",
                                                                        std::move(chain));
}

} // namespace environment

} // namespace headroom
