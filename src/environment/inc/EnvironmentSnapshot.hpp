#ifndef HEADROOM_ENVIRONMENT_ENVIRONMENT_SNAPSHOT_HPP
#define HEADROOM_ENVIRONMENT_ENVIRONMENT_SNAPSHOT_HPP
/**
 * @file EnvironmentSnapshot.hpp
 * @brief Host identity: operating system, kernel, architecture, virtualization
 *        and container runtime.
 *
 * The classifiers are pure functions over file content so they can be fed
 * captured DMI, cpuinfo and cgroup text. Sources live in EnvironmentSource.hpp.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace headroom {

namespace environment {

/* ----------------------------- Enums ----------------------------- */

enum class OsFamily : std::uint8_t {
  LINUX = 0,
  MACOS,
  FREEBSD,
  WINDOWS,
  UNKNOWN,
};

enum class ArchitectureKind : std::uint8_t {
  X86_64 = 0, ///< x86_64 / amd64
  X86,        ///< i386 - i686
  ARM64,      ///< aarch64 / arm64
  OTHER,
};

enum class VirtualizationType : std::uint8_t {
  BARE_METAL = 0,
  VIRTUAL_MACHINE,
};

enum class VirtualizationVendor : std::uint8_t {
  UNKNOWN = 0,
  KVM,
  QEMU,
  VMWARE,
  VIRTUALBOX,
  XEN,
  HYPERV,
  BOCHS,
  PARALLELS,
  AWS,
  GOOGLE_CLOUD,
  DIGITAL_OCEAN,
};

enum class ContainerType : std::uint8_t {
  NONE = 0,
  DOCKER,
  PODMAN,
  KUBERNETES,
  CONTAINERD,
  CRIO,
};

/// @return Static string ("linux", "macos", "freebsd", "windows", "unknown").
[[nodiscard]] const char* toString(OsFamily family) noexcept;

/// @return Static string ("x86_64", "x86", "arm64", "other").
[[nodiscard]] const char* toString(ArchitectureKind kind) noexcept;

/// @return Static string ("bare_metal", "virtual_machine").
[[nodiscard]] const char* toString(VirtualizationType type) noexcept;

/// @return Static vendor name ("KVM", "Hyper-V", "Google Cloud", ..., "unknown").
[[nodiscard]] const char* toString(VirtualizationVendor vendor) noexcept;

/// @return Static string ("none", "docker", "podman", "kubernetes", "containerd", "cri-o").
[[nodiscard]] const char* toString(ContainerType type) noexcept;

/* ----------------------------- Components ----------------------------- */

struct OperatingSystem {
  OsFamily family{OsFamily::UNKNOWN};
  std::string name{};    ///< os-release NAME, or the uname sysname
  std::string version{}; ///< os-release VERSION_ID, or "unknown"
};

struct KernelInfo {
  std::string release{}; ///< e.g. "6.8.0-45-generic"
  std::string version{}; ///< Build string, e.g. "#45-Ubuntu SMP PREEMPT_DYNAMIC ..."
};

struct Architecture {
  ArchitectureKind kind{ArchitectureKind::OTHER};
  std::string raw{}; ///< uname machine field
};

struct Virtualization {
  VirtualizationType type{VirtualizationType::BARE_METAL};
  VirtualizationVendor vendor{VirtualizationVendor::UNKNOWN};
  std::string rawIdentifier{}; ///< Text the decision was made on; empty on bare metal

  [[nodiscard]] bool isVirtualMachine() const noexcept {
    return type == VirtualizationType::VIRTUAL_MACHINE;
  }
};

struct Containerization {
  ContainerType type{ContainerType::NONE};
  std::string runtime{};       ///< "docker", "podman", "containerd", "cri-o"; empty outside
  std::string rawIdentifier{}; ///< Marker file or /proc/self/cgroup; empty outside

  [[nodiscard]] bool insideContainer() const noexcept { return type != ContainerType::NONE; }
};

/* ----------------------------- EnvironmentSnapshot ----------------------------- */

struct EnvironmentSnapshot {
  OperatingSystem os{};
  KernelInfo kernel{};
  Architecture architecture{};
  Virtualization virtualization{};
  Containerization containerization{};

  /// Human-readable multi-line summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Classifiers ----------------------------- */

/**
 * @brief Value of @p key in os-release content.
 *
 * Surrounding single or double quotes are removed.
 *
 * @return nullopt when the key is missing or its value is empty.
 */
[[nodiscard]] std::optional<std::string> osReleaseField(std::string_view content,
                                                        std::string_view key);

/// Linux OperatingSystem from os-release content (NAME defaults to "Linux", VERSION_ID to
/// "unknown").
[[nodiscard]] OperatingSystem parseOsRelease(std::string_view content);

/// Architecture family of a uname machine string.
[[nodiscard]] ArchitectureKind classifyArchitecture(std::string_view machine) noexcept;

/**
 * @brief Decide virtualization from DMI strings, then the cpuinfo hypervisor flag.
 *
 * @param productName  /sys/class/dmi/id/product_name (may be empty).
 * @param sysVendor    /sys/class/dmi/id/sys_vendor (may be empty).
 * @param cpuinfo      /proc/cpuinfo (may be empty).
 *
 * DMI strings are matched case-insensitively against a vendor table. Without
 * a DMI match, a "hypervisor" token on a cpuinfo flags line still marks a VM
 * of unknown vendor.
 */
[[nodiscard]] Virtualization classifyVirtualization(std::string_view productName,
                                                    std::string_view sysVendor,
                                                    std::string_view cpuinfo);

/**
 * @brief Decide the container runtime from marker files and /proc/self/cgroup.
 *
 * Order: /.dockerenv, /run/.containerenv, then docker, libpod, kubepods,
 * containerd and crio markers in the cgroup paths.
 */
[[nodiscard]] Containerization classifyContainerization(bool dockerEnvPresent,
                                                        bool containerEnvPresent,
                                                        std::string_view selfCgroup);

} // namespace environment

} // namespace headroom

#endif // HEADROOM_ENVIRONMENT_ENVIRONMENT_SNAPSHOT_HPP
