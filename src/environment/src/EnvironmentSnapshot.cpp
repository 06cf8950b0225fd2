/**
 * @file EnvironmentSnapshot.cpp
 * @brief os-release parsing and virtualization/container classification.
 */

#include "src/environment/inc/EnvironmentSnapshot.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <array>
#include <cstddef>

#include <fmt/core.h>

namespace headroom {

namespace environment {

using headroom::helpers::strings::splitLines;
using headroom::helpers::strings::splitWhitespace;
using headroom::helpers::strings::startsWith;
using headroom::helpers::strings::trim;

namespace {

constexpr char lower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

/// Case-insensitive substring search.
bool containsIgnoreCase(std::string_view haystack, std::string_view needle) noexcept {
  if (needle.empty()) {
    return true;
  }
  if (needle.size() > haystack.size()) {
    return false;
  }
  for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
    bool match = true;
    for (std::size_t j = 0; j < needle.size(); ++j) {
      if (lower(haystack[i + j]) != lower(needle[j])) {
        match = false;
        break;
      }
    }
    if (match) {
      return true;
    }
  }
  return false;
}

/// DMI keyword and the vendor it identifies. @c alsoRequires must appear too when set.
struct VendorMarker {
  std::string_view keyword;
  std::string_view alsoRequires;
  VirtualizationVendor vendor;
};

// First match wins.
constexpr std::array<VendorMarker, 11> VENDOR_MARKERS{{
    {"KVM", "", VirtualizationVendor::KVM},
    {"QEMU", "", VirtualizationVendor::QEMU},
    {"VMware", "", VirtualizationVendor::VMWARE},
    {"VirtualBox", "", VirtualizationVendor::VIRTUALBOX},
    {"Xen", "", VirtualizationVendor::XEN},
    {"Microsoft", "Virtual", VirtualizationVendor::HYPERV},
    {"Bochs", "", VirtualizationVendor::BOCHS},
    {"Parallels", "", VirtualizationVendor::PARALLELS},
    {"Amazon EC2", "", VirtualizationVendor::AWS},
    {"Google", "", VirtualizationVendor::GOOGLE_CLOUD},
    {"DigitalOcean", "", VirtualizationVendor::DIGITAL_OCEAN},
}};

/// True if a cpuinfo "flags" line lists the hypervisor bit.
bool hasHypervisorFlag(std::string_view cpuinfo) {
  for (std::string_view line : splitLines(cpuinfo)) {
    if (!startsWith(line, "flags")) {
      continue;
    }
    const std::size_t COLON = line.find(':');
    if (COLON == std::string_view::npos) {
      continue;
    }
    for (std::string_view flag : splitWhitespace(line.substr(COLON + 1))) {
      if (flag == "hypervisor") {
        return true;
      }
    }
  }
  return false;
}

Containerization container(ContainerType type, const char* runtime, const char* marker) {
  Containerization c{};
  c.type = type;
  c.runtime = runtime;
  c.rawIdentifier = marker;
  return c;
}

} // namespace

/* ----------------------------- Enum toString ----------------------------- */

const char* toString(OsFamily family) noexcept {
  switch (family) {
  case OsFamily::LINUX:
    return "linux";
  case OsFamily::MACOS:
    return "macos";
  case OsFamily::FREEBSD:
    return "freebsd";
  case OsFamily::WINDOWS:
    return "windows";
  case OsFamily::UNKNOWN:
    return "unknown";
  }
  return "unknown";
}

const char* toString(ArchitectureKind kind) noexcept {
  switch (kind) {
  case ArchitectureKind::X86_64:
    return "x86_64";
  case ArchitectureKind::X86:
    return "x86";
  case ArchitectureKind::ARM64:
    return "arm64";
  case ArchitectureKind::OTHER:
    return "other";
  }
  return "other";
}

const char* toString(VirtualizationType type) noexcept {
  switch (type) {
  case VirtualizationType::BARE_METAL:
    return "bare_metal";
  case VirtualizationType::VIRTUAL_MACHINE:
    return "virtual_machine";
  }
  return "bare_metal";
}

const char* toString(VirtualizationVendor vendor) noexcept {
  switch (vendor) {
  case VirtualizationVendor::UNKNOWN:
    return "unknown";
  case VirtualizationVendor::KVM:
    return "KVM";
  case VirtualizationVendor::QEMU:
    return "QEMU";
  case VirtualizationVendor::VMWARE:
    return "VMware";
  case VirtualizationVendor::VIRTUALBOX:
    return "VirtualBox";
  case VirtualizationVendor::XEN:
    return "Xen";
  case VirtualizationVendor::HYPERV:
    return "Hyper-V";
  case VirtualizationVendor::BOCHS:
    return "Bochs";
  case VirtualizationVendor::PARALLELS:
    return "Parallels";
  case VirtualizationVendor::AWS:
    return "AWS";
  case VirtualizationVendor::GOOGLE_CLOUD:
    return "Google Cloud";
  case VirtualizationVendor::DIGITAL_OCEAN:
    return "DigitalOcean";
  }
  return "unknown";
}

const char* toString(ContainerType type) noexcept {
  switch (type) {
  case ContainerType::NONE:
    return "none";
  case ContainerType::DOCKER:
    return "docker";
  case ContainerType::PODMAN:
    return "podman";
  case ContainerType::KUBERNETES:
    return "kubernetes";
  case ContainerType::CONTAINERD:
    return "containerd";
  case ContainerType::CRIO:
    return "cri-o";
  }
  return "none";
}

/* ----------------------------- EnvironmentSnapshot ----------------------------- */

std::string EnvironmentSnapshot::toString() const {
  std::string out;
  out += fmt::format("OS:             {} {} ({})\n", os.name, os.version,
                     environment::toString(os.family));
  out += fmt::format("Kernel:         {}\n", kernel.release);
  out += fmt::format("Architecture:   {} ({})\n", architecture.raw,
                     environment::toString(architecture.kind));
  if (virtualization.isVirtualMachine()) {
    out += fmt::format("Virtualization: {} ({})\n", environment::toString(virtualization.vendor),
                       virtualization.rawIdentifier);
  } else {
    out += "Virtualization: bare metal\n";
  }
  if (containerization.insideContainer()) {
    out += fmt::format("Container:      {} via {}\n",
                       environment::toString(containerization.type),
                       containerization.rawIdentifier);
  } else {
    out += "Container:      none\n";
  }
  return out;
}

/* ----------------------------- Classifiers ----------------------------- */

std::optional<std::string> osReleaseField(std::string_view content, std::string_view key) {
  for (std::string_view line : splitLines(content)) {
    line = trim(line);
    if (line.size() <= key.size() || !startsWith(line, key) || line[key.size()] != '=') {
      continue;
    }
    std::string_view value = line.substr(key.size() + 1);
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    if (value.empty()) {
      return std::nullopt;
    }
    return std::string(value);
  }
  return std::nullopt;
}

OperatingSystem parseOsRelease(std::string_view content) {
  OperatingSystem os{};
  os.family = OsFamily::LINUX;
  os.name = osReleaseField(content, "NAME").value_or("Linux");
  os.version = osReleaseField(content, "VERSION_ID").value_or("unknown");
  return os;
}

ArchitectureKind classifyArchitecture(std::string_view machine) noexcept {
  if (machine == "x86_64" || machine == "amd64") {
    return ArchitectureKind::X86_64;
  }
  if (machine == "aarch64" || machine == "arm64") {
    return ArchitectureKind::ARM64;
  }
  if (machine == "x86" || (machine.size() == 4 && machine[0] == 'i' && machine.substr(2) == "86" &&
                           machine[1] >= '3' && machine[1] <= '6')) {
    return ArchitectureKind::X86;
  }
  return ArchitectureKind::OTHER;
}

Virtualization classifyVirtualization(std::string_view productName, std::string_view sysVendor,
                                      std::string_view cpuinfo) {
  const std::string COMBINED = fmt::format("{} {}", trim(productName), trim(sysVendor));

  for (const VendorMarker& m : VENDOR_MARKERS) {
    if (!containsIgnoreCase(COMBINED, m.keyword)) {
      continue;
    }
    if (!m.alsoRequires.empty() && !containsIgnoreCase(COMBINED, m.alsoRequires)) {
      continue;
    }
    Virtualization v{};
    v.type = VirtualizationType::VIRTUAL_MACHINE;
    v.vendor = m.vendor;
    v.rawIdentifier = std::string(trim(COMBINED));
    return v;
  }

  if (hasHypervisorFlag(cpuinfo)) {
    Virtualization v{};
    v.type = VirtualizationType::VIRTUAL_MACHINE;
    v.rawIdentifier = "hypervisor flag detected";
    return v;
  }
  return Virtualization{};
}

Containerization classifyContainerization(bool dockerEnvPresent, bool containerEnvPresent,
                                          std::string_view selfCgroup) {
  if (dockerEnvPresent) {
    return container(ContainerType::DOCKER, "docker", "/.dockerenv");
  }
  if (containerEnvPresent) {
    return container(ContainerType::PODMAN, "podman", "/run/.containerenv");
  }

  constexpr const char* CGROUP_MARKER = "/proc/self/cgroup";
  if (selfCgroup.find("docker") != std::string_view::npos) {
    return container(ContainerType::DOCKER, "docker", CGROUP_MARKER);
  }
  if (selfCgroup.find("libpod") != std::string_view::npos) {
    return container(ContainerType::PODMAN, "podman", CGROUP_MARKER);
  }
  if (selfCgroup.find("kubepods") != std::string_view::npos) {
    return container(ContainerType::KUBERNETES, "containerd", CGROUP_MARKER);
  }
  if (selfCgroup.find("containerd") != std::string_view::npos) {
    return container(ContainerType::CONTAINERD, "containerd", CGROUP_MARKER);
  }
  if (selfCgroup.find("crio") != std::string_view::npos) {
    return container(ContainerType::CRIO, "cri-o", CGROUP_MARKER);
  }
  return Containerization{};
}

} // namespace environment

} // namespace headroom
