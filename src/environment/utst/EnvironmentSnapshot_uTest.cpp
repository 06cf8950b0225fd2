/**
 * @file EnvironmentSnapshot_uTest.cpp
 * @brief Unit tests for headroom::environment classifiers and sources.
 *
 * Notes:
 *  - Source tests read from an in-memory tree; architecture still comes from
 *    the host's uname(2), so those assertions check consistency only.
 */

#include "src/cgroup/inc/CgroupVersionDetector.hpp"
#include "src/cgroup/inc/ContainerSource.hpp"
#include "src/environment/inc/EnvironmentSnapshot.hpp"
#include "src/environment/inc/EnvironmentSource.hpp"
#include "src/support/inc/FileReader.hpp"
#include "src/support/inc/InMemoryFileReader.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using headroom::ErrorCode;
using headroom::cgroup::PROC_CPUINFO_PATH;
using headroom::cgroup::PROC_SELF_CGROUP_PATH;
using headroom::environment::ArchitectureKind;
using headroom::environment::classifyArchitecture;
using headroom::environment::classifyContainerization;
using headroom::environment::classifyVirtualization;
using headroom::environment::ContainerType;
using headroom::environment::CONTAINERENV_PATH;
using headroom::environment::createEnvironmentSource;
using headroom::environment::DMI_PRODUCT_NAME_PATH;
using headroom::environment::DMI_SYS_VENDOR_PATH;
using headroom::environment::DOCKERENV_PATH;
using headroom::environment::EnvironmentSnapshot;
using headroom::environment::KERNEL_OSRELEASE_PATH;
using headroom::environment::KERNEL_VERSION_PATH;
using headroom::environment::LinuxEnvironmentSource;
using headroom::environment::OS_RELEASE_FALLBACK_PATH;
using headroom::environment::OS_RELEASE_PATH;
using headroom::environment::osReleaseField;
using headroom::environment::OsFamily;
using headroom::environment::parseOsRelease;
using headroom::environment::readUname;
using headroom::environment::UnameEnvironmentSource;
using headroom::environment::VirtualizationType;
using headroom::environment::VirtualizationVendor;
using headroom::support::FileReader;
using headroom::support::InMemoryFileReader;

namespace {

constexpr const char* OS_RELEASE_SAMPLE = "PRETTY_NAME=\"Ubuntu 24.04.1 LTS\"\n"
                                          "NAME=\"Ubuntu\"\n"
                                          "VERSION_ID=\"24.04\"\n"
                                          "VERSION=\"24.04.1 LTS (Noble Numbat)\"\n"
                                          "ID=ubuntu\n";

constexpr const char* CPUINFO_VM = "processor\t: 0\n"
                                   "model name\t: Intel(R) Xeon(R) Platinum 8375C\n"
                                   "flags\t\t: fpu vme de pse tsc msr hypervisor lahf_lm\n";

constexpr const char* CPUINFO_METAL = "processor\t: 0\n"
                                      "model name\t: AMD Ryzen 9 7950X\n"
                                      "flags\t\t: fpu vme de pse tsc msr svm lahf_lm\n";

} // namespace

/* ----------------------------- os-release ----------------------------- */

/** @test Quoted and unquoted os-release values are extracted by exact key. */
TEST(OsReleaseTest, Fields) {
  EXPECT_EQ(osReleaseField(OS_RELEASE_SAMPLE, "NAME").value(), "Ubuntu");
  EXPECT_EQ(osReleaseField(OS_RELEASE_SAMPLE, "VERSION_ID").value(), "24.04");
  EXPECT_EQ(osReleaseField(OS_RELEASE_SAMPLE, "ID").value(), "ubuntu");
  EXPECT_EQ(osReleaseField("NAME='Fedora Linux'\n", "NAME").value(), "Fedora Linux");
  EXPECT_FALSE(osReleaseField(OS_RELEASE_SAMPLE, "BUILD_ID").has_value());
  EXPECT_FALSE(osReleaseField("NAME=\n", "NAME").has_value());
  EXPECT_FALSE(osReleaseField("NAME=\"\"\n", "NAME").has_value());
}

/** @test Missing keys default to "Linux" and "unknown". */
TEST(OsReleaseTest, Defaults) {
  const auto OS = parseOsRelease("ID=alpine\n");
  EXPECT_EQ(OS.family, OsFamily::LINUX);
  EXPECT_EQ(OS.name, "Linux");
  EXPECT_EQ(OS.version, "unknown");
}

/* ----------------------------- Architecture ----------------------------- */

/** @test uname machine strings map to architecture families. */
TEST(ArchitectureTest, Classify) {
  EXPECT_EQ(classifyArchitecture("x86_64"), ArchitectureKind::X86_64);
  EXPECT_EQ(classifyArchitecture("amd64"), ArchitectureKind::X86_64);
  EXPECT_EQ(classifyArchitecture("aarch64"), ArchitectureKind::ARM64);
  EXPECT_EQ(classifyArchitecture("arm64"), ArchitectureKind::ARM64);
  EXPECT_EQ(classifyArchitecture("i686"), ArchitectureKind::X86);
  EXPECT_EQ(classifyArchitecture("i386"), ArchitectureKind::X86);
  EXPECT_EQ(classifyArchitecture("i786"), ArchitectureKind::OTHER);
  EXPECT_EQ(classifyArchitecture("riscv64"), ArchitectureKind::OTHER);
  EXPECT_EQ(classifyArchitecture(""), ArchitectureKind::OTHER);
}

/* ----------------------------- Virtualization ----------------------------- */

/** @test DMI product and vendor strings identify the hypervisor. */
TEST(VirtualizationTest, DmiVendors) {
  const auto KVM = classifyVirtualization("KVM\n", "Red Hat\n", "");
  EXPECT_EQ(KVM.type, VirtualizationType::VIRTUAL_MACHINE);
  EXPECT_EQ(KVM.vendor, VirtualizationVendor::KVM);
  EXPECT_EQ(KVM.rawIdentifier, "KVM Red Hat");

  EXPECT_EQ(classifyVirtualization("Standard PC (Q35 + ICH9, 2009)", "QEMU", "").vendor,
            VirtualizationVendor::QEMU);
  EXPECT_EQ(classifyVirtualization("VMware7,1", "VMware, Inc.", "").vendor,
            VirtualizationVendor::VMWARE);
  EXPECT_EQ(classifyVirtualization("VirtualBox", "innotek GmbH", "").vendor,
            VirtualizationVendor::VIRTUALBOX);
  EXPECT_EQ(classifyVirtualization("HVM domU", "Xen", "").vendor, VirtualizationVendor::XEN);
  EXPECT_EQ(classifyVirtualization("Virtual Machine", "Microsoft Corporation", "").vendor,
            VirtualizationVendor::HYPERV);
  EXPECT_EQ(classifyVirtualization("t3.micro", "Amazon EC2", "").vendor,
            VirtualizationVendor::AWS);
  EXPECT_EQ(classifyVirtualization("Google Compute Engine", "Google", "").vendor,
            VirtualizationVendor::GOOGLE_CLOUD);
  EXPECT_EQ(classifyVirtualization("Droplet", "DigitalOcean", "").vendor,
            VirtualizationVendor::DIGITAL_OCEAN);
}

/** @test Microsoft hardware that is not a virtual machine stays bare metal. */
TEST(VirtualizationTest, MicrosoftHardwareIsNotHyperV) {
  const auto SURFACE = classifyVirtualization("Surface Laptop 5", "Microsoft Corporation",
                                              CPUINFO_METAL);
  EXPECT_EQ(SURFACE.type, VirtualizationType::BARE_METAL);
  EXPECT_FALSE(SURFACE.isVirtualMachine());
}

/** @test Without a DMI match the cpuinfo hypervisor flag still marks a VM. */
TEST(VirtualizationTest, HypervisorFlag) {
  const auto V = classifyVirtualization("", "", CPUINFO_VM);
  EXPECT_EQ(V.type, VirtualizationType::VIRTUAL_MACHINE);
  EXPECT_EQ(V.vendor, VirtualizationVendor::UNKNOWN);
  EXPECT_EQ(V.rawIdentifier, "hypervisor flag detected");
}

/** @test Real hardware with no hypervisor flag is bare metal. */
TEST(VirtualizationTest, BareMetal) {
  const auto V = classifyVirtualization("PRIME X670E-PRO", "ASUS", CPUINFO_METAL);
  EXPECT_EQ(V.type, VirtualizationType::BARE_METAL);
  EXPECT_EQ(V.vendor, VirtualizationVendor::UNKNOWN);
  EXPECT_TRUE(V.rawIdentifier.empty());
  // "hypervisor" outside a flags line does not count.
  const auto MODEL_ONLY = classifyVirtualization("", "", "model name\t: hypervisor-ready\n");
  EXPECT_FALSE(MODEL_ONLY.isVirtualMachine());
}

/* ----------------------------- Containerization ----------------------------- */

/** @test Marker files win over cgroup paths. */
TEST(ContainerizationTest, MarkerFiles) {
  const auto DOCKER = classifyContainerization(true, true, "0::/kubepods/pod1/abc\n");
  EXPECT_EQ(DOCKER.type, ContainerType::DOCKER);
  EXPECT_EQ(DOCKER.runtime, "docker");
  EXPECT_EQ(DOCKER.rawIdentifier, "/.dockerenv");
  EXPECT_TRUE(DOCKER.insideContainer());

  const auto PODMAN = classifyContainerization(false, true, "");
  EXPECT_EQ(PODMAN.type, ContainerType::PODMAN);
  EXPECT_EQ(PODMAN.rawIdentifier, "/run/.containerenv");
}

/** @test Runtime markers in /proc/self/cgroup identify the container. */
TEST(ContainerizationTest, CgroupMarkers) {
  EXPECT_EQ(classifyContainerization(false, false, "0::/system.slice/docker-0123.scope\n").type,
            ContainerType::DOCKER);
  EXPECT_EQ(classifyContainerization(false, false, "0::/machine.slice/libpod-0123.scope\n").type,
            ContainerType::PODMAN);

  const auto K8S =
      classifyContainerization(false, false, "0::/kubepods.slice/kubepods-burstable.slice/x\n");
  EXPECT_EQ(K8S.type, ContainerType::KUBERNETES);
  EXPECT_EQ(K8S.runtime, "containerd");
  EXPECT_EQ(K8S.rawIdentifier, "/proc/self/cgroup");

  EXPECT_EQ(classifyContainerization(false, false, "0::/containerd/abc\n").type,
            ContainerType::CONTAINERD);
  EXPECT_EQ(classifyContainerization(false, false, "0::/crio-abc.scope\n").runtime, "cri-o");
}

/** @test An ordinary host session is not a container. */
TEST(ContainerizationTest, Host) {
  const auto C = classifyContainerization(false, false, "0::/user.slice/user-1000.slice\n");
  EXPECT_EQ(C.type, ContainerType::NONE);
  EXPECT_FALSE(C.insideContainer());
  EXPECT_TRUE(C.runtime.empty());
}

/* ----------------------------- Sources ----------------------------- */

class LinuxEnvironmentSourceTest : public ::testing::Test {
protected:
  void SetUp() override {
    reader_->setFile(OS_RELEASE_PATH, OS_RELEASE_SAMPLE);
    reader_->setFile(KERNEL_OSRELEASE_PATH, "6.8.0-45-generic\n");
    reader_->setFile(KERNEL_VERSION_PATH, "#45-Ubuntu SMP PREEMPT_DYNAMIC Fri Aug 30 12:02:04\n");
    reader_->setFile(DMI_PRODUCT_NAME_PATH, "KVM\n");
    reader_->setFile(DMI_SYS_VENDOR_PATH, "QEMU\n");
    reader_->setFile(PROC_CPUINFO_PATH, CPUINFO_VM);
    reader_->setFile(PROC_SELF_CGROUP_PATH, "0::/kubepods.slice/pod42/cri-containerd-1.scope\n");
  }

  std::shared_ptr<InMemoryFileReader> reader_ = std::make_shared<InMemoryFileReader>();
};

/** @test Every component is read from the injected tree. */
TEST_F(LinuxEnvironmentSourceTest, ReadsAllComponents) {
  LinuxEnvironmentSource source(reader_);
  const auto RES = source.read();
  ASSERT_TRUE(RES.isSuccess()) << RES.error().toString();
  const EnvironmentSnapshot& ENV = RES.value();

  EXPECT_EQ(ENV.os.family, OsFamily::LINUX);
  EXPECT_EQ(ENV.os.name, "Ubuntu");
  EXPECT_EQ(ENV.os.version, "24.04");
  EXPECT_EQ(ENV.kernel.release, "6.8.0-45-generic");
  EXPECT_EQ(ENV.kernel.version, "#45-Ubuntu SMP PREEMPT_DYNAMIC Fri Aug 30 12:02:04");
  EXPECT_FALSE(ENV.architecture.raw.empty());
  EXPECT_EQ(ENV.architecture.kind, classifyArchitecture(ENV.architecture.raw));
  EXPECT_EQ(ENV.virtualization.vendor, VirtualizationVendor::KVM);
  EXPECT_EQ(ENV.containerization.type, ContainerType::KUBERNETES);
  EXPECT_STREQ(source.name(), "linux");

  const std::string TEXT = ENV.toString();
  EXPECT_NE(TEXT.find("Ubuntu 24.04 (linux)"), std::string::npos);
  EXPECT_NE(TEXT.find("Kernel:         6.8.0-45-generic"), std::string::npos);
  EXPECT_NE(TEXT.find("Container:      kubernetes"), std::string::npos);
}

/** @test Marker files are checked through exists(). */
TEST_F(LinuxEnvironmentSourceTest, DockerEnvMarker) {
  reader_->setFile(DOCKERENV_PATH, "");
  LinuxEnvironmentSource source(reader_);
  const auto RES = source.read();
  ASSERT_TRUE(RES.isSuccess());
  EXPECT_EQ(RES.value().containerization.type, ContainerType::DOCKER);
  EXPECT_EQ(RES.value().containerization.rawIdentifier, "/.dockerenv");
  EXPECT_EQ(reader_->accessCount(CONTAINERENV_PATH), 1U);
}

/** @test /usr/lib/os-release is used when /etc/os-release is missing. */
TEST_F(LinuxEnvironmentSourceTest, OsReleaseFallbackPath) {
  reader_->removeFile(OS_RELEASE_PATH);
  reader_->setFile(OS_RELEASE_FALLBACK_PATH, "NAME=\"Arch Linux\"\n");
  LinuxEnvironmentSource source(reader_);
  const auto RES = source.read();
  ASSERT_TRUE(RES.isSuccess());
  EXPECT_EQ(RES.value().os.name, "Arch Linux");
  EXPECT_EQ(RES.value().os.version, "unknown");
}

/** @test Optional files degrade to uname naming, bare metal and no container. */
TEST_F(LinuxEnvironmentSourceTest, OptionalFilesMissing) {
  reader_->clear();
  reader_->setFile(KERNEL_OSRELEASE_PATH, "6.1.0\n");
  LinuxEnvironmentSource source(reader_);
  const auto RES = source.read();
  ASSERT_TRUE(RES.isSuccess()) << RES.error().toString();
  const EnvironmentSnapshot& ENV = RES.value();

  const auto UNAME = readUname();
  ASSERT_TRUE(UNAME.isSuccess());
  EXPECT_EQ(ENV.os.family, OsFamily::LINUX);
  EXPECT_EQ(ENV.os.name, UNAME.value().sysname);
  EXPECT_EQ(ENV.os.version, "unknown");
  EXPECT_EQ(ENV.kernel.release, "6.1.0");
  EXPECT_EQ(ENV.kernel.version, UNAME.value().version);
  EXPECT_EQ(ENV.virtualization.type, VirtualizationType::BARE_METAL);
  EXPECT_EQ(ENV.containerization.type, ContainerType::NONE);
}

/** @test Without the kernel release the Linux source fails and the chain uses uname. */
TEST_F(LinuxEnvironmentSourceTest, FallsBackToUname) {
  reader_->removeFile(KERNEL_OSRELEASE_PATH);

  LinuxEnvironmentSource direct(reader_);
  const auto DIRECT = direct.read();
  ASSERT_TRUE(DIRECT.isFailure());
  EXPECT_EQ(DIRECT.error().code, ErrorCode::FILE_NOT_FOUND);

  const auto UNAME = readUname();
  ASSERT_TRUE(UNAME.isSuccess());

  auto chain = createEnvironmentSource(reader_);
  const auto RES = chain->read();
  ASSERT_TRUE(RES.isSuccess()) << RES.error().toString();
  EXPECT_EQ(RES.value().kernel.release, UNAME.value().release);
  EXPECT_EQ(RES.value().os.name, UNAME.value().sysname);
  EXPECT_EQ(RES.value().containerization.type, ContainerType::NONE);
}

/** @test The uname source fills identity fields and nothing else. */
TEST(UnameEnvironmentSourceTest, IdentityOnly) {
  UnameEnvironmentSource source;
  const auto RES = source.read();
  ASSERT_TRUE(RES.isSuccess());
  EXPECT_EQ(RES.value().os.family, OsFamily::LINUX);
  EXPECT_FALSE(RES.value().kernel.release.empty());
  EXPECT_FALSE(RES.value().virtualization.isVirtualMachine());
  EXPECT_STREQ(source.name(), "uname");
}

/* ----------------------------- Live ----------------------------- */

/** @test The host environment resolves through the default allow-list. */
TEST(EnvironmentLiveTest, HostInvariants) {
  auto source = createEnvironmentSource(std::make_shared<FileReader>());
  const auto RES = source->read();
  ASSERT_TRUE(RES.isSuccess()) << RES.error().toString();
  EXPECT_EQ(RES.value().os.family, OsFamily::LINUX);
  EXPECT_FALSE(RES.value().os.name.empty());
  EXPECT_FALSE(RES.value().kernel.release.empty());
  EXPECT_FALSE(RES.value().toString().empty());
}
