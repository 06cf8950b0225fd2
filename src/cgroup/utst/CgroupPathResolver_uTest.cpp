/**
 * @file CgroupPathResolver_uTest.cpp
 * @brief Unit tests for cgroup membership parsing and control-file resolution.
 */

#include "src/cgroup/inc/CgroupPathResolver.hpp"
#include "src/cgroup/inc/CgroupVersionDetector.hpp"
#include "src/support/inc/InMemoryFileReader.hpp"

#include <gtest/gtest.h>

#include <memory>

using headroom::cgroup::CgroupV1PathResolver;
using headroom::cgroup::CgroupV2PathResolver;
using headroom::cgroup::parseCgroupV1Mappings;
using headroom::cgroup::parseCgroupV2UnifiedPath;
using headroom::cgroup::PROC_SELF_CGROUP_PATH;
using headroom::support::InMemoryFileReader;

namespace {

constexpr const char* V1_MEMBERSHIP = "12:memory:/docker/abc\n"
                                      "4:cpu,cpuacct:/docker/abc\n"
                                      "1:name=systemd:/docker/abc\n"
                                      "0::/\n";

} // namespace

/* ----------------------------- Parsing ----------------------------- */

/** @test Comma-joined controllers each get a mapping; the v2 line is skipped. */
TEST(CgroupMembershipTest, ParsesV1Mappings) {
  const auto MAP = parseCgroupV1Mappings(V1_MEMBERSHIP);
  ASSERT_EQ(MAP.count("cpu"), 1U);
  ASSERT_EQ(MAP.count("cpuacct"), 1U);
  ASSERT_EQ(MAP.count("memory"), 1U);
  EXPECT_EQ(MAP.at("cpu").mount, "cpu");
  EXPECT_EQ(MAP.at("cpuacct").path, "/docker/abc");
  EXPECT_EQ(MAP.size(), 4U); // cpu, cpuacct, memory, name=systemd
}

/** @test The "0::" line gives the unified path. */
TEST(CgroupMembershipTest, ParsesV2UnifiedPath) {
  EXPECT_EQ(parseCgroupV2UnifiedPath("0::/user.slice/app.scope\n"), "/user.slice/app.scope");
  EXPECT_FALSE(parseCgroupV2UnifiedPath("4:memory:/docker/abc\n").has_value());
  EXPECT_FALSE(parseCgroupV2UnifiedPath("").has_value());
}

/* ----------------------------- V1 Resolver ----------------------------- */

class CgroupV1PathResolverTest : public ::testing::Test {
protected:
  std::shared_ptr<InMemoryFileReader> reader_ = std::make_shared<InMemoryFileReader>();

  void SetUp() override { reader_->setFile(PROC_SELF_CGROUP_PATH, V1_MEMBERSHIP); }
};

/** @test The mapped cgroup directory is preferred. */
TEST_F(CgroupV1PathResolverTest, ResolvesMappedPath) {
  reader_->setFile("/sys/fs/cgroup/memory/docker/abc/memory.limit_in_bytes", "1048576\n");
  reader_->setFile("/sys/fs/cgroup/memory/memory.limit_in_bytes", "9223372036854771712\n");
  CgroupV1PathResolver resolver(reader_);
  EXPECT_EQ(resolver.resolvePath("memory", "memory.limit_in_bytes"),
            "/sys/fs/cgroup/memory/docker/abc/memory.limit_in_bytes");
}

/** @test Falls back to the controller root when the mapped path is absent. */
TEST_F(CgroupV1PathResolverTest, FallsBackToControllerRoot) {
  reader_->setFile("/sys/fs/cgroup/cpu/cpu.cfs_quota_us", "50000\n");
  CgroupV1PathResolver resolver(reader_);
  EXPECT_EQ(resolver.resolvePath("cpu", "cpu.cfs_quota_us"),
            "/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
  EXPECT_FALSE(resolver.resolvePath("cpu", "cpu.cfs_period_us").has_value());
}

/** @test Membership is read once until reset(). */
TEST_F(CgroupV1PathResolverTest, CachesMembership) {
  CgroupV1PathResolver resolver(reader_);
  (void)resolver.resolvePath("cpu", "a");
  (void)resolver.resolvePath("memory", "b");
  EXPECT_EQ(reader_->accessCount(PROC_SELF_CGROUP_PATH), 1U);

  resolver.reset();
  (void)resolver.mappings();
  EXPECT_EQ(reader_->accessCount(PROC_SELF_CGROUP_PATH), 2U);
}

/* ----------------------------- V2 Resolver ----------------------------- */

/** @test Control files resolve under the unified path. */
TEST(CgroupV2PathResolverTest, ResolvesUnifiedPath) {
  auto reader = std::make_shared<InMemoryFileReader>();
  reader->setFile(PROC_SELF_CGROUP_PATH, "0::/kubepods/pod1/ctr\n");
  reader->setFile("/sys/fs/cgroup/kubepods/pod1/ctr/memory.max", "max\n");

  CgroupV2PathResolver resolver(reader);
  EXPECT_EQ(resolver.unifiedPath(), "/kubepods/pod1/ctr");
  EXPECT_EQ(resolver.resolvePath("memory.max"), "/sys/fs/cgroup/kubepods/pod1/ctr/memory.max");
  EXPECT_FALSE(resolver.resolvePath("cpu.max").has_value());
}

/** @test A root membership ("0::/") resolves directly under the mount. */
TEST(CgroupV2PathResolverTest, RootMembership) {
  auto reader = std::make_shared<InMemoryFileReader>();
  reader->setFile(PROC_SELF_CGROUP_PATH, "0::/\n");
  reader->setFile("/sys/fs/cgroup/cpu.max", "max 100000\n");

  CgroupV2PathResolver resolver(reader);
  EXPECT_EQ(resolver.resolvePath("cpu.max"), "/sys/fs/cgroup/cpu.max");
}
