/**
 * @file CgroupParser_uTest.cpp
 * @brief Unit tests for the cgroup coordinator and container sources.
 *
 * Notes:
 *  - Fixtures mirror real v1 (Docker) and v2 (systemd/Kubernetes) layouts.
 *  - One live test only asserts invariants of the host's own hierarchy.
 */

#include "src/cgroup/inc/CgroupParser.hpp"
#include "src/cgroup/inc/ContainerLimits.hpp"
#include "src/cgroup/inc/ContainerSource.hpp"
#include "src/cgroup/inc/CgroupVersionDetector.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/support/inc/FileReader.hpp"
#include "src/support/inc/InMemoryFileReader.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>

using headroom::cgroup::CGROUP_V2_CONTROLLERS_PATH;
using headroom::cgroup::CgroupContainerSource;
using headroom::cgroup::CgroupParser;
using headroom::cgroup::CgroupVersion;
using headroom::cgroup::ContainerLimits;
using headroom::cgroup::countCpuinfoProcessors;
using headroom::cgroup::createContainerSource;
using headroom::cgroup::NoContainerSource;
using headroom::cgroup::PROC_CPUINFO_PATH;
using headroom::cgroup::PROC_SELF_CGROUP_PATH;
using headroom::helpers::clock::NS_PER_SECOND;
using headroom::support::FileReader;
using headroom::support::InMemoryFileReader;

class CgroupParserTest : public ::testing::Test {
protected:
  std::shared_ptr<InMemoryFileReader> reader_ = std::make_shared<InMemoryFileReader>();
  std::uint64_t nowNs_{0};

  headroom::helpers::clock::MonotonicClock clock() {
    return [this] { return nowNs_; };
  }

  void installV2() {
    reader_->setFile(CGROUP_V2_CONTROLLERS_PATH, "cpu memory\n");
    reader_->setFile(PROC_SELF_CGROUP_PATH, "0::/ctr\n");
    reader_->setFile("/sys/fs/cgroup/ctr/cpu.max", "200000 100000\n");
    reader_->setFile("/sys/fs/cgroup/ctr/cpu.stat", "usage_usec 0\nnr_throttled 7\n");
    reader_->setFile("/sys/fs/cgroup/ctr/memory.max", "1073741824\n");
    reader_->setFile("/sys/fs/cgroup/ctr/memory.current", "268435456\n");
    reader_->setFile("/sys/fs/cgroup/ctr/memory.events", "oom_kill 2\n");
  }

  void installV1() {
    reader_->setFile(PROC_SELF_CGROUP_PATH, "5:memory:/docker/x\n3:cpu,cpuacct:/docker/x\n");
    reader_->setFile("/sys/fs/cgroup/cpu/docker/x/cpu.cfs_quota_us", "50000\n");
    reader_->setFile("/sys/fs/cgroup/cpu/docker/x/cpu.cfs_period_us", "100000\n");
    reader_->setFile("/sys/fs/cgroup/memory/docker/x/memory.limit_in_bytes", "536870912\n");
    reader_->setFile("/sys/fs/cgroup/memory/docker/x/memory.usage_in_bytes", "134217728\n");
  }
};

/* ----------------------------- Coordinator ----------------------------- */

/** @test No hierarchy gives NONE with every field absent. */
TEST_F(CgroupParserTest, NoneHasNoFields) {
  CgroupParser parser(reader_, clock());
  const ContainerLimits LIM = parser.parse(4.0);
  EXPECT_EQ(LIM.cgroupVersion, CgroupVersion::NONE);
  EXPECT_FALSE(LIM.cpuQuotaCores.has_value());
  EXPECT_FALSE(LIM.cpuUsageCores.has_value());
  EXPECT_FALSE(LIM.cpuThrottledCount.has_value());
  EXPECT_FALSE(LIM.memoryLimitBytes.has_value());
  EXPECT_FALSE(LIM.memoryUsageBytes.has_value());
  EXPECT_FALSE(LIM.oomKillCount.has_value());
}

/** @test A v2 hierarchy fills every field; usage appears on the second parse. */
TEST_F(CgroupParserTest, V2Limits) {
  installV2();
  CgroupParser parser(reader_, clock());

  const ContainerLimits FIRST = parser.parse(8.0);
  EXPECT_EQ(FIRST.cgroupVersion, CgroupVersion::V2);
  EXPECT_DOUBLE_EQ(FIRST.cpuQuotaCores.value(), 2.0);
  EXPECT_FALSE(FIRST.cpuUsageCores.has_value());
  EXPECT_EQ(FIRST.cpuThrottledCount, 7U);
  EXPECT_EQ(FIRST.memoryLimitBytes, 1073741824);
  EXPECT_EQ(FIRST.memoryUsageBytes, 268435456);
  EXPECT_EQ(FIRST.oomKillCount, 2U);

  nowNs_ += NS_PER_SECOND;
  reader_->setFile("/sys/fs/cgroup/ctr/cpu.stat", "usage_usec 500000\nnr_throttled 7\n");
  const ContainerLimits SECOND = parser.parse(8.0);
  EXPECT_DOUBLE_EQ(SECOND.cpuUsageCores.value(), 0.5);
  EXPECT_DOUBLE_EQ(SECOND.availableCpuCores().value(), 1.5);
  EXPECT_EQ(SECOND.availableMemoryBytes(), 1073741824 - 268435456);
}

/** @test A v1 hierarchy reads quota and memory from the mapped directories. */
TEST_F(CgroupParserTest, V1Limits) {
  installV1();
  CgroupParser parser(reader_, clock());
  const ContainerLimits LIM = parser.parse(4.0);
  EXPECT_EQ(LIM.cgroupVersion, CgroupVersion::V1);
  EXPECT_DOUBLE_EQ(LIM.cpuQuotaCores.value(), 0.5);
  EXPECT_EQ(LIM.memoryLimitBytes, 536870912);
  EXPECT_EQ(LIM.memoryUsageBytes, 134217728);
  EXPECT_FALSE(LIM.cpuUsageCores.has_value());
}

/** @test reset() drops the cached version. */
TEST_F(CgroupParserTest, ResetRedetects) {
  CgroupParser parser(reader_, clock());
  EXPECT_EQ(parser.version(), CgroupVersion::NONE);
  installV2();
  EXPECT_EQ(parser.version(), CgroupVersion::NONE);
  parser.reset();
  EXPECT_EQ(parser.version(), CgroupVersion::V2);
}

/* ----------------------------- Sources ----------------------------- */

/** @test processor lines are counted, with a floor of 1. */
TEST(ContainerSourceTest, CountsCpuinfoProcessors) {
  EXPECT_EQ(countCpuinfoProcessors("processor\t: 0\nmodel name\t: x\n\nprocessor\t: 1\n"), 2U);
  EXPECT_EQ(countCpuinfoProcessors(""), 1U);
}

/** @test The cgroup source clamps the quota to the host core count from /proc/cpuinfo. */
TEST_F(CgroupParserTest, SourceUsesHostCores) {
  installV2();
  reader_->setFile("/sys/fs/cgroup/ctr/cpu.max", "800000 100000\n");
  reader_->setFile(PROC_CPUINFO_PATH, "processor\t: 0\nprocessor\t: 1\n");

  CgroupContainerSource source(reader_, clock());
  EXPECT_DOUBLE_EQ(source.hostCpuCores(), 2.0);
  const auto RES = source.read();
  ASSERT_TRUE(RES.isSuccess());
  EXPECT_DOUBLE_EQ(RES.value().cpuQuotaCores.value(), 2.0);
  EXPECT_STREQ(source.name(), "cgroup");
}

/** @test NoContainerSource always succeeds with NONE. */
TEST(ContainerSourceTest, NoContainer) {
  NoContainerSource source;
  const auto RES = source.read();
  ASSERT_TRUE(RES.isSuccess());
  EXPECT_EQ(RES.value().cgroupVersion, CgroupVersion::NONE);
}

/** @test The live source never fails and reports a concrete version. */
TEST(ContainerSourceTest, LiveHostInvariants) {
  auto source = createContainerSource(std::make_shared<FileReader>());
  const auto RES = source->read();
  ASSERT_TRUE(RES.isSuccess());
  const ContainerLimits& LIM = RES.value();
  EXPECT_NE(LIM.cgroupVersion, CgroupVersion::UNKNOWN);
  if (LIM.cpuQuotaCores) {
    EXPECT_GT(*LIM.cpuQuotaCores, 0.0);
  }
  if (LIM.memoryLimitBytes) {
    EXPECT_GT(*LIM.memoryLimitBytes, 0);
  }
}

/* ----------------------------- ContainerLimits ----------------------------- */

/** @test Derived values need both inputs and are clamped. */
TEST(ContainerLimitsTest, DerivedValues) {
  ContainerLimits lim{};
  EXPECT_FALSE(lim.cpuUtilizationPercentage().has_value());
  EXPECT_FALSE(lim.availableMemoryBytes().has_value());

  lim.cpuQuotaCores = 1.0;
  lim.cpuUsageCores = 1.5;
  lim.memoryLimitBytes = 100;
  lim.memoryUsageBytes = 150;
  lim.cpuThrottledCount = 0U;
  EXPECT_DOUBLE_EQ(lim.cpuUtilizationPercentage().value(), 100.0);
  EXPECT_DOUBLE_EQ(lim.availableCpuCores().value(), 0.0);
  EXPECT_EQ(lim.availableMemoryBytes(), 0);
  EXPECT_DOUBLE_EQ(lim.memoryUtilizationPercentage().value(), 100.0);
  EXPECT_FALSE(lim.isCpuThrottled());
  EXPECT_FALSE(lim.hasOomKills());
  EXPECT_FALSE(lim.toString().empty());
}
