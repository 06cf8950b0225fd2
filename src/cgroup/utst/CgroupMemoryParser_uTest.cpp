/**
 * @file CgroupMemoryParser_uTest.cpp
 * @brief Unit tests for cgroup memory limit, usage and OOM parsing.
 */

#include "src/cgroup/inc/CgroupMemoryParser.hpp"
#include "src/cgroup/inc/CgroupPathResolver.hpp"
#include "src/cgroup/inc/CgroupVersionDetector.hpp"
#include "src/support/inc/InMemoryFileReader.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>

using headroom::cgroup::CgroupV1MemoryParser;
using headroom::cgroup::CgroupV1PathResolver;
using headroom::cgroup::CgroupV2MemoryParser;
using headroom::cgroup::CgroupV2PathResolver;
using headroom::cgroup::parseMemoryUsage;
using headroom::cgroup::parseV1MemoryLimit;
using headroom::cgroup::parseV2MemoryLimit;
using headroom::cgroup::PROC_SELF_CGROUP_PATH;
using headroom::support::InMemoryFileReader;

/* ----------------------------- Value Parsing ----------------------------- */

/** @test The v1 page-rounded LONG_MAX sentinel means unlimited. */
TEST(CgroupMemoryValueTest, V1Sentinel) {
  EXPECT_FALSE(parseV1MemoryLimit("9223372036854771712\n").has_value());
  EXPECT_FALSE(parseV1MemoryLimit("0").has_value());
  EXPECT_FALSE(parseV1MemoryLimit("lots").has_value());
  EXPECT_EQ(parseV1MemoryLimit("536870912\n"), 536870912);
}

/** @test v2 "max" means unlimited. */
TEST(CgroupMemoryValueTest, V2Max) {
  EXPECT_FALSE(parseV2MemoryLimit("max\n").has_value());
  EXPECT_EQ(parseV2MemoryLimit("1073741824\n"), 1073741824);
  EXPECT_FALSE(parseV2MemoryLimit("-5").has_value());
}

/** @test Usage is floored at zero. */
TEST(CgroupMemoryValueTest, UsageFloor) {
  EXPECT_EQ(parseMemoryUsage("-10"), 0);
  EXPECT_EQ(parseMemoryUsage("4096\n"), 4096);
  EXPECT_FALSE(parseMemoryUsage("").has_value());
}

/* ----------------------------- Parsers ----------------------------- */

/** @test v2 limit, usage and oom_kill from the unified cgroup. */
TEST(CgroupMemoryParserTest, V2Files) {
  auto reader = std::make_shared<InMemoryFileReader>();
  reader->setFile(PROC_SELF_CGROUP_PATH, "0::/svc\n");
  reader->setFile("/sys/fs/cgroup/svc/memory.max", "268435456\n");
  reader->setFile("/sys/fs/cgroup/svc/memory.current", "134217728\n");
  reader->setFile("/sys/fs/cgroup/svc/memory.events",
                  "low 0\nhigh 0\nmax 4\noom 1\noom_kill 1\n");

  CgroupV2MemoryParser parser(reader, std::make_shared<CgroupV2PathResolver>(reader));
  EXPECT_EQ(parser.parseLimit(), 268435456);
  EXPECT_EQ(parser.parseUsage(), 134217728);
  EXPECT_EQ(parser.parseOomKills(), 1U);
}

/** @test v1 unlimited limit, usage and under_oom. */
TEST(CgroupMemoryParserTest, V1Files) {
  auto reader = std::make_shared<InMemoryFileReader>();
  reader->setFile(PROC_SELF_CGROUP_PATH, "9:memory:/\n");
  reader->setFile("/sys/fs/cgroup/memory/memory.limit_in_bytes", "9223372036854771712\n");
  reader->setFile("/sys/fs/cgroup/memory/memory.usage_in_bytes", "1048576\n");
  reader->setFile("/sys/fs/cgroup/memory/memory.oom_control",
                  "oom_kill_disable 0\nunder_oom 0\n");

  CgroupV1MemoryParser parser(reader, std::make_shared<CgroupV1PathResolver>(reader));
  EXPECT_FALSE(parser.parseLimit().has_value());
  EXPECT_EQ(parser.parseUsage(), 1048576);
  EXPECT_EQ(parser.parseOomKills(), 0U);
}
