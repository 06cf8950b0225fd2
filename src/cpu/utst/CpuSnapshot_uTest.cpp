/**
 * @file CpuSnapshot_uTest.cpp
 * @brief Unit tests for headroom::cpu snapshot parsing and delta math.
 *
 * Notes:
 *  - Parser tests use captured /proc/stat text.
 *  - Live tests assert invariants only (values depend on the host).
 */

#include "src/cpu/inc/CpuSnapshot.hpp"
#include "src/cpu/inc/CpuSource.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/support/inc/FileReader.hpp"
#include "src/support/inc/InMemoryFileReader.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

using headroom::ErrorCode;
using headroom::cpu::CpuCoreTimes;
using headroom::cpu::CpuDelta;
using headroom::cpu::CpuSnapshot;
using headroom::cpu::CpuTimes;
using headroom::cpu::createCpuSource;
using headroom::cpu::measureCpuUsage;
using headroom::cpu::MIN_MEASURE_INTERVAL_SEC;
using headroom::cpu::MinimalCpuSource;
using headroom::cpu::onlineCpuCount;
using headroom::cpu::parseProcStat;
using headroom::cpu::PROC_STAT_PATH;
using headroom::cpu::ProcStatCpuSource;
using headroom::helpers::clock::NS_PER_SECOND;
using headroom::support::FileReader;
using headroom::support::InMemoryFileReader;

namespace {

constexpr const char* PROC_STAT_SAMPLE = "cpu  400 0 100 1500 0 0 0 0 0 0\n"
                                         "cpu0 200 0 50 750 0 0 0 0 0 0\n"
                                         "cpu1 200 0 50 750 0 0 0 0 0 0\n"
                                         "intr 123456 0 0\n"
                                         "ctxt 98765\n"
                                         "btime 1700000000\n";

CpuSnapshot makeSnapshot(std::uint64_t ts, CpuTimes total, std::vector<CpuTimes> cores) {
  CpuSnapshot snap{};
  snap.timestampNs = ts;
  snap.total = total;
  for (std::size_t i = 0; i < cores.size(); ++i) {
    snap.perCore.push_back(CpuCoreTimes{i, cores[i]});
  }
  return snap;
}

CpuTimes ticks(std::uint64_t user, std::uint64_t system, std::uint64_t idle) {
  CpuTimes t{};
  t.user = user;
  t.system = system;
  t.idle = idle;
  return t;
}

} // namespace

/* ----------------------------- Parsing ----------------------------- */

/** @test Aggregate and per-core lines are parsed; other lines ignored. */
TEST(ProcStatParseTest, ParsesAggregateAndCores) {
  const auto RES = parseProcStat(PROC_STAT_SAMPLE, 42);
  ASSERT_TRUE(RES.isSuccess()) << RES.error().toString();
  const CpuSnapshot& SNAP = RES.value();
  EXPECT_EQ(SNAP.timestampNs, 42U);
  EXPECT_EQ(SNAP.total.user, 400U);
  EXPECT_EQ(SNAP.total.idle, 1500U);
  EXPECT_EQ(SNAP.total.total(), 2000U);
  EXPECT_EQ(SNAP.total.busy(), 500U);
  ASSERT_EQ(SNAP.coreCount(), 2U);
  EXPECT_EQ(SNAP.perCore[1].coreIndex, 1U);
  EXPECT_EQ(SNAP.perCore[1].times.system, 50U);
}

/** @test A cpu line with fewer than eight counters is rejected. */
TEST(ProcStatParseTest, ShortLineFails) {
  const auto RES = parseProcStat("cpu 1 2 3\n", 0);
  ASSERT_TRUE(RES.isFailure());
  EXPECT_EQ(RES.error().code, ErrorCode::PARSE_FAILURE);
  EXPECT_EQ(RES.error().message, "Invalid CPU line format: cpu 1 2 3");
}

/** @test Content without the aggregate line is rejected. */
TEST(ProcStatParseTest, MissingTotalFails) {
  const auto RES = parseProcStat("cpu0 1 2 3 4 5 6 7 8\nctxt 1\n", 0);
  ASSERT_TRUE(RES.isFailure());
  EXPECT_EQ(RES.error().message, "No total CPU line found");
}

/* ----------------------------- Delta ----------------------------- */

/** @test One busy core out of four is 25% overall and 6.25 per core. */
TEST(CpuDeltaTest, UsageAndPerCore) {
  const CpuSnapshot BEFORE =
      makeSnapshot(0, ticks(0, 0, 0), {ticks(0, 0, 0), ticks(0, 0, 0), ticks(0, 0, 0),
                                       ticks(0, 0, 0)});
  const CpuSnapshot AFTER = makeSnapshot(
      NS_PER_SECOND, ticks(150, 50, 600),
      {ticks(150, 50, 0), ticks(0, 0, 200), ticks(0, 0, 200), ticks(0, 0, 200)});

  const CpuDelta DELTA = CpuSnapshot::calculateDelta(BEFORE, AFTER);
  EXPECT_DOUBLE_EQ(DELTA.durationSeconds, 1.0);
  EXPECT_DOUBLE_EQ(DELTA.usagePercentage(), 25.0);
  EXPECT_DOUBLE_EQ(DELTA.usagePercentagePerCore(), 6.25);
  EXPECT_DOUBLE_EQ(DELTA.userPercentage(), 18.75);
  EXPECT_DOUBLE_EQ(DELTA.idlePercentage(), 75.0);
  EXPECT_DOUBLE_EQ(DELTA.coreUsagePercentage(0).value(), 100.0);
  EXPECT_DOUBLE_EQ(DELTA.coreUsagePercentage(1).value(), 0.0);
  EXPECT_FALSE(DELTA.coreUsagePercentage(9).has_value());
  ASSERT_NE(DELTA.busiestCore(), nullptr);
  EXPECT_EQ(DELTA.busiestCore()->coreIndex, 0U);
}

/** @test 50% usage on a 4-core machine reports 12.5 per core. */
TEST(CpuDeltaTest, PerCoreNormalization) {
  const CpuSnapshot BEFORE = makeSnapshot(0, ticks(0, 0, 0), {{}, {}, {}, {}});
  const CpuSnapshot AFTER = makeSnapshot(NS_PER_SECOND, ticks(200, 0, 200), {{}, {}, {}, {}});
  const CpuDelta DELTA = CpuSnapshot::calculateDelta(BEFORE, AFTER);
  EXPECT_DOUBLE_EQ(DELTA.usagePercentage(), 50.0);
  EXPECT_DOUBLE_EQ(DELTA.usagePercentagePerCore(), 12.5);
}

/** @test busy 50 of 200 ticks over one second on two cores is 12.5 per core. */
TEST(CpuDeltaTest, TwoCoreExample) {
  CpuTimes before{};
  before.user = 40;
  before.idle = 150;
  before.system = 10;
  CpuTimes after = before;
  after.user += 50;
  after.idle += 150;
  const CpuDelta DELTA = CpuSnapshot::calculateDelta(
      makeSnapshot(0, before, {{}, {}}), makeSnapshot(NS_PER_SECOND, after, {{}, {}}));
  EXPECT_EQ(DELTA.totalDelta.total(), 200U);
  EXPECT_EQ(DELTA.totalDelta.busy(), 50U);
  EXPECT_DOUBLE_EQ(DELTA.usagePercentage(), 25.0);
  EXPECT_DOUBLE_EQ(DELTA.usagePercentagePerCore(), 12.5);
}

/** @test Counters that go backwards produce zero deltas, never negatives. */
TEST(CpuDeltaTest, ClampsCounterResets) {
  const CpuSnapshot BEFORE = makeSnapshot(0, ticks(500, 500, 500), {ticks(500, 500, 500)});
  const CpuSnapshot AFTER = makeSnapshot(NS_PER_SECOND, ticks(100, 600, 400), {ticks(10, 10, 10)});
  const CpuDelta DELTA = CpuSnapshot::calculateDelta(BEFORE, AFTER);
  EXPECT_EQ(DELTA.totalDelta.user, 0U);
  EXPECT_EQ(DELTA.totalDelta.system, 100U);
  EXPECT_EQ(DELTA.totalDelta.idle, 0U);
  EXPECT_EQ(DELTA.perCoreDelta.at(0).delta.total(), 0U);
  EXPECT_GE(DELTA.usagePercentage(), 0.0);
  EXPECT_LE(DELTA.usagePercentage(), 100.0);
}

/** @test A zero-length interval reports zero usage. */
TEST(CpuDeltaTest, ZeroDuration) {
  const CpuSnapshot BEFORE = makeSnapshot(5, ticks(0, 0, 0), {});
  const CpuSnapshot AFTER = makeSnapshot(5, ticks(100, 0, 0), {});
  const CpuDelta DELTA = CpuSnapshot::calculateDelta(BEFORE, AFTER);
  EXPECT_DOUBLE_EQ(DELTA.durationSeconds, 0.0);
  EXPECT_DOUBLE_EQ(DELTA.usagePercentage(), 0.0);
  EXPECT_DOUBLE_EQ(DELTA.usagePercentagePerCore(), 0.0);
  EXPECT_EQ(DELTA.busiestCore(), nullptr);
}

/** @test A delta without per-core entries reports zero usage. */
TEST(CpuDeltaTest, NoCoresReportsZero) {
  const CpuSnapshot BEFORE = makeSnapshot(0, ticks(0, 0, 0), {});
  const CpuSnapshot AFTER = makeSnapshot(NS_PER_SECOND, ticks(60, 0, 40), {});
  const CpuDelta DELTA = CpuSnapshot::calculateDelta(BEFORE, AFTER);
  EXPECT_DOUBLE_EQ(DELTA.durationSeconds, 1.0);
  EXPECT_EQ(DELTA.coreCount(), 0U);
  EXPECT_DOUBLE_EQ(DELTA.usagePercentage(), 0.0);
  EXPECT_DOUBLE_EQ(DELTA.usagePercentagePerCore(), 0.0);
}

/** @test Cores missing from the later snapshot are dropped. */
TEST(CpuDeltaTest, DropsVanishedCores) {
  const CpuSnapshot BEFORE = makeSnapshot(0, {}, {ticks(1, 1, 1), ticks(1, 1, 1)});
  const CpuSnapshot AFTER = makeSnapshot(NS_PER_SECOND, {}, {ticks(2, 2, 2)});
  EXPECT_EQ(CpuSnapshot::calculateDelta(BEFORE, AFTER).coreCount(), 1U);
}

/* ----------------------------- Snapshot Queries ----------------------------- */

/** @test Busy/idle core queries use the since-boot share. */
TEST(CpuSnapshotTest, CoreQueries) {
  const CpuSnapshot SNAP = makeSnapshot(0, {}, {ticks(90, 0, 10), ticks(10, 0, 90)});
  EXPECT_EQ(SNAP.findBusyCores(50.0).size(), 1U);
  EXPECT_EQ(SNAP.findIdleCores(50.0).size(), 1U);
  EXPECT_EQ(SNAP.busiestCore()->coreIndex, 0U);
  EXPECT_EQ(SNAP.idlestCore()->coreIndex, 1U);
  EXPECT_EQ(SNAP.findCore(7), nullptr);
}

/* ----------------------------- Sources ----------------------------- */

/** @test ProcStatCpuSource stamps snapshots with the injected clock. */
TEST(CpuSourceTest, ProcStatSourceUsesClock) {
  auto reader = std::make_shared<InMemoryFileReader>();
  reader->setFile(PROC_STAT_PATH, PROC_STAT_SAMPLE);
  ProcStatCpuSource source(reader, [] { return std::uint64_t{777}; });
  const auto RES = source.read();
  ASSERT_TRUE(RES.isSuccess());
  EXPECT_EQ(RES.value().timestampNs, 777U);
  EXPECT_STREQ(source.name(), "proc-stat");
}

/** @test Without /proc/stat the chain falls through to the minimal source. */
TEST(CpuSourceTest, FallsBackToMinimal) {
  auto source = createCpuSource(std::make_shared<InMemoryFileReader>());
  const auto RES = source->read();
  ASSERT_TRUE(RES.isSuccess());
  EXPECT_EQ(RES.value().coreCount(), onlineCpuCount());
  EXPECT_EQ(RES.value().total.total(), 0U);
}

/** @test The minimal source's deltas are 0%. */
TEST(CpuSourceTest, MinimalDeltaIsZero) {
  MinimalCpuSource source;
  const auto RES = measureCpuUsage(source, 0.0);
  ASSERT_TRUE(RES.isSuccess());
  EXPECT_DOUBLE_EQ(RES.value().usagePercentage(), 0.0);
}

/** @test A non-finite interval is clamped to the minimum instead of skipping the sleep. */
TEST(CpuSourceTest, NonFiniteIntervalUsesMinimum) {
  MinimalCpuSource source;
  const auto NAN_RES = measureCpuUsage(source, std::nan(""));
  ASSERT_TRUE(NAN_RES.isSuccess());
  EXPECT_GE(NAN_RES.value().durationSeconds, MIN_MEASURE_INTERVAL_SEC);
  EXPECT_LT(NAN_RES.value().durationSeconds, 5.0);

  const auto INF_RES = measureCpuUsage(source, std::numeric_limits<double>::infinity());
  ASSERT_TRUE(INF_RES.isSuccess());
  EXPECT_GE(INF_RES.value().durationSeconds, MIN_MEASURE_INTERVAL_SEC);
  EXPECT_LT(INF_RES.value().durationSeconds, 5.0);
}

/** @test Live measurement stays within [0, 100]. */
TEST(CpuSourceTest, LiveMeasurementInRange) {
  auto source = createCpuSource(std::make_shared<FileReader>());
  const auto RES = measureCpuUsage(*source, 0.1);
  ASSERT_TRUE(RES.isSuccess()) << RES.error().toString();
  const CpuDelta& DELTA = RES.value();
  EXPECT_GT(DELTA.durationSeconds, 0.0);
  EXPECT_GE(DELTA.usagePercentage(), 0.0);
  EXPECT_LE(DELTA.usagePercentage(), 100.0);
  EXPECT_GE(DELTA.coreCount(), 1U);
}
