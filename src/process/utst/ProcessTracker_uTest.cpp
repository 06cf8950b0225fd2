/**
 * @file ProcessTracker_uTest.cpp
 * @brief Unit tests for headroom::process::ProcessTracker.
 *
 * Notes:
 *  - A scripted source hands out snapshots in order so statistics are exact.
 */

#include "src/process/inc/ProcessTracker.hpp"
#include "src/process/inc/ProcessSource.hpp"
#include "src/support/inc/FileReader.hpp"

#include <gtest/gtest.h>

#include <unistd.h> // getpid

#include <cstdint>
#include <deque>
#include <memory>

using headroom::ErrorCode;
using headroom::Result;
using headroom::process::createProcessSource;
using headroom::process::IProcessSource;
using headroom::process::ProcessGroupSnapshot;
using headroom::process::ProcessSnapshot;
using headroom::process::ProcessTracker;
using headroom::support::FileReader;

namespace {

constexpr std::uint64_t NS = 1'000'000'000ULL;

/// Source returning one scripted snapshot per call, each one second later.
class ScriptedSource final : public IProcessSource {
public:
  [[nodiscard]] Result<ProcessSnapshot> read(pid_t pid) override {
    ++reads;
    if (failNext) {
      failNext = false;
      return Result<ProcessSnapshot>::failure(ErrorCode::FILE_NOT_FOUND, "gone");
    }
    ProcessSnapshot s{};
    s.pid = pid;
    s.resources.cpuTimes.user = ticks_;
    s.resources.memoryRssBytes = rss_.empty() ? 0 : rss_.front();
    if (!rss_.empty()) {
      rss_.pop_front();
    }
    s.resources.threadCount = 1;
    s.timestampNs = nowNs_;
    ticks_ += 50;
    nowNs_ += NS;
    return Result<ProcessSnapshot>::success(s);
  }

  [[nodiscard]] Result<ProcessGroupSnapshot> readProcessGroup(pid_t rootPid) override {
    ++groupReads;
    auto root = read(rootPid);
    if (root.isFailure()) {
      return Result<ProcessGroupSnapshot>::failure(root.error());
    }
    ProcessGroupSnapshot g{};
    g.rootPid = rootPid;
    g.root = root.value();
    g.timestampNs = g.root.timestampNs;
    ProcessSnapshot child = g.root;
    child.pid = rootPid + 1;
    g.children.push_back(child);
    return Result<ProcessGroupSnapshot>::success(g);
  }

  [[nodiscard]] const char* name() const noexcept override { return "scripted"; }

  void queueRss(std::uint64_t rss) { rss_.push_back(rss); }

  int reads{0};
  int groupReads{0};
  bool failNext{false};

private:
  std::uint64_t ticks_{0};
  std::uint64_t nowNs_{NS};
  std::deque<std::uint64_t> rss_;
};

} // namespace

class ProcessTrackerTest : public ::testing::Test {
protected:
  std::shared_ptr<ScriptedSource> source_ = std::make_shared<ScriptedSource>();
};

/* ----------------------------- State Machine ----------------------------- */

/** @test sample, stop and getDelta require a started tracker. */
TEST_F(ProcessTrackerTest, RequiresStart) {
  ProcessTracker tracker(source_, 10);
  EXPECT_FALSE(tracker.isTracking());

  const auto SAMPLE = tracker.sample();
  ASSERT_TRUE(SAMPLE.isFailure());
  EXPECT_EQ(SAMPLE.error().code, ErrorCode::INVALID_STATE);
  EXPECT_EQ(SAMPLE.error().message, "Tracker has not been started");

  EXPECT_EQ(tracker.stop().error().code, ErrorCode::INVALID_STATE);
  EXPECT_EQ(tracker.getDelta().error().code, ErrorCode::INVALID_STATE);
  EXPECT_EQ(source_->reads, 0);
}

/** @test A second start is rejected without capturing. */
TEST_F(ProcessTrackerTest, DoubleStart) {
  ProcessTracker tracker(source_, 10);
  ASSERT_TRUE(tracker.start().isSuccess());
  const auto AGAIN = tracker.start();
  ASSERT_TRUE(AGAIN.isFailure());
  EXPECT_EQ(AGAIN.error().message, "Tracker is already started");
  EXPECT_EQ(source_->reads, 1);
}

/** @test A failed start leaves the tracker idle. */
TEST_F(ProcessTrackerTest, FailedStart) {
  ProcessTracker tracker(source_, 10);
  source_->failNext = true;
  const auto RES = tracker.start();
  ASSERT_TRUE(RES.isFailure());
  EXPECT_EQ(RES.error().code, ErrorCode::FILE_NOT_FOUND);
  EXPECT_FALSE(tracker.isTracking());
}

/** @test stop computes statistics over every capture and resets to idle. */
TEST_F(ProcessTrackerTest, FullSession) {
  source_->queueRss(1000);
  source_->queueRss(5000);
  source_->queueRss(3000);
  source_->queueRss(3000);

  ProcessTracker tracker(source_, 10);
  ASSERT_TRUE(tracker.start().isSuccess());
  ASSERT_TRUE(tracker.sample().isSuccess());
  ASSERT_TRUE(tracker.sample().isSuccess());
  EXPECT_EQ(tracker.sampleCount(), 2U);

  const auto STATS = tracker.stop();
  ASSERT_TRUE(STATS.isSuccess());
  EXPECT_EQ(STATS.value().pid, 10);
  EXPECT_EQ(STATS.value().sampleCount, 4U);
  EXPECT_DOUBLE_EQ(STATS.value().totalDurationSeconds, 3.0);
  EXPECT_EQ(STATS.value().peak.memoryRssBytes, 5000U);
  EXPECT_EQ(STATS.value().average.memoryRssBytes, 3000U);
  EXPECT_EQ(STATS.value().current.memoryRssBytes, 3000U);
  // 150 ticks over 3 s.
  EXPECT_DOUBLE_EQ(STATS.value().delta.cpuUsagePercentage(), 50.0);

  EXPECT_FALSE(tracker.isTracking());
  EXPECT_EQ(tracker.sampleCount(), 0U);
  EXPECT_TRUE(tracker.start().isSuccess());
}

/** @test A failed final capture keeps the session open. */
TEST_F(ProcessTrackerTest, FailedStopKeepsSession) {
  ProcessTracker tracker(source_, 10);
  ASSERT_TRUE(tracker.start().isSuccess());
  source_->failNext = true;
  EXPECT_TRUE(tracker.stop().isFailure());
  EXPECT_TRUE(tracker.isTracking());
  EXPECT_TRUE(tracker.stop().isSuccess());
}

/** @test getDelta peeks without recording a sample. */
TEST_F(ProcessTrackerTest, GetDelta) {
  ProcessTracker tracker(source_, 10);
  ASSERT_TRUE(tracker.start().isSuccess());
  const auto D = tracker.getDelta();
  ASSERT_TRUE(D.isSuccess());
  EXPECT_EQ(D.value().pid, 10);
  EXPECT_EQ(D.value().cpuDelta.user, 50U);
  EXPECT_DOUBLE_EQ(D.value().durationSeconds, 1.0);
  EXPECT_EQ(tracker.sampleCount(), 0U);
  EXPECT_TRUE(tracker.isTracking());
}

/** @test With children every capture reads and folds the group. */
TEST_F(ProcessTrackerTest, IncludeChildren) {
  ProcessTracker tracker(source_, 10, true);
  EXPECT_TRUE(tracker.includesChildren());
  ASSERT_TRUE(tracker.start().isSuccess());
  const auto STATS = tracker.stop();
  ASSERT_TRUE(STATS.isSuccess());
  EXPECT_EQ(source_->groupReads, 2);
  EXPECT_EQ(STATS.value().processCount, 2U);
  EXPECT_EQ(STATS.value().current.threadCount, 2U);
  EXPECT_EQ(STATS.value().pid, 10);
}

/** @test Independent trackers on one source do not share state. */
TEST_F(ProcessTrackerTest, IndependentTrackers) {
  ProcessTracker first(source_, 10);
  ProcessTracker second(source_, 20);
  ASSERT_TRUE(first.start().isSuccess());
  EXPECT_FALSE(second.isTracking());
  ASSERT_TRUE(second.start().isSuccess());
  EXPECT_TRUE(first.stop().isSuccess());
  EXPECT_TRUE(second.isTracking());
}

/* ----------------------------- Live ----------------------------- */

/** @test Tracking the test process itself yields a consistent session. */
TEST(ProcessTrackerLiveTest, TracksSelf) {
  std::shared_ptr<IProcessSource> source = createProcessSource(std::make_shared<FileReader>());
  ProcessTracker tracker(source, ::getpid());
  ASSERT_TRUE(tracker.start().isSuccess());

  volatile std::uint64_t sink = 0;
  for (std::uint64_t i = 0; i < 1'000'000; ++i) {
    sink = sink + i;
  }
  ASSERT_TRUE(tracker.sample().isSuccess());

  const auto STATS = tracker.stop();
  ASSERT_TRUE(STATS.isSuccess()) << STATS.error().toString();
  EXPECT_EQ(STATS.value().sampleCount, 3U);
  EXPECT_GE(STATS.value().peak.memoryRssBytes, STATS.value().average.memoryRssBytes);
  EXPECT_GE(STATS.value().delta.cpuUsagePercentage(), 0.0);
}
