/**
 * @file FallbackSource_uTest.cpp
 * @brief Unit tests for headroom::source::FallbackSource.
 */

#include "src/source/inc/FallbackSource.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using headroom::ErrorCode;
using headroom::Result;
using headroom::source::FallbackSource;
using headroom::source::Source;

namespace {

/// Source returning a fixed result and counting reads.
class StubSource final : public Source<int> {
public:
  StubSource(const char* name, Result<int> result, int* reads)
      : name_(name), result_(std::move(result)), reads_(reads) {}

  Result<int> read() override {
    ++*reads_;
    return result_;
  }

  const char* name() const noexcept override { return name_; }

private:
  const char* name_;
  Result<int> result_;
  int* reads_;
};

std::unique_ptr<Source<int>> ok(const char* name, int value, int* reads) {
  return std::make_unique<StubSource>(name, Result<int>::success(value), reads);
}

std::unique_ptr<Source<int>> fail(const char* name, ErrorCode code, std::string msg, int* reads) {
  return std::make_unique<StubSource>(name, Result<int>::failure(code, std::move(msg)), reads);
}

} // namespace

class FallbackSourceTest : public ::testing::Test {
protected:
  int readsA_{0};
  int readsB_{0};
  int readsC_{0};
};

/* ----------------------------- Ordering ----------------------------- */

/** @test The first successful candidate wins and later ones are not tried. */
TEST_F(FallbackSourceTest, FirstSuccessWins) {
  std::vector<std::unique_ptr<Source<int>>> chain;
  chain.push_back(fail("a", ErrorCode::FILE_NOT_FOUND, "missing", &readsA_));
  chain.push_back(ok("b", 7, &readsB_));
  chain.push_back(ok("c", 9, &readsC_));
  FallbackSource<int> src("test", std::move(chain));

  const auto RES = src.read();
  ASSERT_TRUE(RES.isSuccess());
  EXPECT_EQ(RES.value(), 7);
  EXPECT_EQ(readsA_, 1);
  EXPECT_EQ(readsB_, 1);
  EXPECT_EQ(readsC_, 0);
}

/** @test Null entries are dropped at construction. */
TEST_F(FallbackSourceTest, DropsNullCandidates) {
  std::vector<std::unique_ptr<Source<int>>> chain;
  chain.push_back(nullptr);
  chain.push_back(ok("a", 1, &readsA_));
  FallbackSource<int> src("test", std::move(chain));
  EXPECT_EQ(src.size(), 1U);
  EXPECT_EQ(src.family(), "test");
  EXPECT_EQ(src.read().value(), 1);
}

/* ----------------------------- Aggregated Failure ----------------------------- */

/** @test When every candidate fails the message lists each one. */
TEST_F(FallbackSourceTest, AggregatedMessage) {
  std::vector<std::unique_ptr<Source<int>>> chain;
  chain.push_back(fail("proc-stat", ErrorCode::FILE_NOT_FOUND, "no /proc", &readsA_));
  chain.push_back(fail("minimal", ErrorCode::FILE_NOT_FOUND, "no sysconf", &readsB_));
  FallbackSource<int> src("cpu", std::move(chain));

  const auto RES = src.read();
  ASSERT_TRUE(RES.isFailure());
  EXPECT_EQ(RES.error().code, ErrorCode::FILE_NOT_FOUND);
  EXPECT_EQ(RES.error().message,
            "All cpu sources failed: Source 0 (proc-stat): no /proc; "
            "Source 1 (minimal): no sysconf");
}

/** @test Disagreeing codes collapse to SYSTEM_ERROR. */
TEST_F(FallbackSourceTest, MixedCodesBecomeSystemError) {
  std::vector<std::unique_ptr<Source<int>>> chain;
  chain.push_back(fail("a", ErrorCode::FILE_NOT_FOUND, "x", &readsA_));
  chain.push_back(fail("b", ErrorCode::PARSE_FAILURE, "y", &readsB_));
  FallbackSource<int> src("memory", std::move(chain));

  const auto RES = src.read();
  ASSERT_TRUE(RES.isFailure());
  EXPECT_EQ(RES.error().code, ErrorCode::SYSTEM_ERROR);
}

/** @test An empty chain is UNSUPPORTED_PLATFORM. */
TEST_F(FallbackSourceTest, EmptyChain) {
  FallbackSource<int> src("gpu", {});
  const auto RES = src.read();
  ASSERT_TRUE(RES.isFailure());
  EXPECT_EQ(RES.error().code, ErrorCode::UNSUPPORTED_PLATFORM);
  EXPECT_EQ(RES.error().message, "No gpu sources available");
}
