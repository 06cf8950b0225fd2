/**
 * @file ProcessRunner_uTest.cpp
 * @brief Unit tests for headroom::support::ProcessRunner.
 *
 * Notes:
 *  - Requires /bin/sh, echo and false, available on every POSIX system.
 */

#include "src/support/inc/ProcessRunner.hpp"

#include <gtest/gtest.h>

#include <unistd.h> // unlink

#include <cstdlib> // mkstemp
#include <string>
#include <vector>

using headroom::ErrorCode;
using headroom::support::Config;
using headroom::support::ProcessRunner;

/* ----------------------------- Allow-list ----------------------------- */

/** @test Allowed commands run and return stdout. */
TEST(ProcessRunnerTest, EchoReturnsOutput) {
  const ProcessRunner RUNNER;
  const auto RES = RUNNER.execute("echo headroom");
  ASSERT_TRUE(RES.isSuccess()) << RES.error().toString();
  EXPECT_EQ(RES.value(), "headroom\n");
}

/** @test executeLines splits output into trimmed lines. */
TEST(ProcessRunnerTest, ExecuteLines) {
  const ProcessRunner RUNNER;
  const auto RES = RUNNER.executeLines("echo one   ");
  ASSERT_TRUE(RES.isSuccess()) << RES.error().toString();
  EXPECT_EQ(RES.value(), (std::vector<std::string>{"one"}));
}

/** @test Shell metacharacters are rejected even after an allowed prefix. */
TEST(ProcessRunnerTest, RejectsMetacharacters) {
  const ProcessRunner RUNNER;
  for (const char* cmd : {"echo hi; rm -rf /tmp/x", "echo $(id)", "echo a | cat", "echo a > b"}) {
    EXPECT_FALSE(RUNNER.isAllowed(cmd)) << cmd;
    const auto RES = RUNNER.execute(cmd);
    ASSERT_TRUE(RES.isFailure());
    EXPECT_EQ(RES.error().code, ErrorCode::ACCESS_DENIED);
  }
}

/** @test Commands outside the allow-list are rejected, prefixes match on word boundaries. */
TEST(ProcessRunnerTest, RejectsUnlistedCommands) {
  const ProcessRunner RUNNER;
  EXPECT_FALSE(RUNNER.isAllowed("ls /"));
  EXPECT_FALSE(RUNNER.isAllowed("dfx"));
  EXPECT_TRUE(RUNNER.isAllowed("df -kP"));
  EXPECT_EQ(RUNNER.execute("ls /").error().code, ErrorCode::ACCESS_DENIED);
}

/* ----------------------------- Exit Classification ----------------------------- */

/** @test Non-zero exit is SYSTEM_ERROR with the exit code. */
TEST(ProcessRunnerTest, NonZeroExit) {
  const ProcessRunner RUNNER;
  const auto RES = RUNNER.execute("false");
  ASSERT_TRUE(RES.isFailure());
  EXPECT_EQ(RES.error().code, ErrorCode::SYSTEM_ERROR);
  EXPECT_EQ(RES.error().message, "Command failed with exit code 1");
}

/** @test Exit 127 maps to COMMAND_NOT_FOUND. */
TEST(ProcessRunnerTest, MissingCommand) {
  Config cfg{};
  cfg.allowedCommandPrefixes = {"headroom-no-such-command"};
  const ProcessRunner RUNNER(cfg);
  const auto RES = RUNNER.execute("headroom-no-such-command --flag");
  ASSERT_TRUE(RES.isFailure());
  EXPECT_EQ(RES.error().code, ErrorCode::COMMAND_NOT_FOUND);
}

/** @test Exit 126 maps to INSUFFICIENT_PERMISSIONS. */
TEST(ProcessRunnerTest, NonExecutableCommand) {
  char tmpl[] = "/tmp/headroom-noexec-XXXXXX";
  const int FD = ::mkstemp(tmpl);
  ASSERT_GE(FD, 0);
  ::close(FD);

  Config cfg{};
  cfg.allowedCommandPrefixes = {"/tmp/"};
  const ProcessRunner RUNNER(cfg);
  const auto RES = RUNNER.execute(tmpl);
  ::unlink(tmpl);

  ASSERT_TRUE(RES.isFailure());
  EXPECT_EQ(RES.error().code, ErrorCode::INSUFFICIENT_PERMISSIONS);
}

/** @test commandExists validates names before running which. */
TEST(ProcessRunnerTest, CommandExists) {
  const ProcessRunner RUNNER;
  EXPECT_FALSE(RUNNER.commandExists("sh;ls"));
  EXPECT_FALSE(RUNNER.commandExists(""));
  EXPECT_FALSE(RUNNER.commandExists("headroom-no-such-command"));
}
