/*
 * test_process_runner.cpp - Tests for child process execution
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>

#include "utils/process/process_runner.hpp"

using namespace simdeck::utils;
using namespace testing;
using namespace std::chrono_literals;

// ========== executeCommand ==========

TEST(ProcessRunnerTest, CapturesStdout) {
    auto result = executeCommand({"/bin/echo", "hello", "world"}, 5s);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output, "hello world\n");
    EXPECT_TRUE(result.errorOutput.empty());
}

TEST(ProcessRunnerTest, CapturesStderrAndExitCode) {
    auto result =
        executeCommand({"/bin/sh", "-c", "echo oops >&2; exit 3"}, 5s);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_EQ(result.errorOutput, "oops\n");
    EXPECT_FALSE(result.launchFailed);
    EXPECT_FALSE(result.timedOut);
}

TEST(ProcessRunnerTest, ArgumentsAreNotShellExpanded) {
    auto result = executeCommand({"/bin/echo", "$HOME", "*"}, 5s);
    EXPECT_EQ(result.output, "$HOME *\n");
}

TEST(ProcessRunnerTest, MissingBinaryIsLaunchFailure) {
    auto result = executeCommand({"/nonexistent/simdeck-no-such-tool"}, 5s);
    EXPECT_TRUE(result.launchFailed);
    EXPECT_FALSE(result.ok());
    EXPECT_THAT(result.errorOutput, StartsWith("exec failed"));
}

TEST(ProcessRunnerTest, EmptyArgvIsLaunchFailure) {
    auto result = executeCommand({}, 5s);
    EXPECT_TRUE(result.launchFailed);
}

TEST(ProcessRunnerTest, TimeoutKillsChild) {
    auto start = std::chrono::steady_clock::now();
    auto result = executeCommand({"/bin/sleep", "10"}, 300ms);
    auto took = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timedOut);
    EXPECT_FALSE(result.ok());
    EXPECT_LT(took, 5s);
}

TEST(ProcessRunnerTest, AbandonedChildIsKilledAndReaped) {
    // A background grandchild keeps the pipes open after the child is killed
    auto start = std::chrono::steady_clock::now();
    auto result = executeCommand(
        {"/bin/sh", "-c", "sleep 10 & exec /bin/sleep 10"}, 200ms);
    auto took = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timedOut);
    EXPECT_FALSE(result.launchFailed);
    EXPECT_LT(took, 5s);
}

TEST(ProcessRunnerTest, LargeOutputDoesNotDeadlock) {
    auto result = executeCommand(
        {"/bin/sh", "-c", "head -c 200000 /dev/zero | tr '\\0' a; "
                          "head -c 100000 /dev/zero | tr '\\0' b >&2"},
        10s);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.output.size(), 200000u);
    EXPECT_EQ(result.errorOutput.size(), 100000u);
}

// ========== Helpers ==========

TEST(ProcessRunnerTest, JoinCommand) {
    EXPECT_EQ(joinCommand({"xcrun", "simctl", "list"}), "xcrun simctl list");
    EXPECT_EQ(joinCommand({}), "");
}

TEST(ProcessRunnerTest, RunnerDelegates) {
    ProcessRunner runner;
    auto result = runner.run({"/bin/echo", "-n", "x"}, 5s);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.output, "x");
}
