// process_runner_test.cpp - Tests for Yakumo external command execution
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <gtest/gtest.h>
#include <yakumo/common/process_runner.hpp>

#include <chrono>

using namespace Yakumo::Utils;
using namespace std::chrono_literals;

// Test exit statuses of trivial commands
TEST(ProcessRunnerTest, ExitStatus) {
    ProcessRunner runner;

    CommandResult ok = runner.run({"true"});
    EXPECT_TRUE(ok.started);
    EXPECT_EQ(ok.exitStatus, 0);
    EXPECT_TRUE(ok.succeeded());

    CommandResult failed = runner.run({"false"});
    EXPECT_TRUE(failed.started);
    EXPECT_EQ(failed.exitStatus, 1);
    EXPECT_FALSE(failed.succeeded());
}

// Test that stdout and stderr are captured separately
TEST(ProcessRunnerTest, CapturesOutput) {
    ProcessRunner runner;

    CommandResult res = runner.run({"/bin/sh", "-c", "echo table inet yakumo; echo oops >&2; exit 3"});
    EXPECT_EQ(res.exitStatus, 3);
    EXPECT_EQ(res.out, "table inet yakumo\n");
    EXPECT_EQ(res.err, "oops\n");
}

// Test that arguments are passed without a shell
TEST(ProcessRunnerTest, NoShellExpansion) {
    ProcessRunner runner;

    CommandResult res = runner.run({"echo", "{ tcp, udp }", "$HOME"});
    EXPECT_TRUE(res.succeeded());
    EXPECT_EQ(res.out, "{ tcp, udp } $HOME\n");
}

// Test that a hung command is killed at the deadline
TEST(ProcessRunnerTest, Timeout) {
    ProcessRunner runner(200ms);

    auto start = std::chrono::steady_clock::now();
    CommandResult res = runner.run({"sleep", "5"});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(res.started);
    EXPECT_TRUE(res.timedOut);
    EXPECT_FALSE(res.succeeded());
    EXPECT_LT(elapsed, 3s);
}

// Test that a command that closes its output and keeps running is still killed
TEST(ProcessRunnerTest, TimeoutAfterOutputClosed) {
    ProcessRunner runner(200ms);

    auto start = std::chrono::steady_clock::now();
    CommandResult res = runner.run({"/bin/sh", "-c", "exec >&- 2>&-; sleep 5"});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(res.timedOut);
    EXPECT_FALSE(res.succeeded());
    EXPECT_LT(elapsed, 3s);
}

// Test missing binaries and empty commands
TEST(ProcessRunnerTest, MissingBinary) {
    ProcessRunner runner;

    CommandResult missing = runner.run({"/nonexistent/yakumo-nft"});
    EXPECT_FALSE(missing.succeeded());
    EXPECT_EQ(missing.exitStatus, 127);

    CommandResult empty = runner.run({});
    EXPECT_FALSE(empty.started);
    EXPECT_FALSE(empty.succeeded());
}
