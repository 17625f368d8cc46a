/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

#include "Exceptions.hpp"
#include "Process.hpp"
#include <gtest/gtest.h>

namespace UpdateKit {

namespace {

std::unique_ptr<Process> shell(PosixProcessLauncher &launcher, const std::string &script) {
    return launcher.launch({"/bin/sh", "-c", script});
}

std::vector<std::string> readAll(Process &process) {
    std::vector<std::string> lines;
    std::string line;
    while (process.readLine(line))
        lines.push_back(line);
    return lines;
}

} // anonymous namespace

TEST(ProcessTest, ReadsLinesAndExitStatus) {
    PosixProcessLauncher launcher;
    auto process = shell(launcher, "printf 'one\\ntwo\\r\\nthree'; echo oops >&2; exit 3");

    auto lines = readAll(*process);
    EXPECT_EQ(process->wait(), 3);
    EXPECT_EQ(process->errorOutput(), "oops\n");
    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two", "three"}));
}

TEST(ProcessTest, CarriageReturnSplitsRedraws) {
    PosixProcessLauncher launcher;
    auto process = shell(launcher, "printf '  -\\r  \\\\\\r  10%%\\r  20%%\\ndone\\n'");

    auto lines = readAll(*process);
    EXPECT_EQ(process->wait(), 0);
    EXPECT_EQ(lines, (std::vector<std::string>{"  -", "  \\", "  10%", "  20%", "done"}));
}

TEST(ProcessTest, StandardInputIsClosed) {
    PosixProcessLauncher launcher;
    auto process = shell(launcher, "if read line; then echo got; else echo eof; fi");

    auto lines = readAll(*process);
    EXPECT_EQ(process->wait(), 0);
    EXPECT_EQ(lines, (std::vector<std::string>{"eof"}));
}

TEST(ProcessTest, LargeErrorOutputDoesNotBlock) {
    PosixProcessLauncher launcher;
    auto process = shell(launcher, "i=0; while [ $i -lt 2000 ]; do echo 'error line of some length' >&2; i=$((i+1)); done; echo finished");

    auto lines = readAll(*process);
    EXPECT_EQ(process->wait(), 0);
    EXPECT_EQ(lines, (std::vector<std::string>{"finished"}));
    EXPECT_GT(process->errorOutput().size(), 40000u);
}

TEST(ProcessTest, TerminateStopsTheChild) {
    PosixProcessLauncher launcher;
    auto process = shell(launcher, "echo started; exec sleep 30");

    std::string line;
    ASSERT_TRUE(process->readLine(line));
    EXPECT_EQ(line, "started");
    process->terminate();
    EXPECT_EQ(process->wait(), 15);
}

TEST(ProcessTest, TimedReadReportsSilence) {
    PosixProcessLauncher launcher;
    auto process = shell(launcher, "exec sleep 30");

    std::string line;
    EXPECT_EQ(process->readLine(line, 100), Process::ReadStatus::Timeout);
    process->terminate();
    EXPECT_EQ(process->readLine(line, 5000), Process::ReadStatus::Closed);
    EXPECT_EQ(process->wait(), 15);
}

TEST(ProcessTest, NullInputDescriptorDoesNotLeak) {
    PosixProcessLauncher launcher;
    // Lists every descriptor above stdin/stdout/stderr which still refers to /dev/null
    auto process = shell(launcher,
            "for f in /proc/$$/fd/*; do n=${f##*/}; [ \"$n\" -gt 2 ] || continue; "
            "t=$(readlink \"$f\"); [ \"$t\" = /dev/null ] && echo \"$n\"; done; true");

    auto lines = readAll(*process);
    EXPECT_EQ(process->wait(), 0);
    EXPECT_TRUE(lines.empty()) << "inherited: " << (lines.empty() ? "" : lines.front());
}

TEST(ProcessTest, MissingExecutableThrows) {
    PosixProcessLauncher launcher;
    try {
        launcher.launch({"upkit-no-such-command"});
        FAIL() << "CommandError expected";
    } catch (const CommandError &e) {
        EXPECT_EQ(e.returncode, -1);
        EXPECT_NE(std::string(e.what()).find("upkit-no-such-command"), std::string::npos);
    }
}

} // namespace UpdateKit
