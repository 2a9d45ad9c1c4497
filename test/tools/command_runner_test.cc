#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <unistd.h>
#include "../../src/common/errors.h"
#include "../../src/tools/command_runner.h"
#include "mock_command_runner.h"

using namespace MpathPr;
using ::testing::ElementsAre;
using ::testing::Return;

TEST(LocalCommandRunnerTest, CapturesStdoutAndStatus) {
    LocalCommandRunner runner;
    CommandResult result = runner.Run({"/bin/sh", "-c", "echo hello; exit 3"});
    EXPECT_EQ(result.exit_status, 3);
    EXPECT_EQ(result.output, "hello\n");
    EXPECT_FALSE(result.ok());
}

TEST(LocalCommandRunnerTest, ResolvesThroughPath) {
    LocalCommandRunner runner;
    CommandResult result = runner.Run({"sh", "-c", "printf ok"});
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.output, "ok");
}

TEST(LocalCommandRunnerTest, ReportsSignalDeath) {
    LocalCommandRunner runner;
    CommandResult result = runner.Run({"/bin/sh", "-c", "kill -9 $$"});
    EXPECT_EQ(result.exit_status, 128 + 9);
}

TEST(LocalCommandRunnerTest, MissingProgramThrows) {
    LocalCommandRunner runner;
    EXPECT_THROW(runner.Run({"/nonexistent/mpath-tool"}), ToolInvocationFailure);
    EXPECT_THROW(runner.Run({}), ToolInvocationFailure);
}

TEST(LocalCommandRunnerTest, LargeOutputIsNotTruncated) {
    LocalCommandRunner runner;
    CommandResult result = runner.Run({"/bin/sh", "-c", "i=0; while [ $i -lt 5000 ]; do echo 0x$i; i=$((i+1)); done"});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(std::count(result.output.begin(), result.output.end(), '\n'), 5000);
}

TEST(LocalCommandRunnerTest, StdinIsEmpty) {
    // Must not block on, or be stopped for, reading the caller's terminal
    LocalCommandRunner runner;
    CommandResult result = runner.Run({"sh", "-c", "read x; echo got:$x"});
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.output, "got:\n");
}

namespace {

// Field 5 of /proc/<pid>/stat is the process group of `cut` itself
pid_t ChildProcessGroup(LocalCommandRunner& runner) {
    CommandResult result = runner.Run({"cut", "-d", " ", "-f5", "/proc/self/stat"});
    EXPECT_TRUE(result.ok());
    return static_cast<pid_t>(std::stol(result.output));
}

} // namespace

TEST(LocalCommandRunnerTest, ChildGetsItsOwnProcessGroupByDefault) {
    LocalCommandRunner runner;
    EXPECT_NE(ChildProcessGroup(runner), getpgrp());
}

TEST(LocalCommandRunnerTest, ChildCanStayInCallersProcessGroup) {
    LocalRunnerOptions options;
    options.own_process_group = false;
    LocalCommandRunner runner(options);
    EXPECT_EQ(ChildProcessGroup(runner), getpgrp());
}

TEST(LocalCommandRunnerTest, DiscardedStderrIsNotCaptured) {
    LocalRunnerOptions options;
    options.discard_stderr = true;
    LocalCommandRunner runner(options);
    CommandResult result = runner.Run({"sh", "-c", "echo noise >&2; echo out"});
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.output, "out\n");
}

TEST(RemoteCommandRunnerTest, QuotesArgumentsForRemoteShell) {
    auto transport = std::make_shared<MockCommandRunner>();
    RemoteCommandRunner runner(transport, "ssh", "peer-host");
    EXPECT_CALL(*transport, Run(ElementsAre("ssh", "-n", "-o", "BatchMode=yes", "peer-host", "--",
                                            "'mpathpersist' '-ik' '/dev/mapper/it'\\''s'")))
        .WillOnce(Return(Exited(0, "out")));
    CommandResult result = runner.Run({"mpathpersist", "-ik", "/dev/mapper/it's"});
    EXPECT_EQ(result.output, "out");
}

TEST(RemoteCommandRunnerTest, RemoteStatusPassesThrough) {
    auto transport = std::make_shared<MockCommandRunner>();
    RemoteCommandRunner runner(transport, "ssh", "peer-host");
    EXPECT_CALL(*transport, Run(::testing::_)).WillOnce(Return(Exited(6)));
    EXPECT_EQ(runner.Run({"mpathpersist", "-ik", "/dev/mapper/mpatha"}).exit_status, 6);
}

TEST(RemoteCommandRunnerTest, SshFailureThrows) {
    auto transport = std::make_shared<MockCommandRunner>();
    RemoteCommandRunner runner(transport, "ssh", "peer-host");
    EXPECT_CALL(*transport, Run(::testing::_)).WillOnce(Return(Exited(255)));
    EXPECT_THROW(runner.Run({"true"}), ToolInvocationFailure);
}

TEST(ProgramExistsTest, FindsProgramsOnPathAndByPath) {
    EXPECT_TRUE(ProgramExists("sh"));
    EXPECT_TRUE(ProgramExists("/bin/sh"));
    EXPECT_FALSE(ProgramExists("definitely-not-an-mpath-tool"));
    EXPECT_FALSE(ProgramExists("/etc"));
}
