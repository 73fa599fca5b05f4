#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "clip_unify/process.hpp"

using namespace clip_unify;

TEST(SubprocessRunnerTest, CapturesStdout)
{
    SubprocessRunner runner;
    ProcessOutcome o = runner.run({"/bin/sh", "-c", "echo 640x480"});
    EXPECT_TRUE(o.spawned);
    EXPECT_EQ(o.exit_code, 0);
    EXPECT_TRUE(o.ok());
    EXPECT_EQ(o.output, "640x480\n");
}

TEST(SubprocessRunnerTest, ReportsExitCodeAndStderr)
{
    SubprocessRunner runner;
    ProcessOutcome o =
        runner.run({"/bin/sh", "-c", "echo first >&2; echo 'last line' >&2; exit 3"});
    EXPECT_TRUE(o.spawned);
    EXPECT_EQ(o.exit_code, 3);
    EXPECT_FALSE(o.ok());
    EXPECT_TRUE(o.output.empty());
    EXPECT_EQ(o.last_diagnostic_line(), "last line");
}

TEST(SubprocessRunnerTest, ArgumentsAreNotShellExpanded)
{
    SubprocessRunner runner;
    ProcessOutcome o = runner.run({"/bin/sh", "-c", "printf '%s' \"$0\"", "it's a $HOME file"});
    EXPECT_TRUE(o.ok());
    EXPECT_EQ(o.output, "it's a $HOME file");
}

TEST(SubprocessRunnerTest, MissingBinaryExits127)
{
    SubprocessRunner runner;
    ProcessOutcome o = runner.run({"/nonexistent/clip_unify_engine", "-version"});
    EXPECT_TRUE(o.spawned);
    EXPECT_EQ(o.exit_code, 127);
    EXPECT_FALSE(o.last_diagnostic_line().empty());
}

TEST(SubprocessRunnerTest, DrainsLargeOutputOnBothStreams)
{
    SubprocessRunner runner;
    ProcessOutcome o = runner.run(
        {"/bin/sh", "-c",
         "head -c 200000 /dev/zero | tr '\\0' a; head -c 200000 /dev/zero | tr '\\0' b >&2"});
    EXPECT_TRUE(o.ok());
    EXPECT_EQ(o.output.size(), 200000u);
    EXPECT_LE(o.diagnostics.size(), 64u * 1024u);
    EXPECT_FALSE(o.diagnostics.empty());
}

TEST(SubprocessRunnerTest, EmptyCommandIsNotSpawned)
{
    SubprocessRunner runner;
    ProcessOutcome o = runner.run({});
    EXPECT_FALSE(o.spawned);
    EXPECT_FALSE(o.ok());
}

TEST(FormatCommandTest, QuotesArgumentsWithSpaces)
{
    EXPECT_EQ(format_command({"ffmpeg", "-i", "my clip.mp4", "-y", "out.mp4"}),
              "ffmpeg -i \"my clip.mp4\" -y out.mp4");
}
