#include <gtest/gtest.h>
#include "process/Executor.hpp"

#include <csignal>
#include <filesystem>
#include <string>

using namespace tr::process;
namespace fs = std::filesystem;

class ExecutorTest : public ::testing::Test {
protected:
    Executor executor;

    static Invocation sh(const std::string& script) { return {"/bin/sh", {"-c", script}}; }
};

TEST_F(ExecutorTest, CapturesStdoutAndZeroExit) {
    const auto r = executor.run({"/bin/echo", {"hello", "world"}});
    ASSERT_TRUE(r.exit_code.has_value());
    EXPECT_EQ(*r.exit_code, 0);
    EXPECT_TRUE(r.succeeded());
    EXPECT_EQ(r.stdout_text, "hello world\n");
    EXPECT_TRUE(r.stderr_text.empty());
}

TEST_F(ExecutorTest, NonZeroExitIsData) {
    const auto r = executor.run(sh("echo out; echo err >&2; exit 3"));
    ASSERT_TRUE(r.exit_code.has_value());
    EXPECT_EQ(*r.exit_code, 3);
    EXPECT_EQ(r.stdout_text, "out\n");
    EXPECT_EQ(r.stderr_text, "err\n");
}

TEST_F(ExecutorTest, ArgumentsAreNotShellInterpreted) {
    const auto r = executor.run({"/bin/echo", {"$(id)", "a;b", "`x`"}});
    EXPECT_EQ(r.stdout_text, "$(id) a;b `x`\n");
}

TEST_F(ExecutorTest, ResolvesProgramFromPath) {
    const auto r = executor.run({"echo", {"via", "PATH"}});
    EXPECT_EQ(r.stdout_text, "via PATH\n");
}

TEST_F(ExecutorTest, LargeOutputOnBothStreamsIsDrainedFully) {
    // larger than a pipe buffer on each stream, interleaved
    const auto r = executor.run(sh("i=0; while [ $i -lt 5000 ]; do "
                                   "echo 0123456789012345678901234567890123456789; "
                                   "echo abcdefghijabcdefghijabcdefghijabcdefghij >&2; "
                                   "i=$((i+1)); done"));
    EXPECT_EQ(r.stdout_text.size(), 5000u * 41u);
    EXPECT_EQ(r.stderr_text.size(), 5000u * 41u);
}

TEST_F(ExecutorTest, StdinIsEmpty) {
    const auto r = executor.run(sh("cat; echo done"));
    EXPECT_EQ(r.stdout_text, "done\n");
}

TEST_F(ExecutorTest, MissingProgramThrowsSpawnError) {
    try {
        (void)executor.run({"/nonexistent/definitely-not-a-runner", {}});
        FAIL() << "expected SpawnError";
    } catch (const SpawnError& e) {
        EXPECT_EQ(e.program(), "/nonexistent/definitely-not-a-runner");
        EXPECT_EQ(e.stage(), "exec");
        EXPECT_EQ(e.error(), ENOENT);
    }
}

TEST_F(ExecutorTest, BadWorkingDirectoryThrowsSpawnError) {
    Invocation inv{"/bin/echo", {"x"}};
    inv.working_dir = "/nonexistent/testrunner-workdir";
    EXPECT_THROW((void)executor.run(inv), SpawnError);
}

TEST_F(ExecutorTest, RunsInWorkingDirectory) {
    const auto dir = fs::canonical(fs::temp_directory_path());
    Invocation inv = sh("pwd -P");
    inv.working_dir = dir;
    const auto r = executor.run(inv);
    EXPECT_EQ(r.stdout_text, dir.string() + "\n");
}

TEST_F(ExecutorTest, SignalDeathLeavesExitCodeUnknown) {
    const auto r = executor.run(sh("kill -TERM $$"));
    EXPECT_FALSE(r.exit_code.has_value());
    ASSERT_TRUE(r.term_signal.has_value());
    EXPECT_EQ(*r.term_signal, SIGTERM);
    EXPECT_EQ(r.exitCodeString(), "unknown (signal 15)");
}
