#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "converter/Process.hpp"

TEST(ProcessTest, CapturesStandardOutput) {
    const ProcessResult result = RunProcess({"echo", "hello"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.standard_output, "hello\n");
    EXPECT_TRUE(result.standard_error.empty());
}

TEST(ProcessTest, ReportsNonZeroExitAndStandardError) {
    const ProcessResult result = RunProcess({"sh", "-c", "echo oops >&2; exit 3"});
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.standard_error, "oops\n");
}

TEST(ProcessTest, SignalExitMapsTo128PlusSignal) {
    const ProcessResult result = RunProcess({"sh", "-c", "kill -9 $$"});
    EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST(ProcessTest, MissingExecutableThrowsToolNotFound) {
    try {
        RunProcess({"opus2mp3-no-such-tool-for-tests"});
        FAIL() << "expected ToolNotFoundError";
    } catch (const ToolNotFoundError& e) {
        EXPECT_EQ(e.Tool(), "opus2mp3-no-such-tool-for-tests");
        EXPECT_STREQ(e.what(), "opus2mp3-no-such-tool-for-tests not found");
    }
}

TEST(ProcessTest, MissingAbsolutePathThrowsToolNotFound) {
    EXPECT_THROW(RunProcess({"/nonexistent/dir/ffmpeg", "-version"}), ToolNotFoundError);
}

TEST(ProcessTest, EmptyArgvIsRejected) {
    EXPECT_THROW(RunProcess({}), std::invalid_argument);
}

TEST(ProcessTest, StandardInputIsDevNull) {
    // cat would block forever on an inherited terminal.
    const ProcessResult result = RunProcess({"sh", "-c", "cat; echo done"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.standard_output, "done\n");
}

TEST(ProcessTest, DeliversStdoutLinesIncludingUnterminatedTail) {
    std::vector<std::string> lines;
    const ProcessResult result = RunProcess({"sh", "-c", "printf 'a\\nb\\r\\nc'"}, nullptr,
                                            [&lines](const std::string& line) { lines.push_back(line); });
    EXPECT_EQ(result.exit_code, 0);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "c");
}

TEST(ProcessTest, CancelTerminatesTheChildPromptly) {
    std::atomic<bool> cancel{false};
    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        cancel.store(true);
    });

    const auto started = std::chrono::steady_clock::now();
    const ProcessResult result = RunProcess({"sleep", "5"}, &cancel);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.exit_code, 128 + 15);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(ProcessTest, CancelReachesGrandchildren) {
    std::atomic<bool> cancel{false};
    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        cancel.store(true);
    });

    const auto started = std::chrono::steady_clock::now();
    // The shell's child keeps the pipes open; only a group-wide signal ends it.
    const ProcessResult result = RunProcess({"sh", "-c", "sleep 5; echo late"}, &cancel);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.standard_output.empty());
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(ProcessTest, FindExecutableSearchesPath) {
    EXPECT_FALSE(FindExecutable("sh").empty());
    EXPECT_TRUE(FindExecutable("opus2mp3-no-such-tool-for-tests").empty());
    EXPECT_TRUE(FindExecutable("").empty());
    EXPECT_EQ(FindExecutable("/bin/sh"), "/bin/sh");
    EXPECT_TRUE(FindExecutable("/nonexistent/sh").empty());
}
