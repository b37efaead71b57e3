#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>

#include "converter/BatchRunner.hpp"
#include "converter/OpusToMp3Converter.hpp"
#include "TestUtil.hpp"

namespace {
class BatchRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        input_dir_ = tmp_.Path() / "in";
        output_dir_ = tmp_.Path() / "out";
        std::filesystem::create_directories(input_dir_);
        settings_.ffmpeg_path = WriteFakeFfmpeg(tmp_.Path()).string();
    }

    std::filesystem::path Queue(const std::string& name) {
        const std::filesystem::path path = input_dir_ / name;
        WriteTextFile(path, "OggS stand-in");
        jobs_.Add(path);
        return path;
    }

    BatchRunner::ConverterFactory Factory() {
        return [this]() -> std::unique_ptr<AudioConverter> {
            return std::make_unique<OpusToMp3Converter>(settings_);
        };
    }

    std::vector<std::string> Messages(LogType type) const {
        std::vector<std::string> messages;
        for (const LogEntry& entry : log_.Entries()) {
            if (entry.type == type) {
                messages.push_back(entry.message);
            }
        }
        return messages;
    }

    TempDir tmp_;
    std::filesystem::path input_dir_;
    std::filesystem::path output_dir_;
    ConversionSettings settings_;
    JobQueue jobs_;
    ConversionLog log_;
};
} // namespace

TEST_F(BatchRunnerTest, ConvertsJobsInQueueOrder) {
    const std::filesystem::path c = Queue("c.opus");
    const std::filesystem::path a = Queue("a.opus");
    const std::filesystem::path b = Queue("b.opus");

    BatchRunner runner(jobs_, log_, Factory());
    ASSERT_TRUE(runner.Start(output_dir_));
    runner.Wait();
    EXPECT_FALSE(runner.IsRunning());

    const std::vector<std::string> finished = Messages(LogType::Finished);
    const std::vector<std::string> expected_finished{"c.opus.", "a.opus.", "b.opus."};
    EXPECT_EQ(finished, expected_finished);

    std::vector<std::string> inputs;
    for (const std::string& call : ReadLines(CallsLog(tmp_.Path()))) {
        inputs.push_back(InputOfCall(call));
    }
    const std::vector<std::string> expected_inputs{c.string(), c.string(), a.string(), a.string(),
                                                   b.string(), b.string()};
    EXPECT_EQ(inputs, expected_inputs);

    const JobCounts counts = jobs_.Counts();
    EXPECT_EQ(counts.succeeded, 3u);
    EXPECT_TRUE(std::filesystem::exists(output_dir_ / "a.mp3"));

    const std::vector<std::string> info = Messages(LogType::Info);
    ASSERT_FALSE(info.empty());
    EXPECT_EQ(info.front(), "Starting conversion of 3 files.");
    EXPECT_EQ(info.back(), "Conversion complete: 3 converted, 0 failed.");

    const BatchProgress progress = runner.Progress();
    EXPECT_EQ(progress.completed, 3u);
    EXPECT_EQ(progress.total, 3u);
    EXPECT_FALSE(progress.running);
}

TEST_F(BatchRunnerTest, CreatesDestinationDirectory) {
    Queue("a.opus");
    BatchRunner runner(jobs_, log_, Factory());
    ASSERT_TRUE(runner.Start(output_dir_));
    runner.Wait();
    EXPECT_TRUE(std::filesystem::is_directory(output_dir_));
}

TEST_F(BatchRunnerTest, FailureDoesNotStopTheBatch) {
    Queue("a.opus");
    const std::filesystem::path bad = Queue("corrupt.opus");
    Queue("z.opus");

    BatchRunner runner(jobs_, log_, Factory());
    ASSERT_TRUE(runner.Start(output_dir_));
    runner.Wait();

    const JobCounts counts = jobs_.Counts();
    EXPECT_EQ(counts.succeeded, 2u);
    EXPECT_EQ(counts.failed, 1u);
    for (const Job& job : jobs_.Snapshot()) {
        if (job.input_path == bad) {
            EXPECT_EQ(job.status, JobStatus::Failed);
            EXPECT_EQ(job.error, "First pass failed: ffmpeg returned non-zero exit code 1.");
        }
    }
    const std::vector<std::string> errors = Messages(LogType::Error);
    EXPECT_NE(std::find(errors.begin(), errors.end(),
                        bad.string() + ": Invalid data found when processing input"),
              errors.end());
    EXPECT_EQ(Messages(LogType::Info).back(), "Conversion complete: 2 converted, 1 failed.");
}

TEST_F(BatchRunnerTest, MissingToolFailsEveryJobWithoutOutput) {
    settings_.ffmpeg_path = (tmp_.Path() / "no-ffmpeg-here").string();
    Queue("a.opus");
    Queue("b.opus");
    Queue("c.opus");

    BatchRunner runner(jobs_, log_, Factory());
    ASSERT_TRUE(runner.Start(output_dir_));
    runner.Wait();

    const std::string message = settings_.ffmpeg_path + " not found";
    for (const Job& job : jobs_.Snapshot()) {
        EXPECT_EQ(job.status, JobStatus::Failed);
        EXPECT_EQ(job.error, message);
    }
    EXPECT_TRUE(std::filesystem::is_empty(output_dir_));
    EXPECT_FALSE(std::filesystem::exists(CallsLog(tmp_.Path())));
}

TEST_F(BatchRunnerTest, StopSkipsUnfinishedJobsPromptly) {
    Queue("slow.opus");
    Queue("b.opus");

    BatchRunner runner(jobs_, log_, Factory());
    ASSERT_TRUE(runner.Start(output_dir_));
    // Wait until ffmpeg is actually running.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!std::filesystem::exists(CallsLog(tmp_.Path())) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    const auto before = std::chrono::steady_clock::now();
    runner.Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(5));
    EXPECT_FALSE(runner.IsRunning());

    for (const Job& job : jobs_.Snapshot()) {
        EXPECT_EQ(job.status, JobStatus::Skipped);
        EXPECT_EQ(job.error, "Cancelled");
    }
    EXPECT_FALSE(std::filesystem::exists(output_dir_ / "slow.mp3"));
    EXPECT_FALSE(std::filesystem::exists(output_dir_ / "b.mp3"));
    EXPECT_EQ(Messages(LogType::Info).back(), "Conversion cancelled.");
}

TEST_F(BatchRunnerTest, RefusesEmptyQueue) {
    BatchRunner runner(jobs_, log_, Factory());
    EXPECT_FALSE(runner.Start(output_dir_));
    EXPECT_EQ(Messages(LogType::Warning), std::vector<std::string>{"No files selected for conversion."});
    EXPECT_FALSE(std::filesystem::exists(output_dir_));
}

TEST_F(BatchRunnerTest, RefusesMissingDestination) {
    Queue("a.opus");
    BatchRunner runner(jobs_, log_, Factory());
    EXPECT_FALSE(runner.Start({}));
    EXPECT_EQ(Messages(LogType::Warning), std::vector<std::string>{"Destination directory not set."});
    EXPECT_EQ(jobs_.Counts().queued, 1u);
}

TEST_F(BatchRunnerTest, RefusesUncreatableDestination) {
    Queue("a.opus");
    WriteTextFile(tmp_.Path() / "file", "x");
    BatchRunner runner(jobs_, log_, Factory());
    EXPECT_FALSE(runner.Start(tmp_.Path() / "file" / "out"));
    ASSERT_EQ(Messages(LogType::Error).size(), 1u);
    EXPECT_EQ(Messages(LogType::Error)[0].rfind("Error creating destination directory: ", 0), 0u);
}

TEST_F(BatchRunnerTest, RerunRequeuesFinishedJobs) {
    Queue("a.opus");
    BatchRunner runner(jobs_, log_, Factory());
    ASSERT_TRUE(runner.Start(output_dir_));
    runner.Wait();
    ASSERT_TRUE(runner.Start(output_dir_));
    runner.Wait();

    EXPECT_EQ(jobs_.Counts().succeeded, 1u);
    // The log starts over with every run.
    EXPECT_EQ(Messages(LogType::Overwriting), std::vector<std::string>{"a.mp3..."});
    EXPECT_EQ(ReadLines(CallsLog(tmp_.Path())).size(), 4u);
}
