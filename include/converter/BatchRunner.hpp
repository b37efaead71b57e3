#ifndef CONVERTER_BATCH_RUNNER_HPP
#define CONVERTER_BATCH_RUNNER_HPP

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "converter/AudioConverter.hpp"
#include "converter/ConversionLog.hpp"
#include "converter/Job.hpp"

struct BatchProgress {
    std::size_t completed = 0;
    std::size_t total = 0;
    // Position inside the running job, 0..1.
    double current_fraction = 0.0;
    std::string current_file;
    bool running = false;
};

// Drives a JobQueue through a converter on one worker thread, one ffmpeg at a
// time, in queue order. The UI polls Progress() and the queue; it never blocks
// on the worker except in Stop().
class BatchRunner {
public:
    using ConverterFactory = std::function<std::unique_ptr<AudioConverter>()>;

    BatchRunner(JobQueue& jobs, ConversionLog& log, ConverterFactory factory);
    ~BatchRunner();

    BatchRunner(const BatchRunner&) = delete;
    BatchRunner& operator=(const BatchRunner&) = delete;

    // Returns false (and logs why) when nothing is queued, a batch is already
    // running, or output_dir cannot be created.
    bool Start(const std::filesystem::path& output_dir);

    // Terminates the running ffmpeg, marks unfinished jobs skipped and joins.
    void Stop();

    // Blocks until the current batch finishes on its own.
    void Wait();

    bool IsRunning() const;
    BatchProgress Progress() const;

private:
    void Run(std::unique_ptr<AudioConverter> converter, std::filesystem::path output_dir);
    void SetCurrent(const std::string& file, double fraction);
    void LogDiagnostic(const std::string& diagnostic);

    JobQueue& jobs_;
    ConversionLog& log_;
    ConverterFactory factory_;

    std::thread worker_;
    std::atomic<bool> stop_flag_{false};
    std::atomic<bool> converting_{false};

    mutable std::mutex progress_mutex_;
    std::string current_file_;
    double current_fraction_ = 0.0;
};

#endif // CONVERTER_BATCH_RUNNER_HPP
