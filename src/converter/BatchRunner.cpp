#include "converter/BatchRunner.hpp"

#include <optional>
#include <sstream>
#include <utility>
#include <vector>

#include "converter/Process.hpp"

namespace {
constexpr std::size_t kDiagnosticLines = 12;
const char kCancelledReason[] = "Cancelled";
} // namespace

BatchRunner::BatchRunner(JobQueue& jobs, ConversionLog& log, ConverterFactory factory)
    : jobs_(jobs),
      log_(log),
      factory_(std::move(factory)) {}

BatchRunner::~BatchRunner() {
    Stop();
}

bool BatchRunner::Start(const std::filesystem::path& output_dir) {
    if (converting_.load(std::memory_order_relaxed)) {
        log_.Append(LogType::Warning, "A conversion is already running.");
        return false;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    if (jobs_.Empty()) {
        log_.Append(LogType::Warning, "No files selected for conversion.");
        return false;
    }
    if (output_dir.empty()) {
        log_.Append(LogType::Warning, "Destination directory not set.");
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(output_dir, ec)) {
        if (!std::filesystem::create_directories(output_dir, ec) || ec) {
            log_.Append(LogType::Error, "Error creating destination directory: " +
                                            output_dir.string() + ": " + ec.message());
            return false;
        }
        log_.Append(LogType::Info, "Created destination directory: " + output_dir.string());
    }

    std::unique_ptr<AudioConverter> converter = factory_();
    if (converter == nullptr) {
        log_.Append(LogType::Error, "No converter available.");
        return false;
    }

    log_.Clear();
    jobs_.ResetForRun(output_dir, converter->OutputExtension());
    SetCurrent({}, 0.0);

    stop_flag_.store(false, std::memory_order_relaxed);
    converting_.store(true, std::memory_order_relaxed);
    worker_ = std::thread(&BatchRunner::Run, this, std::move(converter), output_dir);
    return true;
}

void BatchRunner::Stop() {
    stop_flag_.store(true, std::memory_order_relaxed);
    if (worker_.joinable()) {
        worker_.join();
    }
    converting_.store(false, std::memory_order_relaxed);
}

void BatchRunner::Wait() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool BatchRunner::IsRunning() const {
    return converting_.load(std::memory_order_relaxed);
}

BatchProgress BatchRunner::Progress() const {
    const JobCounts counts = jobs_.Counts();
    BatchProgress progress;
    progress.completed = counts.Completed();
    progress.total = counts.Total();
    progress.running = converting_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(progress_mutex_);
    progress.current_file = current_file_;
    progress.current_fraction = current_fraction_;
    return progress;
}

void BatchRunner::SetCurrent(const std::string& file, double fraction) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    current_file_ = file;
    current_fraction_ = fraction;
}

void BatchRunner::LogDiagnostic(const std::string& diagnostic) {
    std::vector<std::string> lines;
    std::istringstream in(diagnostic);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    const std::size_t first = lines.size() > kDiagnosticLines ? lines.size() - kDiagnosticLines : 0;
    for (std::size_t i = first; i < lines.size(); ++i) {
        log_.Append(LogType::Error, lines[i]);
    }
}

void BatchRunner::Run(std::unique_ptr<AudioConverter> converter, std::filesystem::path output_dir) {
    converter->SetCancelFlag(&stop_flag_);
    converter->SetLogCallback([this](LogType type, const std::string& message) {
        log_.Append(type, message);
    });
    converter->SetProgressCallback([this](double fraction) {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        current_fraction_ = fraction;
    });

    log_.Append(LogType::Info, "Starting conversion of " + std::to_string(jobs_.Size()) + " files.");

    // Once the tool is known to be missing, the rest of the queue fails with the
    // same message without spawning anything.
    std::optional<std::string> missing_tool;

    while (!stop_flag_.load(std::memory_order_relaxed)) {
        const std::optional<Job> job = jobs_.NextQueued();
        if (!job) {
            break;
        }
        const std::string name = job->input_path.filename().string();

        if (missing_tool) {
            jobs_.MarkFailed(job->id, *missing_tool);
            log_.Append(LogType::Error, name + ": " + *missing_tool);
            continue;
        }

        jobs_.MarkRunning(job->id);
        SetCurrent(name, 0.0);

        try {
            const std::filesystem::path written = converter->ConvertFile(job->input_path, output_dir);
            jobs_.MarkSucceeded(job->id, written);
        } catch (const ToolNotFoundError& e) {
            missing_tool = e.what();
            jobs_.MarkFailed(job->id, e.what());
            log_.Append(LogType::Error, name + ": " + e.what());
        } catch (const ConversionCancelled&) {
            jobs_.MarkSkipped(job->id, kCancelledReason);
        } catch (const ConversionError& e) {
            jobs_.MarkFailed(job->id, e.what());
            log_.Append(LogType::Error, e.what());
            LogDiagnostic(e.Diagnostic());
        } catch (const std::exception& e) {
            jobs_.MarkFailed(job->id, e.what());
            log_.Append(LogType::Error, "An error occurred during conversion of " + name + ": " + e.what());
        }
        SetCurrent({}, 0.0);
    }

    if (stop_flag_.load(std::memory_order_relaxed)) {
        jobs_.SkipUnfinished(kCancelledReason);
        log_.Append(LogType::Info, "Conversion cancelled.");
    } else {
        const JobCounts counts = jobs_.Counts();
        log_.Append(LogType::Info, "Conversion complete: " + std::to_string(counts.succeeded) + " converted, " +
                                       std::to_string(counts.failed) + " failed.");
    }
    converting_.store(false, std::memory_order_relaxed);
}
