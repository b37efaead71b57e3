#ifndef CONVERTER_JOB_HPP
#define CONVERTER_JOB_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class JobStatus {
    Queued,
    Running,
    Succeeded,
    Failed,
    Skipped
};

const char* JobStatusName(JobStatus status);
bool IsTerminal(JobStatus status);

// One queued input-to-output conversion request.
struct Job {
    std::uint64_t id = 0;
    std::filesystem::path input_path;
    std::filesystem::path output_path;
    JobStatus status = JobStatus::Queued;
    std::string error;
    std::string duration_label = "--:--";
};

struct JobCounts {
    std::size_t queued = 0;
    std::size_t running = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;

    std::size_t Total() const { return queued + running + succeeded + failed + skipped; }
    std::size_t Completed() const { return succeeded + failed + skipped; }
};

// Ordered job list shared between the UI thread and the conversion worker.
// Insertion order is the processing order. Jobs are addressed by id so that
// indices shown in the UI never go stale while the worker updates statuses.
class JobQueue {
public:
    JobQueue();

    // Returns the new job id, or nothing when the input path is already queued
    // or another queued input has the same stem. Outputs are named after the
    // stem alone, so two such inputs would write the same file.
    std::optional<std::uint64_t> Add(const std::filesystem::path& input_path,
                                     const std::string& duration_label = "--:--");

    // Removal is refused for a running job.
    bool Remove(std::uint64_t id);
    // Drops every job; refused while any job is running.
    bool Clear();

    std::vector<Job> Snapshot() const;
    std::optional<Job> Get(std::uint64_t id) const;
    std::size_t Size() const;
    bool Empty() const;
    bool Contains(const std::filesystem::path& input_path) const;
    // A different queued input whose output would collide with input_path's.
    std::optional<std::filesystem::path> OutputConflict(const std::filesystem::path& input_path) const;
    JobCounts Counts() const;

    // Puts every job back to Queued with an output path under output_dir.
    void ResetForRun(const std::filesystem::path& output_dir, const std::string& output_extension);

    // First job still Queued, in insertion order.
    std::optional<Job> NextQueued() const;

    void MarkRunning(std::uint64_t id);
    void MarkSucceeded(std::uint64_t id, const std::filesystem::path& output_path);
    void MarkFailed(std::uint64_t id, const std::string& error);
    void MarkSkipped(std::uint64_t id, const std::string& reason);
    // Marks every Queued or Running job as Skipped; returns how many changed.
    std::size_t SkipUnfinished(const std::string& reason);

private:
    Job* Find(std::uint64_t id);

    mutable std::mutex mutex_;
    std::vector<Job> jobs_;
    std::uint64_t next_id_;
};

#endif // CONVERTER_JOB_HPP
