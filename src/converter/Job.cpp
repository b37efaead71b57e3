#include "converter/Job.hpp"

#include <algorithm>

const char* JobStatusName(JobStatus status) {
    switch (status) {
    case JobStatus::Queued:
        return "queued";
    case JobStatus::Running:
        return "running";
    case JobStatus::Succeeded:
        return "done";
    case JobStatus::Failed:
        return "failed";
    case JobStatus::Skipped:
        return "skipped";
    }
    return "queued";
}

bool IsTerminal(JobStatus status) {
    return status == JobStatus::Succeeded || status == JobStatus::Failed || status == JobStatus::Skipped;
}

JobQueue::JobQueue() : next_id_(1) {}

std::optional<std::uint64_t> JobQueue::Add(const std::filesystem::path& input_path,
                                           const std::string& duration_label) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool duplicate = std::any_of(jobs_.begin(), jobs_.end(), [&input_path](const Job& job) {
        return job.input_path == input_path || job.input_path.stem() == input_path.stem();
    });
    if (duplicate) {
        return std::nullopt;
    }

    Job job;
    job.id = next_id_++;
    job.input_path = input_path;
    job.duration_label = duration_label;
    jobs_.push_back(job);
    return job.id;
}

bool JobQueue::Remove(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(jobs_.begin(), jobs_.end(), [id](const Job& job) { return job.id == id; });
    if (it == jobs_.end() || it->status == JobStatus::Running) {
        return false;
    }
    jobs_.erase(it);
    return true;
}

bool JobQueue::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool running = std::any_of(jobs_.begin(), jobs_.end(), [](const Job& job) {
        return job.status == JobStatus::Running;
    });
    if (running) {
        return false;
    }
    jobs_.clear();
    return true;
}

std::vector<Job> JobQueue::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_;
}

std::optional<Job> JobQueue::Get(std::uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const Job& job : jobs_) {
        if (job.id == id) {
            return job;
        }
    }
    return std::nullopt;
}

std::size_t JobQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

bool JobQueue::Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.empty();
}

bool JobQueue::Contains(const std::filesystem::path& input_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(jobs_.begin(), jobs_.end(), [&input_path](const Job& job) {
        return job.input_path == input_path;
    });
}

std::optional<std::filesystem::path> JobQueue::OutputConflict(const std::filesystem::path& input_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const Job& job : jobs_) {
        if (job.input_path != input_path && job.input_path.stem() == input_path.stem()) {
            return job.input_path;
        }
    }
    return std::nullopt;
}

JobCounts JobQueue::Counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    JobCounts counts;
    for (const Job& job : jobs_) {
        switch (job.status) {
        case JobStatus::Queued:
            ++counts.queued;
            break;
        case JobStatus::Running:
            ++counts.running;
            break;
        case JobStatus::Succeeded:
            ++counts.succeeded;
            break;
        case JobStatus::Failed:
            ++counts.failed;
            break;
        case JobStatus::Skipped:
            ++counts.skipped;
            break;
        }
    }
    return counts;
}

void JobQueue::ResetForRun(const std::filesystem::path& output_dir, const std::string& output_extension) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (Job& job : jobs_) {
        std::filesystem::path output = output_dir / job.input_path.filename();
        output.replace_extension(output_extension);
        job.output_path = output;
        job.status = JobStatus::Queued;
        job.error.clear();
    }
}

std::optional<Job> JobQueue::NextQueued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const Job& job : jobs_) {
        if (job.status == JobStatus::Queued) {
            return job;
        }
    }
    return std::nullopt;
}

void JobQueue::MarkRunning(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (Job* job = Find(id)) {
        job->status = JobStatus::Running;
        job->error.clear();
    }
}

void JobQueue::MarkSucceeded(std::uint64_t id, const std::filesystem::path& output_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (Job* job = Find(id)) {
        job->status = JobStatus::Succeeded;
        job->output_path = output_path;
        job->error.clear();
    }
}

void JobQueue::MarkFailed(std::uint64_t id, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (Job* job = Find(id)) {
        job->status = JobStatus::Failed;
        job->error = error;
    }
}

void JobQueue::MarkSkipped(std::uint64_t id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (Job* job = Find(id)) {
        job->status = JobStatus::Skipped;
        job->error = reason;
    }
}

std::size_t JobQueue::SkipUnfinished(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t changed = 0;
    for (Job& job : jobs_) {
        if (job.status == JobStatus::Queued || job.status == JobStatus::Running) {
            job.status = JobStatus::Skipped;
            job.error = reason;
            ++changed;
        }
    }
    return changed;
}

Job* JobQueue::Find(std::uint64_t id) {
    for (Job& job : jobs_) {
        if (job.id == id) {
            return &job;
        }
    }
    return nullptr;
}
