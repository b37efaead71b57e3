#include "converter/ConversionLog.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>

const char* LogTypeName(LogType type) {
    switch (type) {
    case LogType::Overwriting:
        return "OVERWRITING";
    case LogType::Converting:
        return "CONVERTING";
    case LogType::Finished:
        return "FINISHED";
    case LogType::Error:
        return "ERROR";
    case LogType::Warning:
        return "WARNING";
    case LogType::Info:
        return "INFO";
    }
    return "INFO";
}

std::uint32_t LogTypeColor(LogType type) {
    switch (type) {
    case LogType::Overwriting:
        return 0xBF00E1;
    case LogType::Converting:
        return 0x0000FF;
    case LogType::Finished:
        return 0x008000;
    case LogType::Error:
        return 0xFF0000;
    case LogType::Warning:
        return 0xFFA500;
    case LogType::Info:
        return 0x333333;
    }
    return 0x333333;
}

ConversionLog::ConversionLog(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity),
      mirror_(nullptr) {}

void ConversionLog::Append(LogType type, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(LogEntry{type, message});
    if (entries_.size() > capacity_) {
        entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(entries_.size() - capacity_));
    }
    if (mirror_ != nullptr) {
        WriteMirror(entries_.back());
    }
}

void ConversionLog::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::vector<LogEntry> ConversionLog::Entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t ConversionLog::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ConversionLog::SetMirror(std::ostream* mirror) {
    std::lock_guard<std::mutex> lock(mutex_);
    mirror_ = mirror;
}

void ConversionLog::WriteMirror(const LogEntry& entry) {
    // Caller holds mutex_.
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    *mirror_ << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
             << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
             << " [" << LogTypeName(entry.type) << "] "
             << entry.message << "\n";
    mirror_->flush();
}
