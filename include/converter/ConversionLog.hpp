#ifndef CONVERTER_CONVERSION_LOG_HPP
#define CONVERTER_CONVERSION_LOG_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

enum class LogType {
    Overwriting,
    Converting,
    Finished,
    Error,
    Warning,
    Info
};

// Upper-case label shown in front of every entry ("FINISHED", "ERROR", ...).
const char* LogTypeName(LogType type);
// Display colour as 0xRRGGBB.
std::uint32_t LogTypeColor(LogType type);

struct LogEntry {
    LogType type;
    std::string message;
};

// Thread-safe, bounded log shared by the conversion worker and the UI.
// Only the most recent entries are kept; an optional stream receives every entry
// with a timestamp.
class ConversionLog {
public:
    explicit ConversionLog(std::size_t capacity = 500);

    void Append(LogType type, const std::string& message);
    void Clear();

    std::vector<LogEntry> Entries() const;
    std::size_t Size() const;

    // Not owned; pass nullptr to stop mirroring.
    void SetMirror(std::ostream* mirror);

private:
    void WriteMirror(const LogEntry& entry);

    mutable std::mutex mutex_;
    std::vector<LogEntry> entries_;
    std::size_t capacity_;
    std::ostream* mirror_;
};

#endif // CONVERTER_CONVERSION_LOG_HPP
