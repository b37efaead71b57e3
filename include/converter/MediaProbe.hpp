#ifndef CONVERTER_MEDIA_PROBE_HPP
#define CONVERTER_MEDIA_PROBE_HPP

#include <filesystem>
#include <map>
#include <string>

// What the converter needs to know about an input before running ffmpeg.
struct MediaInfo {
    double duration_seconds = -1.0;
    // Container and audio stream comments, keys lower-cased.
    std::map<std::string, std::string> tags;
    // An attached picture stream (Opus METADATA_BLOCK_PICTURE).
    bool has_cover_art = false;
};

// Opens the file with libavformat. Throws std::runtime_error when it cannot be
// opened or holds no audio stream.
MediaInfo ProbeMedia(const std::filesystem::path& path);

// "MM:SS"; minutes keep counting past 59. Negative or non-finite input gives "--:--".
std::string FormatDuration(double seconds);

// FormatDuration(ProbeMedia(path).duration_seconds), "--:--" on any failure.
std::string DurationLabel(const std::filesystem::path& path);

#endif // CONVERTER_MEDIA_PROBE_HPP
