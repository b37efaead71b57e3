#ifndef CONVERTER_FFMPEG_COMMAND_HPP
#define CONVERTER_FFMPEG_COMMAND_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "converter/ConversionSettings.hpp"

// Values reported by the first loudnorm pass (print_format=json).
struct LoudnormStats {
    double input_i = 0.0;
    double input_tp = 0.0;
    double input_lra = 0.0;
    double input_thresh = 0.0;
    double target_offset = 0.0;
    std::string normalization_type;
};

// What goes into the output container besides the audio stream.
struct OutputMetadata {
    std::vector<std::pair<std::string, std::string>> tags;
    bool map_cover_art = false;
};

// Formats a filter value the way ffmpeg prints it (two decimals).
std::string FormatFilterNumber(double value);

// "loudnorm=I=..:LRA=..:TP=.." plus the measured values when stats are given.
std::string LoudnormFilter(const LoudnormTarget& target, const LoudnormStats* stats);

// First pass: analyse only, writes nothing.
std::vector<std::string> BuildMeasureCommand(const ConversionSettings& settings,
                                             const std::filesystem::path& input);

// Second pass: encode to output. stats is applied when loudness normalization
// is enabled. encoder_args select the codec and rate control.
std::vector<std::string> BuildTranscodeCommand(const ConversionSettings& settings,
                                               const std::filesystem::path& input,
                                               const std::filesystem::path& output,
                                               const std::optional<LoudnormStats>& stats,
                                               const OutputMetadata& metadata,
                                               const std::vector<std::string>& encoder_args);

// Extracts the loudnorm JSON block from ffmpeg's stderr.
// Throws std::runtime_error when it is missing or malformed.
LoudnormStats ParseLoudnormStats(const std::string& ffmpeg_stderr);

// Reads "out_time_us=" / "out_time_ms=" lines from -progress output.
// Returns the position in seconds, or nothing for other lines.
std::optional<double> ParseProgressSeconds(const std::string& line);

#endif // CONVERTER_FFMPEG_COMMAND_HPP
