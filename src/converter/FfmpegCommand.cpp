#include "converter/FfmpegCommand.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
const char kStatsMissing[] = "Could not find loudnorm stats in FFmpeg output.";

// ffmpeg always prints and expects '.' decimals, whatever the process locale says.
std::optional<double> ParseClassicNumber(const std::string& text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "inf" || lowered == "+inf" || lowered == "infinity") {
        return std::numeric_limits<double>::infinity();
    }
    if (lowered == "-inf" || lowered == "-infinity") {
        return -std::numeric_limits<double>::infinity();
    }
    if (lowered == "nan" || lowered == "-nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }

    std::istringstream in(text);
    in.imbue(std::locale::classic());
    double value = 0.0;
    in >> value;
    if (in.fail()) {
        return std::nullopt;
    }
    in >> std::ws;
    if (!in.eof()) {
        return std::nullopt;
    }
    return value;
}

double ReadStat(const json& stats, const char* key) {
    if (!stats.contains(key)) {
        throw std::runtime_error(std::string("Loudnorm stats lack \"") + key + "\".");
    }
    const json& value = stats.at(key);
    if (value.is_number()) {
        return value.get<double>();
    }
    if (!value.is_string()) {
        throw std::runtime_error(std::string("Loudnorm stat \"") + key + "\" is not a number.");
    }
    const std::string text = value.get<std::string>();
    const std::optional<double> number = ParseClassicNumber(text);
    if (!number) {
        throw std::runtime_error(std::string("Loudnorm stat \"") + key + "\" is not a number: " + text);
    }
    return *number;
}

bool AllFinite(const LoudnormStats& stats) {
    return std::isfinite(stats.input_i) && std::isfinite(stats.input_tp) &&
           std::isfinite(stats.input_lra) && std::isfinite(stats.input_thresh) &&
           std::isfinite(stats.target_offset);
}

std::optional<double> ParseNumberAfter(const std::string& line, const std::string& prefix) {
    if (line.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    const std::string value = line.substr(prefix.size());
    if (value.empty() || value == "N/A") {
        return std::nullopt;
    }
    return ParseClassicNumber(value);
}
} // namespace

std::string FormatFilterNumber(double value) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::fixed << std::setprecision(2) << value;
    return out.str();
}

std::string LoudnormFilter(const LoudnormTarget& target, const LoudnormStats* stats) {
    std::string filter = "loudnorm=I=" + FormatFilterNumber(target.integrated) +
                         ":LRA=" + FormatFilterNumber(target.range) +
                         ":TP=" + FormatFilterNumber(target.true_peak);
    // Silent input measures as -inf; ffmpeg rejects that, so fall back to single-pass.
    if (stats == nullptr || !AllFinite(*stats)) {
        return filter;
    }
    filter += ":measured_I=" + FormatFilterNumber(stats->input_i) +
              ":measured_LRA=" + FormatFilterNumber(stats->input_lra) +
              ":measured_TP=" + FormatFilterNumber(stats->input_tp) +
              ":measured_thresh=" + FormatFilterNumber(stats->input_thresh) +
              ":offset=" + FormatFilterNumber(stats->target_offset);
    if (stats->normalization_type == "dynamic") {
        filter += ":linear=true";
    }
    return filter;
}

std::vector<std::string> BuildMeasureCommand(const ConversionSettings& settings,
                                             const std::filesystem::path& input) {
    return {
        settings.ffmpeg_path,
        "-hide_banner",
        "-nostdin",
        "-i",
        input.string(),
        "-af",
        LoudnormFilter(settings.loudnorm, nullptr) + ":print_format=json",
        "-f",
        "null",
        "-",
    };
}

std::vector<std::string> BuildTranscodeCommand(const ConversionSettings& settings,
                                               const std::filesystem::path& input,
                                               const std::filesystem::path& output,
                                               const std::optional<LoudnormStats>& stats,
                                               const OutputMetadata& metadata,
                                               const std::vector<std::string>& encoder_args) {
    std::vector<std::string> command{
        settings.ffmpeg_path,
        "-hide_banner",
        "-nostdin",
        "-y",
        "-i",
        input.string(),
        "-map",
        "0:a:0",
    };

    if (metadata.map_cover_art) {
        command.insert(command.end(), {
            "-map", "0:v:0",
            "-c:v", "copy",
            "-disposition:v:0", "attached_pic",
            "-metadata:s:v", "title=Cover",
            "-metadata:s:v", "comment=Cover (front)",
        });
    }

    command.insert(command.end(), {"-map_metadata", "-1"});
    for (const auto& tag : metadata.tags) {
        command.push_back("-metadata");
        command.push_back(tag.first + "=" + tag.second);
    }

    if (settings.loudnorm_enabled) {
        command.push_back("-af");
        command.push_back(LoudnormFilter(settings.loudnorm, stats.has_value() ? &*stats : nullptr));
    }

    command.insert(command.end(), encoder_args.begin(), encoder_args.end());
    command.insert(command.end(), {
        "-ar", std::to_string(settings.sample_rate),
        "-progress", "pipe:1",
        "-nostats",
        output.string(),
    });
    return command;
}

LoudnormStats ParseLoudnormStats(const std::string& ffmpeg_stderr) {
    // The JSON block follows the "[Parsed_loudnorm_N @ ...]" banner; fall back to
    // the first brace when the banner is absent.
    std::size_t search_from = ffmpeg_stderr.find("[Parsed_loudnorm");
    if (search_from == std::string::npos) {
        search_from = 0;
    }
    const std::size_t json_start = ffmpeg_stderr.find('{', search_from);
    const std::size_t json_end = ffmpeg_stderr.rfind('}');
    if (json_start == std::string::npos || json_end == std::string::npos || json_end < json_start) {
        throw std::runtime_error(kStatsMissing);
    }

    json parsed;
    try {
        parsed = json::parse(ffmpeg_stderr.substr(json_start, json_end - json_start + 1));
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string(kStatsMissing) + " " + e.what());
    }
    if (!parsed.is_object()) {
        throw std::runtime_error(kStatsMissing);
    }

    LoudnormStats stats;
    stats.input_i = ReadStat(parsed, "input_i");
    stats.input_tp = ReadStat(parsed, "input_tp");
    stats.input_lra = ReadStat(parsed, "input_lra");
    stats.input_thresh = ReadStat(parsed, "input_thresh");
    stats.target_offset = ReadStat(parsed, "target_offset");
    stats.normalization_type = parsed.value("normalization_type", std::string());
    return stats;
}

std::optional<double> ParseProgressSeconds(const std::string& line) {
    // ffmpeg reports microseconds under both keys.
    std::optional<double> micros = ParseNumberAfter(line, "out_time_us=");
    if (!micros) {
        micros = ParseNumberAfter(line, "out_time_ms=");
    }
    if (!micros || *micros < 0.0) {
        return std::nullopt;
    }
    return *micros / 1'000'000.0;
}
