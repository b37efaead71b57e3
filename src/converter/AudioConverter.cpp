#include "converter/AudioConverter.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

#include "converter/Process.hpp"
#include "converter/TagMapper.hpp"

namespace {
std::string TrimTrailingSpace(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

// Hidden sibling of the target. It keeps the extension so ffmpeg still picks
// the muxer from the name.
std::filesystem::path StagingPathFor(const std::filesystem::path& output_path) {
    return output_path.parent_path() / ("." + output_path.stem().string() + ".partial" +
                                        output_path.extension().string());
}
} // namespace

ConversionError::ConversionError(const std::string& message, std::string diagnostic)
    : std::runtime_error(message),
      diagnostic_(TrimTrailingSpace(std::move(diagnostic))) {}

ConversionCancelled::ConversionCancelled()
    : std::runtime_error("Conversion cancelled") {}

AudioConverter::AudioConverter(ConversionSettings settings)
    : settings_(std::move(settings)),
      cancel_flag_(nullptr) {}

AudioConverter::~AudioConverter() = default;

void AudioConverter::SetProgressCallback(std::function<void(double)> callback) {
    progress_cb_ = std::move(callback);
}

void AudioConverter::SetLogCallback(std::function<void(LogType, const std::string&)> callback) {
    log_cb_ = std::move(callback);
}

void AudioConverter::SetCancelFlag(const std::atomic<bool>* cancel_flag) {
    cancel_flag_ = cancel_flag;
}

void AudioConverter::Log(LogType type, const std::string& message) const {
    if (log_cb_) {
        log_cb_(type, message);
    }
}

std::filesystem::path AudioConverter::OutputPathFor(const std::filesystem::path& input_path,
                                                    const std::filesystem::path& output_dir) const {
    std::filesystem::path output = output_dir / input_path.filename();
    output.replace_extension(OutputExtension());
    return output;
}

bool AudioConverter::AcceptsInput(const std::filesystem::path& path) const {
    return ShouldConvertFile(path.extension().string());
}

std::vector<std::filesystem::path> AudioConverter::CollectInputs(const std::filesystem::path& dir) const {
    std::vector<std::filesystem::path> inputs;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return inputs;
    }
    for (const std::filesystem::directory_entry& entry : it) {
        if (entry.is_regular_file(ec) && AcceptsInput(entry.path())) {
            inputs.push_back(entry.path());
        }
    }
    std::sort(inputs.begin(), inputs.end());
    return inputs;
}

std::filesystem::path AudioConverter::ConvertFile(const std::filesystem::path& input_path,
                                                  const std::filesystem::path& output_dir) {
    const std::string source_name = input_path.filename().string();
    if (!std::filesystem::is_regular_file(input_path)) {
        throw ConversionError("Input file not found: " + input_path.string());
    }

    const std::filesystem::path output_path = OutputPathFor(input_path, output_dir);
    if (std::filesystem::exists(output_path)) {
        Log(LogType::Overwriting, output_path.filename().string() + "...");
    } else {
        Log(LogType::Converting, source_name + "...");
    }

    const std::optional<MediaInfo> info = Probe(input_path);
    const OutputMetadata metadata = BuildMetadata(info, source_name);

    std::optional<LoudnormStats> stats;
    if (settings_.loudnorm_enabled) {
        stats = MeasureLoudness(input_path);
    }

    Transcode(input_path, output_path, stats, metadata, info ? info->duration_seconds : -1.0);

    if (!metadata.tags.empty()) {
        Log(LogType::Info, "Copied tags from " + source_name + " to " + output_path.filename().string() + ".");
    }
    if (metadata.map_cover_art) {
        Log(LogType::Info, "Copied cover art to " + output_path.filename().string() + ".");
    }
    Log(LogType::Finished, source_name + ".");
    return output_path;
}

std::optional<MediaInfo> AudioConverter::Probe(const std::filesystem::path& input_path) const {
    try {
        return ProbeMedia(input_path);
    } catch (const std::runtime_error& e) {
        Log(LogType::Warning, std::string("Could not read tags: ") + e.what());
        return std::nullopt;
    }
}

OutputMetadata AudioConverter::BuildMetadata(const std::optional<MediaInfo>& info,
                                             const std::string& source_name) const {
    OutputMetadata metadata;
    if (!info) {
        return metadata;
    }

    if (settings_.copy_tags) {
        if (info->tags.empty()) {
            Log(LogType::Warning, "No tags found in " + source_name + ".");
        }
        TagMapping mapping = MapOpusTags(info->tags, source_name);
        for (const std::string& warning : mapping.warnings) {
            Log(LogType::Warning, warning);
        }
        metadata.tags = std::move(mapping.tags);
    }
    if (settings_.copy_cover_art) {
        metadata.map_cover_art = info->has_cover_art;
    }
    return metadata;
}

LoudnormStats AudioConverter::MeasureLoudness(const std::filesystem::path& input_path) {
    const ProcessResult result = RunProcess(BuildMeasureCommand(settings_, input_path), cancel_flag_);
    if (result.cancelled) {
        throw ConversionCancelled();
    }
    if (result.exit_code != 0) {
        throw ConversionError("First pass failed: ffmpeg returned non-zero exit code " +
                                  std::to_string(result.exit_code) + ".",
                              result.standard_error);
    }
    try {
        return ParseLoudnormStats(result.standard_error);
    } catch (const std::runtime_error& e) {
        throw ConversionError(std::string("First pass failed: ") + e.what(), result.standard_error);
    }
}

void AudioConverter::Transcode(const std::filesystem::path& input_path,
                               const std::filesystem::path& output_path,
                               const std::optional<LoudnormStats>& stats,
                               const OutputMetadata& metadata,
                               double duration_seconds) {
    // ffmpeg writes next to the target; an existing file is only replaced by a
    // complete conversion.
    const std::filesystem::path staging_path = StagingPathFor(output_path);
    const std::vector<std::string> command =
        BuildTranscodeCommand(settings_, input_path, staging_path, stats, metadata, EncoderArguments());

    std::function<void(const std::string&)> on_line;
    if (progress_cb_ && duration_seconds > 0.0) {
        on_line = [this, duration_seconds](const std::string& line) {
            const std::optional<double> position = ParseProgressSeconds(line);
            if (position) {
                progress_cb_(std::min(1.0, *position / duration_seconds));
            }
        };
    }

    const ProcessResult result = RunProcess(command, cancel_flag_, on_line);
    if (result.cancelled) {
        RemovePartialOutput(staging_path);
        throw ConversionCancelled();
    }
    if (result.exit_code != 0) {
        RemovePartialOutput(staging_path);
        throw ConversionError("Converting " + input_path.filename().string() +
                                  ". ffmpeg returned non-zero exit code " + std::to_string(result.exit_code) + ".",
                              result.standard_error);
    }

    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(staging_path, ec);
    if (ec || size == 0) {
        RemovePartialOutput(staging_path);
        throw ConversionError("ffmpeg produced no output for " + input_path.filename().string() + ".",
                              result.standard_error);
    }

    std::filesystem::rename(staging_path, output_path, ec);
    if (ec) {
        RemovePartialOutput(staging_path);
        throw ConversionError("Could not write " + output_path.string() + ": " + ec.message() + ".");
    }

    if (progress_cb_) {
        progress_cb_(1.0);
    }
}

void AudioConverter::RemovePartialOutput(const std::filesystem::path& staging_path) const {
    std::error_code ec;
    std::filesystem::remove(staging_path, ec);
    if (ec) {
        Log(LogType::Warning, "Could not remove " + staging_path.string() + ": " + ec.message());
    }
}
