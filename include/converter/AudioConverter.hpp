#ifndef AUDIO_CONVERTER_HPP
#define AUDIO_CONVERTER_HPP

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "converter/ConversionLog.hpp"
#include "converter/ConversionSettings.hpp"
#include "converter/FfmpegCommand.hpp"
#include "converter/MediaProbe.hpp"

// A conversion that ran ffmpeg and failed. diagnostic() holds what ffmpeg printed.
class ConversionError : public std::runtime_error {
public:
    ConversionError(const std::string& message, std::string diagnostic = {});

    const std::string& Diagnostic() const { return diagnostic_; }

private:
    std::string diagnostic_;
};

// The cancel flag was raised while ffmpeg was running.
class ConversionCancelled : public std::runtime_error {
public:
    ConversionCancelled();
};

// Abstract base for converters that drive an external ffmpeg.
// Derived classes pick the input filter, output extension and encoder options
// while the base runs the loudness pass, the transcoding pass and the metadata
// mapping.
class AudioConverter {
public:
    explicit AudioConverter(ConversionSettings settings);
    virtual ~AudioConverter();

    // Convert a single input file into output_dir; returns the written file.
    // Throws ToolNotFoundError, ConversionError or ConversionCancelled.
    std::filesystem::path ConvertFile(const std::filesystem::path& input_path,
                                      const std::filesystem::path& output_dir);

    // Where ConvertFile(input_path, output_dir) will write.
    std::filesystem::path OutputPathFor(const std::filesystem::path& input_path,
                                        const std::filesystem::path& output_dir) const;

    // Convertible files directly inside dir, sorted by name.
    std::vector<std::filesystem::path> CollectInputs(const std::filesystem::path& dir) const;

    bool AcceptsInput(const std::filesystem::path& path) const;

    // Extension of produced files, including the dot.
    virtual std::string OutputExtension() const = 0;

    void SetProgressCallback(std::function<void(double)> callback);
    void SetLogCallback(std::function<void(LogType, const std::string&)> callback);
    // Not owned; checked while ffmpeg runs.
    void SetCancelFlag(const std::atomic<bool>* cancel_flag);

protected:
    // Codec and rate-control arguments for the transcoding pass.
    virtual std::vector<std::string> EncoderArguments() const = 0;
    virtual bool ShouldConvertFile(const std::string& extension) const = 0;

    void Log(LogType type, const std::string& message) const;

    ConversionSettings settings_;

private:
    std::optional<MediaInfo> Probe(const std::filesystem::path& input_path) const;
    OutputMetadata BuildMetadata(const std::optional<MediaInfo>& info, const std::string& source_name) const;
    LoudnormStats MeasureLoudness(const std::filesystem::path& input_path);
    void Transcode(const std::filesystem::path& input_path,
                   const std::filesystem::path& output_path,
                   const std::optional<LoudnormStats>& stats,
                   const OutputMetadata& metadata,
                   double duration_seconds);
    void RemovePartialOutput(const std::filesystem::path& staging_path) const;

    std::function<void(double)> progress_cb_;
    std::function<void(LogType, const std::string&)> log_cb_;
    const std::atomic<bool>* cancel_flag_;
};

#endif // AUDIO_CONVERTER_HPP
