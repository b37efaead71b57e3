#include "converter/OpusToMp3Converter.hpp"

#include <algorithm>
#include <string>
#include <utility>

OpusToMp3Converter::OpusToMp3Converter(ConversionSettings settings)
    : AudioConverter(std::move(settings)) {}

std::string OpusToMp3Converter::OutputExtension() const {
    return ".mp3";
}

std::vector<std::string> OpusToMp3Converter::EncoderArguments() const {
    std::vector<std::string> args{"-codec:a", "libmp3lame"};
    if (settings_.use_cbr) {
        // LAME accepts 8..320 kbps for MPEG-1/2 layer III.
        const int kbps = std::clamp(settings_.mp3_bitrate_kbps, 8, 320);
        args.push_back("-b:a");
        args.push_back(std::to_string(kbps) + "k");
    } else {
        args.push_back("-q:a");
        args.push_back(std::to_string(std::clamp(settings_.mp3_quality, 0, 9)));
    }
    return args;
}

bool OpusToMp3Converter::ShouldConvertFile(const std::string& extension) const {
    return extension == ".opus";
}
