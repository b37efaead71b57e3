#ifndef OPUS_TO_MP3_CONVERTER_HPP
#define OPUS_TO_MP3_CONVERTER_HPP

#include "converter/AudioConverter.hpp"

// Concrete converter that transcodes Opus input to MP3 with libmp3lame.
class OpusToMp3Converter : public AudioConverter {
public:
    explicit OpusToMp3Converter(ConversionSettings settings);
    ~OpusToMp3Converter() override = default;

    std::string OutputExtension() const override;

protected:
    std::vector<std::string> EncoderArguments() const override;
    bool ShouldConvertFile(const std::string& extension) const override;
};

#endif // OPUS_TO_MP3_CONVERTER_HPP
