#ifndef CONVERTER_CONVERSION_SETTINGS_HPP
#define CONVERTER_CONVERSION_SETTINGS_HPP

#include <string>

// Loudness targets handed to ffmpeg's loudnorm filter.
struct LoudnormTarget {
    double integrated = -12.0; // I, LUFS
    double range = 11.0;       // LRA, LU
    double true_peak = -1.5;   // TP, dBTP
};

struct ConversionSettings {
    std::string ffmpeg_path = "ffmpeg";

    bool loudnorm_enabled = true;
    LoudnormTarget loudnorm;

    // LAME VBR quality, 0 (best) to 9. Ignored when use_cbr is set.
    int mp3_quality = 0;
    bool use_cbr = false;
    int mp3_bitrate_kbps = 320;
    int sample_rate = 48000;

    bool copy_tags = true;
    bool copy_cover_art = true;
};

#endif // CONVERTER_CONVERSION_SETTINGS_HPP
