#include "converter/MediaProbe.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <memory>
#include <mutex>
#include <stdexcept>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/log.h>
}

namespace {
struct InputCloser {
    void operator()(AVFormatContext* ctx) const {
        avformat_close_input(&ctx);
    }
};

using InputContext = std::unique_ptr<AVFormatContext, InputCloser>;

void SilenceLibav() {
    // libav would otherwise print straight over the terminal UI.
    static std::once_flag once;
    std::call_once(once, []() { av_log_set_level(AV_LOG_QUIET); });
}

std::string Lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void CollectTags(const AVDictionary* dict, std::map<std::string, std::string>& tags) {
    const AVDictionaryEntry* entry = nullptr;
    while ((entry = av_dict_get(dict, "", entry, AV_DICT_IGNORE_SUFFIX)) != nullptr) {
        tags[Lowercase(entry->key)] = entry->value;
    }
}
} // namespace

MediaInfo ProbeMedia(const std::filesystem::path& path) {
    SilenceLibav();

    AVFormatContext* raw_ctx = nullptr;
    if (avformat_open_input(&raw_ctx, path.c_str(), nullptr, nullptr) < 0) {
        throw std::runtime_error("Could not open input file: " + path.string());
    }
    InputContext ctx(raw_ctx);

    if (avformat_find_stream_info(ctx.get(), nullptr) < 0) {
        throw std::runtime_error("Could not find stream information in " + path.string());
    }

    const int audio_index = av_find_best_stream(ctx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_index < 0) {
        throw std::runtime_error("No audio stream found in " + path.string());
    }

    MediaInfo info;
    if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
        info.duration_seconds = static_cast<double>(ctx->duration) / AV_TIME_BASE;
    } else {
        const AVStream* audio = ctx->streams[audio_index];
        if (audio->duration != AV_NOPTS_VALUE && audio->duration > 0) {
            info.duration_seconds = static_cast<double>(audio->duration) * av_q2d(audio->time_base);
        }
    }

    // Ogg keeps comments on the stream; other containers on the format context.
    CollectTags(ctx->metadata, info.tags);
    CollectTags(ctx->streams[audio_index]->metadata, info.tags);

    for (unsigned i = 0; i < ctx->nb_streams; ++i) {
        if ((ctx->streams[i]->disposition & AV_DISPOSITION_ATTACHED_PIC) != 0) {
            info.has_cover_art = true;
            break;
        }
    }

    return info;
}

std::string FormatDuration(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return "--:--";
    }
    const long long total = static_cast<long long>(seconds);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld", total / 60, total % 60);
    return buffer;
}

std::string DurationLabel(const std::filesystem::path& path) {
    try {
        return FormatDuration(ProbeMedia(path).duration_seconds);
    } catch (const std::runtime_error&) {
        return "--:--";
    }
}
