#ifndef CONVERTER_TAG_MAPPER_HPP
#define CONVERTER_TAG_MAPPER_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

struct TagMapping {
    // ffmpeg metadata keys and values for the MP3 muxer, in a stable order.
    std::vector<std::pair<std::string, std::string>> tags;
    std::vector<std::string> warnings;
};

// Maps Opus comments (keys lower-cased, as libavformat reports them) to ID3
// fields: title, artist, album, genre, track (or a raw tracknumber comment),
// and date restricted to whole years.
// Multi-valued comments arrive joined with ';'.
TagMapping MapOpusTags(const std::map<std::string, std::string>& opus_tags,
                       const std::string& source_name);

#endif // CONVERTER_TAG_MAPPER_HPP
