#include "converter/TagMapper.hpp"

#include <cctype>
#include <sstream>

namespace {
struct FieldMapping {
    const char* opus_key;
    // Looked up when opus_key is absent; may be null.
    const char* fallback_key;
    const char* id3_key;
};

// libavformat's Ogg demuxer already renames TRACKNUMBER to "track".
const FieldMapping kFieldMappings[] = {
    {"title", nullptr, "title"},
    {"artist", nullptr, "artist"},
    {"album", nullptr, "album"},
    {"genre", nullptr, "genre"},
    {"track", "tracknumber", "track"},
};

std::string Trim(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

std::vector<std::string> SplitValues(const std::string& joined) {
    std::vector<std::string> values;
    std::istringstream in(joined);
    std::string part;
    while (std::getline(in, part, ';')) {
        part = Trim(part);
        if (!part.empty()) {
            values.push_back(part);
        }
    }
    return values;
}

bool IsYear(const std::string& value) {
    if (value.empty() || value.size() > 10) {
        return false;
    }
    std::size_t i = 0;
    if (value[0] == '+' || value[0] == '-') {
        i = 1;
    }
    if (i == value.size()) {
        return false;
    }
    for (; i < value.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(value[i])) == 0) {
            return false;
        }
    }
    return true;
}
} // namespace

TagMapping MapOpusTags(const std::map<std::string, std::string>& opus_tags,
                       const std::string& source_name) {
    TagMapping mapping;

    for (const FieldMapping& field : kFieldMappings) {
        auto it = opus_tags.find(field.opus_key);
        if (it == opus_tags.end() && field.fallback_key != nullptr) {
            it = opus_tags.find(field.fallback_key);
        }
        if (it == opus_tags.end()) {
            continue;
        }
        const std::string value = Trim(it->second);
        if (!value.empty()) {
            mapping.tags.emplace_back(field.id3_key, value);
        }
    }

    auto date = opus_tags.find("date");
    if (date != opus_tags.end()) {
        std::string years;
        for (const std::string& value : SplitValues(date->second)) {
            if (!IsYear(value)) {
                mapping.warnings.push_back("Invalid date format in " + source_name + ": '" + value +
                                           "'. Skipping this date value.");
                continue;
            }
            // Leading '+' and zeros are dropped the way an integer round trip would.
            const std::string year = std::to_string(std::stoll(value));
            years += years.empty() ? year : ";" + year;
        }
        if (!years.empty()) {
            mapping.tags.emplace_back("date", years);
        }
    }

    return mapping;
}
