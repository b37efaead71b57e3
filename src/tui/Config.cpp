#include "tui/Config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <locale>
#include <sstream>
#include <filesystem>

namespace {
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
}

std::string FormatConfigNumber(double value) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << value;
    return out.str();
}

std::optional<double> ParseConfigNumber(const std::string& text) {
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

bool ConverterConfig::LoadFromFile(const std::filesystem::path& path) {
    values_.clear();
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        const std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        const std::size_t colon = trimmed.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = Trim(trimmed.substr(0, colon));
        std::string value = Trim(trimmed.substr(colon + 1));
        values_[key] = value;
    }

    return true;
}

std::string ConverterConfig::GetString(const std::string& key, const std::string& fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    return it->second;
}

int ConverterConfig::GetInt(const std::string& key, int fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    try {
        return std::stoi(it->second);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ConverterConfig::GetDouble(const std::string& key, double fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    return ParseConfigNumber(it->second).value_or(fallback);
}

bool ConverterConfig::GetBool(const std::string& key, bool fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "1" || v == "on") {
        return true;
    }
    if (v == "false" || v == "no" || v == "0" || v == "off") {
        return false;
    }
    return fallback;
}

void ConverterConfig::SetString(const std::string& key, const std::string& value) {
    values_[key] = value;
}

void ConverterConfig::SetInt(const std::string& key, int value) {
    values_[key] = std::to_string(value);
}

void ConverterConfig::SetDouble(const std::string& key, double value) {
    values_[key] = FormatConfigNumber(value);
}

void ConverterConfig::SetBool(const std::string& key, bool value) {
    values_[key] = value ? "true" : "false";
}

bool ConverterConfig::SaveToFile(const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path);
    if (!out.is_open()) {
        return false;
    }
    for (const auto& kv : values_) {
        out << kv.first << ": " << kv.second << "\n";
    }
    return static_cast<bool>(out);
}

ConversionSettings SettingsFromConfig(const ConverterConfig& config) {
    const ConversionSettings defaults;
    ConversionSettings settings;
    settings.ffmpeg_path = config.GetString("ffmpeg_path", defaults.ffmpeg_path);
    if (settings.ffmpeg_path.empty()) {
        settings.ffmpeg_path = defaults.ffmpeg_path;
    }
    settings.loudnorm_enabled = config.GetBool("loudnorm_enabled", defaults.loudnorm_enabled);
    settings.loudnorm.integrated = config.GetDouble("loudnorm_i", defaults.loudnorm.integrated);
    settings.loudnorm.range = config.GetDouble("loudnorm_lra", defaults.loudnorm.range);
    settings.loudnorm.true_peak = config.GetDouble("loudnorm_tp", defaults.loudnorm.true_peak);
    settings.mp3_quality = config.GetInt("mp3_quality", defaults.mp3_quality);
    settings.use_cbr = config.GetBool("mp3_use_cbr", defaults.use_cbr);
    settings.mp3_bitrate_kbps = config.GetInt("mp3_bitrate_kbps", defaults.mp3_bitrate_kbps);
    settings.sample_rate = config.GetInt("sample_rate", defaults.sample_rate);
    if (settings.sample_rate <= 0) {
        settings.sample_rate = defaults.sample_rate;
    }
    settings.copy_tags = config.GetBool("copy_tags", defaults.copy_tags);
    settings.copy_cover_art = config.GetBool("copy_cover_art", defaults.copy_cover_art);
    return settings;
}
