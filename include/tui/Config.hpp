#ifndef TUI_CONFIG_HPP
#define TUI_CONFIG_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "converter/ConversionSettings.hpp"

// Lightweight YAML-like loader for converter options.
// Parses simple "key: value" lines, ignoring comments (#) and blank lines.
class ConverterConfig {
public:
    bool LoadFromFile(const std::filesystem::path& path);

    // Accessors with defaults.
    std::string GetString(const std::string& key, const std::string& fallback) const;
    int GetInt(const std::string& key, int fallback) const;
    double GetDouble(const std::string& key, double fallback) const;
    bool GetBool(const std::string& key, bool fallback) const;

    // Mutators.
    void SetString(const std::string& key, const std::string& value);
    void SetInt(const std::string& key, int value);
    void SetDouble(const std::string& key, double value);
    void SetBool(const std::string& key, bool value);

    // Persist the current values to disk, one "key: value" per line sorted by key.
    bool SaveToFile(const std::filesystem::path& path) const;

private:
    std::map<std::string, std::string> values_;
};

// Numbers in the file always use '.' decimals, independent of the process locale.
std::string FormatConfigNumber(double value);
// Nothing unless the whole text is one number.
std::optional<double> ParseConfigNumber(const std::string& text);

// Conversion settings with every missing key taken from ConversionSettings{}.
ConversionSettings SettingsFromConfig(const ConverterConfig& config);

#endif // TUI_CONFIG_HPP
