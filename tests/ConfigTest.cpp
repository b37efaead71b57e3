#include <gtest/gtest.h>

#include "tui/Config.hpp"
#include "TestUtil.hpp"

TEST(ConfigTest, LoadsKeyValueLines) {
    TempDir dir;
    const std::filesystem::path file = dir.Path() / "converter.yml";
    WriteTextFile(file,
                  "# comment\n"
                  "\n"
                  "input_folder:  /music/in  \n"
                  "mp3_quality: 4\n"
                  "loudnorm_i: -16.5\n"
                  "copy_tags: no\n"
                  "not a pair\n");

    ConverterConfig config;
    ASSERT_TRUE(config.LoadFromFile(file));
    EXPECT_EQ(config.GetString("input_folder", ""), "/music/in");
    EXPECT_EQ(config.GetInt("mp3_quality", 0), 4);
    EXPECT_DOUBLE_EQ(config.GetDouble("loudnorm_i", 0.0), -16.5);
    EXPECT_FALSE(config.GetBool("copy_tags", true));
    EXPECT_EQ(config.GetString("not a pair", "absent"), "absent");
}

TEST(ConfigTest, FallsBackOnMissingOrMalformedValues) {
    ConverterConfig config;
    config.SetString("mp3_quality", "best");
    config.SetString("copy_tags", "maybe");
    EXPECT_EQ(config.GetInt("mp3_quality", 2), 2);
    EXPECT_TRUE(config.GetBool("copy_tags", true));
    EXPECT_EQ(config.GetString("missing", "x"), "x");
    EXPECT_DOUBLE_EQ(config.GetDouble("missing", 1.5), 1.5);
}

TEST(ConfigTest, MissingFileIsReported) {
    TempDir dir;
    ConverterConfig config;
    EXPECT_FALSE(config.LoadFromFile(dir.Path() / "absent.yml"));
}

TEST(ConfigTest, SaveCreatesDirectoryAndRoundTrips) {
    TempDir dir;
    const std::filesystem::path file = dir.Path() / "nested" / "converter.yml";

    ConverterConfig config;
    config.SetString("output_folder", "/music/out");
    config.SetInt("mp3_bitrate_kbps", 192);
    config.SetDouble("loudnorm_tp", -1.5);
    config.SetBool("mp3_use_cbr", true);
    ASSERT_TRUE(config.SaveToFile(file));

    const std::vector<std::string> lines = ReadLines(file);
    const std::vector<std::string> expected{
        "loudnorm_tp: -1.5",
        "mp3_bitrate_kbps: 192",
        "mp3_use_cbr: true",
        "output_folder: /music/out",
    };
    EXPECT_EQ(lines, expected);

    ConverterConfig reloaded;
    ASSERT_TRUE(reloaded.LoadFromFile(file));
    EXPECT_EQ(reloaded.GetInt("mp3_bitrate_kbps", 0), 192);
    EXPECT_TRUE(reloaded.GetBool("mp3_use_cbr", false));
}

TEST(ConfigTest, SettingsUseDefaultsForMissingKeys) {
    ConverterConfig config;
    const ConversionSettings settings = SettingsFromConfig(config);
    EXPECT_EQ(settings.ffmpeg_path, "ffmpeg");
    EXPECT_TRUE(settings.loudnorm_enabled);
    EXPECT_DOUBLE_EQ(settings.loudnorm.integrated, -12.0);
    EXPECT_DOUBLE_EQ(settings.loudnorm.range, 11.0);
    EXPECT_DOUBLE_EQ(settings.loudnorm.true_peak, -1.5);
    EXPECT_EQ(settings.mp3_quality, 0);
    EXPECT_EQ(settings.sample_rate, 48000);
}

TEST(ConfigTest, SettingsReadConfiguredValues) {
    ConverterConfig config;
    config.SetString("ffmpeg_path", "");
    config.SetBool("loudnorm_enabled", false);
    config.SetBool("mp3_use_cbr", true);
    config.SetInt("mp3_bitrate_kbps", 256);
    config.SetInt("sample_rate", 0);
    config.SetBool("copy_cover_art", false);

    const ConversionSettings settings = SettingsFromConfig(config);
    EXPECT_EQ(settings.ffmpeg_path, "ffmpeg");
    EXPECT_FALSE(settings.loudnorm_enabled);
    EXPECT_TRUE(settings.use_cbr);
    EXPECT_EQ(settings.mp3_bitrate_kbps, 256);
    EXPECT_EQ(settings.sample_rate, 48000);
    EXPECT_FALSE(settings.copy_cover_art);
    EXPECT_TRUE(settings.copy_tags);
}

TEST(ConfigTest, NumbersIgnoreCommaDecimalLocale) {
    CommaDecimalLocale locale;
    if (!locale.Active()) {
        GTEST_SKIP() << "no comma-decimal locale installed";
    }

    TempDir dir;
    const std::filesystem::path file = dir.Path() / "converter.yml";
    ConverterConfig config;
    config.SetDouble("loudnorm_i", -16.5);
    ASSERT_TRUE(config.SaveToFile(file));
    EXPECT_EQ(ReadLines(file), std::vector<std::string>{"loudnorm_i: -16.5"});

    ConverterConfig reloaded;
    ASSERT_TRUE(reloaded.LoadFromFile(file));
    EXPECT_DOUBLE_EQ(reloaded.GetDouble("loudnorm_i", 0.0), -16.5);
    EXPECT_FALSE(ParseConfigNumber("-16,5").has_value());
}

TEST(ConfigTest, ParsesWholeNumbersOnly) {
    EXPECT_DOUBLE_EQ(ParseConfigNumber(" -1.5 ").value_or(0.0), -1.5);
    EXPECT_FALSE(ParseConfigNumber("1.5dB").has_value());
    EXPECT_FALSE(ParseConfigNumber("").has_value());
    EXPECT_EQ(FormatConfigNumber(48000), "48000");
}
