#include <gtest/gtest.h>

#include <regex>
#include <sstream>

#include "converter/ConversionLog.hpp"

TEST(ConversionLogTest, KeepsAppendOrder) {
    ConversionLog log;
    log.Append(LogType::Converting, "a.opus...");
    log.Append(LogType::Finished, "a.opus.");

    const std::vector<LogEntry> entries = log.Entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].type, LogType::Converting);
    EXPECT_EQ(entries[0].message, "a.opus...");
    EXPECT_EQ(entries[1].type, LogType::Finished);
}

TEST(ConversionLogTest, DropsOldestBeyondCapacity) {
    ConversionLog log(3);
    for (int i = 0; i < 5; ++i) {
        log.Append(LogType::Info, std::to_string(i));
    }
    const std::vector<LogEntry> entries = log.Entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries.front().message, "2");
    EXPECT_EQ(entries.back().message, "4");
}

TEST(ConversionLogTest, ClearEmptiesTheLog) {
    ConversionLog log;
    log.Append(LogType::Error, "boom");
    log.Clear();
    EXPECT_EQ(log.Size(), 0u);
}

TEST(ConversionLogTest, TypeNamesAndColors) {
    EXPECT_STREQ(LogTypeName(LogType::Overwriting), "OVERWRITING");
    EXPECT_STREQ(LogTypeName(LogType::Warning), "WARNING");
    EXPECT_STREQ(LogTypeName(LogType::Info), "INFO");
    EXPECT_EQ(LogTypeColor(LogType::Overwriting), 0xBF00E1u);
    EXPECT_EQ(LogTypeColor(LogType::Converting), 0x0000FFu);
    EXPECT_EQ(LogTypeColor(LogType::Finished), 0x008000u);
    EXPECT_EQ(LogTypeColor(LogType::Error), 0xFF0000u);
    EXPECT_EQ(LogTypeColor(LogType::Warning), 0xFFA500u);
    EXPECT_EQ(LogTypeColor(LogType::Info), 0x333333u);
}

TEST(ConversionLogTest, MirrorsTimestampedLines) {
    std::ostringstream mirror;
    ConversionLog log(1);
    log.SetMirror(&mirror);
    log.Append(LogType::Converting, "first.opus...");
    log.Append(LogType::Error, "second");
    log.SetMirror(nullptr);
    log.Append(LogType::Info, "not mirrored");

    const std::string text = mirror.str();
    const std::regex line(R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[(CONVERTING|ERROR)\] .*)");
    std::istringstream in(text);
    std::string row;
    int count = 0;
    while (std::getline(in, row)) {
        EXPECT_TRUE(std::regex_match(row, line)) << row;
        ++count;
    }
    // The mirror sees everything even though the in-memory log keeps one entry.
    EXPECT_EQ(count, 2);
    EXPECT_EQ(text.find("not mirrored"), std::string::npos);
}
