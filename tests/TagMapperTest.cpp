#include <gtest/gtest.h>

#include "converter/TagMapper.hpp"

TEST(TagMapperTest, CopiesKnownFieldsInStableOrder) {
    const TagMapping mapping = MapOpusTags({
        {"tracknumber", "7"},
        {"genre", "Jazz"},
        {"title", "So What"},
        {"album", "Kind of Blue"},
        {"artist", "Miles Davis"},
        {"encoder", "libopus 1.3"},
        {"comment", "ignored"},
    }, "so_what.opus");

    const std::vector<std::pair<std::string, std::string>> expected{
        {"title", "So What"},
        {"artist", "Miles Davis"},
        {"album", "Kind of Blue"},
        {"genre", "Jazz"},
        {"track", "7"},
    };
    EXPECT_EQ(mapping.tags, expected);
    EXPECT_TRUE(mapping.warnings.empty());
}

TEST(TagMapperTest, TrackNumberUsesDemuxerKey) {
    // The Ogg demuxer reports TRACKNUMBER as "track".
    const TagMapping mapping = MapOpusTags({{"title", "Intro"}, {"track", "3/12"}}, "intro.opus");
    const std::vector<std::pair<std::string, std::string>> expected{
        {"title", "Intro"},
        {"track", "3/12"},
    };
    EXPECT_EQ(mapping.tags, expected);
}

TEST(TagMapperTest, DemuxerTrackKeyWinsOverRawComment) {
    const TagMapping mapping = MapOpusTags({{"track", "4"}, {"tracknumber", "9"}}, "a.opus");
    ASSERT_EQ(mapping.tags.size(), 1u);
    EXPECT_EQ(mapping.tags[0].second, "4");
}

TEST(TagMapperTest, SkipsBlankValues) {
    const TagMapping mapping = MapOpusTags({{"title", "   "}, {"artist", " Nina "}}, "a.opus");
    ASSERT_EQ(mapping.tags.size(), 1u);
    EXPECT_EQ(mapping.tags[0].first, "artist");
    EXPECT_EQ(mapping.tags[0].second, "Nina");
}

TEST(TagMapperTest, KeepsIntegerYears) {
    const TagMapping mapping = MapOpusTags({{"date", "1959"}}, "a.opus");
    ASSERT_EQ(mapping.tags.size(), 1u);
    EXPECT_EQ(mapping.tags[0], std::make_pair(std::string("date"), std::string("1959")));
    EXPECT_TRUE(mapping.warnings.empty());
}

TEST(TagMapperTest, RejectsFullDatesWithWarning) {
    const TagMapping mapping = MapOpusTags({{"date", "1959-08-17"}}, "so_what.opus");
    EXPECT_TRUE(mapping.tags.empty());
    ASSERT_EQ(mapping.warnings.size(), 1u);
    EXPECT_EQ(mapping.warnings[0], "Invalid date format in so_what.opus: '1959-08-17'. Skipping this date value.");
}

TEST(TagMapperTest, FiltersMultiValuedDates) {
    const TagMapping mapping = MapOpusTags({{"date", "1999; unknown ;2001"}}, "a.opus");
    ASSERT_EQ(mapping.tags.size(), 1u);
    EXPECT_EQ(mapping.tags[0].second, "1999;2001");
    ASSERT_EQ(mapping.warnings.size(), 1u);
    EXPECT_NE(mapping.warnings[0].find("'unknown'"), std::string::npos);
}

TEST(TagMapperTest, NormalizesSignAndLeadingZeros) {
    const TagMapping mapping = MapOpusTags({{"date", "+0042"}}, "a.opus");
    ASSERT_EQ(mapping.tags.size(), 1u);
    EXPECT_EQ(mapping.tags[0].second, "42");
}

TEST(TagMapperTest, OverlongDigitStringsAreNotYears) {
    const TagMapping mapping = MapOpusTags({{"date", "123456789012345678901234"}}, "a.opus");
    EXPECT_TRUE(mapping.tags.empty());
    EXPECT_EQ(mapping.warnings.size(), 1u);
}

TEST(TagMapperTest, EmptyInputGivesNothing) {
    const TagMapping mapping = MapOpusTags({}, "a.opus");
    EXPECT_TRUE(mapping.tags.empty());
    EXPECT_TRUE(mapping.warnings.empty());
}
