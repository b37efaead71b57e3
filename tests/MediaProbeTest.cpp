#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include "converter/MediaProbe.hpp"
#include "TestUtil.hpp"

TEST(MediaProbeTest, FormatsMinutesAndSeconds) {
    EXPECT_EQ(FormatDuration(0.0), "00:00");
    EXPECT_EQ(FormatDuration(65.9), "01:05");
    EXPECT_EQ(FormatDuration(205.01), "03:25");
    EXPECT_EQ(FormatDuration(3600.0), "60:00");
}

TEST(MediaProbeTest, UnknownDurationIsDashed) {
    EXPECT_EQ(FormatDuration(-1.0), "--:--");
    EXPECT_EQ(FormatDuration(std::nan("")), "--:--");
    EXPECT_EQ(FormatDuration(std::numeric_limits<double>::infinity()), "--:--");
}

TEST(MediaProbeTest, MissingFileThrows) {
    TempDir dir;
    EXPECT_THROW(ProbeMedia(dir.Path() / "missing.opus"), std::runtime_error);
}

TEST(MediaProbeTest, NonMediaFileHasUnknownDuration) {
    TempDir dir;
    const std::filesystem::path bogus = dir.Path() / "notes.opus";
    WriteTextFile(bogus, "this is not an ogg stream\n");
    EXPECT_EQ(DurationLabel(bogus), "--:--");
}
