#include <gtest/gtest.h>

#include <algorithm>

#include "tui/FileBrowser.hpp"
#include "TestUtil.hpp"

namespace {
std::vector<std::string> Names(const FileBrowser& browser) {
    std::vector<std::string> names;
    for (const FileBrowser::Entry& entry : browser.Entries()) {
        names.push_back(entry.name);
    }
    return names;
}

class FileBrowserTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::create_directory(dir_.Path() / "zeta");
        std::filesystem::create_directory(dir_.Path() / "alpha");
        std::filesystem::create_directory(dir_.Path() / ".cache");
        WriteTextFile(dir_.Path() / "b.opus", "x");
        WriteTextFile(dir_.Path() / "a.opus", "x");
        WriteTextFile(dir_.Path() / "notes.txt", "x");
        WriteTextFile(dir_.Path() / ".hidden.opus", "x");
        WriteTextFile(dir_.Path() / "alpha" / "inner.opus", "x");
    }

    TempDir dir_;
};
} // namespace

TEST_F(FileBrowserTest, ListsDirectoriesFirstThenFilteredFiles) {
    FileBrowser browser([](const std::filesystem::path& p) { return p.extension() == ".opus"; });
    ASSERT_TRUE(browser.Load(dir_.Path()));

    const std::vector<std::string> expected{"..", "alpha", "zeta", "a.opus", "b.opus"};
    EXPECT_EQ(Names(browser), expected);
}

TEST_F(FileBrowserTest, WithoutFilterEveryVisibleFileIsListed) {
    FileBrowser browser;
    ASSERT_TRUE(browser.Load(dir_.Path()));
    const std::vector<std::string> names = Names(browser);
    EXPECT_NE(std::find(names.begin(), names.end(), "notes.txt"), names.end());
    EXPECT_EQ(std::find(names.begin(), names.end(), ".hidden.opus"), names.end());
}

TEST_F(FileBrowserTest, NavigatesIntoAndOutOfDirectories) {
    FileBrowser browser;
    ASSERT_TRUE(browser.Load(dir_.Path()));

    browser.MoveSelectionDown(); // alpha
    EXPECT_EQ(browser.SelectedPath(), dir_.Path() / "alpha");
    browser.ActivateSelection();
    EXPECT_EQ(browser.CurrentPath(), dir_.Path() / "alpha");
    EXPECT_EQ(browser.SelectedIndex(), 0u);

    // ".." is always first and has no selectable path.
    EXPECT_TRUE(browser.SelectedPath().empty());
    browser.ActivateSelection();
    EXPECT_EQ(browser.CurrentPath(), dir_.Path());
}

TEST_F(FileBrowserTest, SelectionWrapsAround) {
    FileBrowser browser([](const std::filesystem::path& p) { return p.extension() == ".opus"; });
    ASSERT_TRUE(browser.Load(dir_.Path()));
    browser.MoveSelectionUp();
    EXPECT_EQ(browser.SelectedEntry()->name, "b.opus");
    browser.MoveSelectionDown();
    EXPECT_EQ(browser.SelectedEntry()->name, "..");
}

TEST_F(FileBrowserTest, ActivatingAFileIsANoOp) {
    FileBrowser browser([](const std::filesystem::path& p) { return p.extension() == ".opus"; });
    ASSERT_TRUE(browser.Load(dir_.Path()));
    browser.MoveSelectionUp(); // b.opus
    browser.ActivateSelection();
    EXPECT_EQ(browser.CurrentPath(), dir_.Path());
    EXPECT_EQ(browser.SelectedPath(), dir_.Path() / "b.opus");
}

TEST_F(FileBrowserTest, FailedLoadKeepsCurrentDirectory) {
    FileBrowser browser;
    ASSERT_TRUE(browser.Load(dir_.Path()));
    EXPECT_FALSE(browser.Load(dir_.Path() / "missing"));
    EXPECT_FALSE(browser.Load(dir_.Path() / "notes.txt"));
    EXPECT_EQ(browser.CurrentPath(), dir_.Path());
}

TEST_F(FileBrowserTest, TrailingSlashIsNormalized) {
    FileBrowser browser;
    ASSERT_TRUE(browser.Load(dir_.Path().string() + "/alpha/"));
    EXPECT_EQ(browser.CurrentPath(), dir_.Path() / "alpha");
    browser.ActivateSelection();
    EXPECT_EQ(browser.CurrentPath(), dir_.Path());
}
