#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "clip_unify/manifest.hpp"
#include "test_doubles.hpp"

using namespace clip_unify;
using clip_unify::testing_support::TempDirTest;

namespace fs = std::filesystem;

TEST(ManifestTest, EntryIsQuotedAbsolutePosixPath)
{
    EXPECT_EQ(format_entry("/tmp/work/processed_0000.mp4"),
              "file '/tmp/work/processed_0000.mp4'");

    std::string relative = format_entry("scratch/processed_0001.mp4");
    std::string expected_abs =
        (fs::current_path() / "scratch" / "processed_0001.mp4").string();
    EXPECT_EQ(relative, "file '" + expected_abs + "'");
}

TEST(ManifestTest, BackslashesBecomeForwardSlashes)
{
    std::string entry = format_entry("/tmp/dir\\sub\\clip.mp4");
    EXPECT_EQ(entry, "file '/tmp/dir/sub/clip.mp4'");
}

TEST(ManifestTest, SingleQuotesAreEscaped)
{
    EXPECT_EQ(format_entry("/tmp/it's.mp4"), "file '/tmp/it'\\''s.mp4'");
}

TEST(ManifestTest, ScratchNamesAreZeroPadded)
{
    EXPECT_EQ(scratch_file_name(0), "processed_0000.mp4");
    EXPECT_EQ(scratch_file_name(42), "processed_0042.mp4");
    EXPECT_EQ(scratch_file_name(7, "pending"), "pending_0007.mp4");
}

TEST(ManifestTest, PreservesInsertionOrder)
{
    ConcatManifest manifest;
    EXPECT_TRUE(manifest.empty());
    manifest.add("/w/c.mp4");
    manifest.add("/w/a.mp4");
    manifest.add("/w/b.mp4");

    ASSERT_EQ(manifest.size(), 3u);
    EXPECT_EQ(manifest.entries()[0], "file '/w/c.mp4'");
    EXPECT_EQ(manifest.entries()[1], "file '/w/a.mp4'");
    EXPECT_EQ(manifest.entries()[2], "file '/w/b.mp4'");
    EXPECT_EQ(manifest.render(),
              "file '/w/c.mp4'\nfile '/w/a.mp4'\nfile '/w/b.mp4'");
}

class ManifestFileTest : public TempDirTest
{
};

TEST_F(ManifestFileTest, WritesListWithoutTrailingNewline)
{
    ConcatManifest manifest;
    manifest.add("/w/one.mp4");
    manifest.add("/w/two.mp4");

    fs::path list = root_ / "file_list.txt";
    ASSERT_TRUE(manifest.write(list.string()));
    EXPECT_EQ(read_file(list), "file '/w/one.mp4'\nfile '/w/two.mp4'");
}

TEST_F(ManifestFileTest, WriteReportsFailure)
{
    ConcatManifest manifest;
    manifest.add("/w/one.mp4");
    EXPECT_FALSE(manifest.write((root_ / "missing_dir" / "list.txt").string()));
}
