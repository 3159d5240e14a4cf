#include <gtest/gtest.h>

#include "archive_marker.hpp"
#include "test_utils.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using artkeep_test::TempDir;
using artkeep_test::write_file;

TEST(ArchiveMarkerTest, MissingDirectoryIsNotArchived) {
    TempDir tmp;
    ArchiveMarker marker;
    EXPECT_FALSE(marker.is_archived(101, tmp.path() / "nope"));
}

TEST(ArchiveMarkerTest, MarkerFileMeansArchived) {
    TempDir tmp;
    write_file(tmp.path() / "1111.artist_image.jpg.101.html", "<html/>");
    ArchiveMarker marker;
    EXPECT_TRUE(marker.is_archived(101, tmp.path()));
    EXPECT_FALSE(marker.is_archived(102, tmp.path()));
}

TEST(ArchiveMarkerTest, IdMustMatchWholeSegment) {
    TempDir tmp;
    write_file(tmp.path() / "a.jpg.1101.html", "");
    write_file(tmp.path() / "b.jpg.101.htm", "");
    ArchiveMarker marker;
    EXPECT_FALSE(marker.is_archived(101, tmp.path()));
    EXPECT_TRUE(marker.is_archived(1101, tmp.path()));
}

TEST(ArchiveMarkerTest, PayloadOrTempFileAloneIsNotArchived) {
    TempDir tmp;
    write_file(tmp.path() / "a.jpg", "partial");
    write_file(tmp.path() / "a.jpg.101.html.tmp", "partial");
    ArchiveMarker marker;
    EXPECT_FALSE(marker.is_archived(101, tmp.path()));
}

TEST(ArchiveMarkerTest, SubdirectoriesAreNotSearched) {
    TempDir tmp;
    fs::create_directory(tmp.path() / "scraps");
    write_file(tmp.path() / "scraps" / "a.jpg.101.html", "");
    ArchiveMarker marker;
    EXPECT_FALSE(marker.is_archived(101, tmp.path()));
    EXPECT_TRUE(marker.is_archived(101, tmp.path() / "scraps"));
}

TEST(ArchiveMarkerTest, DirectoryNamedLikeMarkerDoesNotCount) {
    TempDir tmp;
    fs::create_directory(tmp.path() / "x.101.html");
    ArchiveMarker marker;
    EXPECT_FALSE(marker.is_archived(101, tmp.path()));
}

TEST(ArchiveMarkerTest, MarkerName) {
    EXPECT_EQ("file.png.42.html", ArchiveMarker::marker_name("file.png", 42));
    EXPECT_EQ(".42.html", ArchiveMarker::marker_suffix(42));
}
