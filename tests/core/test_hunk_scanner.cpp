#include "patchmark/core/hunk_scanner.hpp"
#include <gtest/gtest.h>

namespace patchmark {

TEST(HunkScannerTest, ParsesFullHeader)
{
    auto header = parse_hunk_header("@@ -10,7 +12,9 @@ void run()");

    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(*header, (HunkHeader{.old_start = 10, .old_count = 7, .new_start = 12, .new_count = 9}));
}

TEST(HunkScannerTest, MissingCountsDefaultToOne)
{
    auto header = parse_hunk_header("@@ -3 +4 @@");

    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->old_count, 1);
    EXPECT_EQ(header->new_start, 4);
    EXPECT_EQ(header->new_count, 1);
}

TEST(HunkScannerTest, RejectsMalformedHeaders)
{
    EXPECT_FALSE(parse_hunk_header("@@ garbage @@").has_value());
    EXPECT_FALSE(parse_hunk_header("@@ -a,1 +1,1 @@").has_value());
    EXPECT_FALSE(parse_hunk_header("@@ -1,1 +0,3 @@").has_value());
    EXPECT_FALSE(parse_hunk_header("@@ -1,1 +99999999999999,1 @@").has_value());
}

TEST(HunkScannerTest, AcceptsWholeFileDeletionHeader)
{
    auto header = parse_hunk_header("@@ -1,3 +0,0 @@");

    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->new_start, 0);
    EXPECT_EQ(header->new_count, 0);
}

TEST(HunkScannerTest, RecognizesFileBoundaries)
{
    EXPECT_TRUE(is_file_boundary("src/app.ts"));
    EXPECT_TRUE(is_file_boundary("README.md"));
    EXPECT_TRUE(is_file_boundary("Makefile"));
    EXPECT_TRUE(is_file_boundary("docs/My Notes.md"));
    EXPECT_TRUE(is_file_boundary("src/a+b.cpp"));
    EXPECT_FALSE(is_file_boundary(" context line"));
    EXPECT_FALSE(is_file_boundary("+added.line"));
    EXPECT_FALSE(is_file_boundary("-removed.line"));
    EXPECT_FALSE(is_file_boundary("\\ No newline at end of file"));
    EXPECT_FALSE(is_file_boundary("@@ -1 +1 @@"));
    EXPECT_FALSE(is_file_boundary("diff --git a/x b/x"));
    EXPECT_FALSE(is_file_boundary("index 3b18e51..a9c1f2d 100644"));
    EXPECT_FALSE(is_file_boundary(""));
}

TEST(HunkScannerTest, RejectsHeaderWhoseRangeLeavesInt)
{
    EXPECT_FALSE(parse_hunk_header("@@ -1,1 +2147483647,2 @@").has_value());
    EXPECT_TRUE(parse_hunk_header("@@ -1,1 +2147483646,1 @@").has_value());
}

TEST(HunkScannerTest, MarkersListHeadersAndBoundariesInOrder)
{
    std::vector<std::string> lines = {"src/a.cpp", "@@ -1,1 +1,1 @@", "-x", "+y",
                                      "@@ broken", " z", "src/b.cpp", "@@ -5 +5 @@", "+w"};

    auto markers = scan_markers(lines);

    std::vector<ScanMarker> expected = {
        {.kind = MarkerKind::FILE_BOUNDARY, .line_index = 0},
        {.kind = MarkerKind::HUNK_HEADER, .line_index = 1},
        {.kind = MarkerKind::MALFORMED_HEADER, .line_index = 4},
        {.kind = MarkerKind::FILE_BOUNDARY, .line_index = 6},
        {.kind = MarkerKind::HUNK_HEADER, .line_index = 7},
    };
    EXPECT_EQ(markers, expected);
}

TEST(HunkScannerTest, SingleFilePatchHasOneUnnamedSegment)
{
    auto result = scan_hunks("@@ -1,2 +1,2 @@\n a\n+b\n@@ -10 +10 @@\n c\n");

    ASSERT_EQ(result.segments.size(), 1);
    EXPECT_EQ(result.segments[0].filename, "");
    ASSERT_EQ(result.segments[0].hunks.size(), 2);
    EXPECT_EQ(result.segments[0].hunks[0].body, (std::vector<std::string>{" a", "+b"}));
    EXPECT_EQ(result.segments[0].hunks[1].header.new_start, 10);
    EXPECT_EQ(result.skipped_hunks, 0);
}

TEST(HunkScannerTest, MalformedHeaderBodyIsDropped)
{
    auto result = scan_hunks("@@ nonsense @@\n+lost\n@@ -4,1 +4,1 @@\n+kept");

    ASSERT_EQ(result.segments.size(), 1);
    ASSERT_EQ(result.segments[0].hunks.size(), 1);
    EXPECT_EQ(result.segments[0].hunks[0].body, (std::vector<std::string>{"+kept"}));
    EXPECT_EQ(result.skipped_hunks, 1);
}

TEST(HunkScannerTest, ConcatenatedBufferSplitsPerFile)
{
    auto result = scan_hunks("src/a.cpp\n@@ -1 +1 @@\n+a\nsrc/b.cpp\n@@ -2 +2 @@\n+b\n");

    ASSERT_EQ(result.segments.size(), 2);
    EXPECT_EQ(result.segments[0].filename, "src/a.cpp");
    EXPECT_EQ(result.segments[1].filename, "src/b.cpp");
    EXPECT_EQ(result.segments[1].hunks[0].header.new_start, 2);
    EXPECT_EQ(result.segments[1].hunks[0].body, (std::vector<std::string>{"+b"}));
}

TEST(HunkScannerTest, NamesWithoutExtensionOrWithSpacesSplitSegments)
{
    auto result = scan_hunks("src/a.cpp\n@@ -5 +5 @@\n+a\nMakefile\n@@ -1 +1 @@\n+b\n"
                             "docs/My Notes.md\n@@ -2,1 +2,1 @@\n-c\n+C\n");

    ASSERT_EQ(result.segments.size(), 3);
    EXPECT_EQ(result.segments[0].filename, "src/a.cpp");
    EXPECT_EQ(result.segments[1].filename, "Makefile");
    EXPECT_EQ(result.segments[2].filename, "docs/My Notes.md");
    EXPECT_EQ(result.segments[2].hunks[0].header.new_start, 2);
}

TEST(HunkScannerTest, EmptyPatchHasNoHunks)
{
    auto result = scan_hunks("");

    ASSERT_EQ(result.segments.size(), 1);
    EXPECT_TRUE(result.segments[0].hunks.empty());
}

} // namespace patchmark
