#include "patchmark/io/offline_collaborators.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace patchmark {

TEST(RecordedBackendTest, ReplaysRecordingForEveryRequest)
{
    RecordedBackend backend(std::string("@@a.cpp@@ fine"));

    EXPECT_EQ(backend.request_review("a.cpp\n@@ -1 +1 @@\n+x"), "@@a.cpp@@ fine");
    EXPECT_EQ(backend.request_review("b.cpp\n@@ -1 +1 @@\n+y"), "@@a.cpp@@ fine");
    EXPECT_EQ(backend.request_count(), 2);
}

TEST(RecordedBackendTest, NoRecordingAnswersEmpty)
{
    RecordedBackend backend(std::nullopt);

    EXPECT_EQ(backend.request_review("x"), "");
}

TEST(ConsolePosterTest, PrintsAcceptedComments)
{
    std::ostringstream out;
    ConsolePoster poster(out);

    EXPECT_TRUE(poster.post_line_comment("src/app.ts", 12, "Nice"));
    EXPECT_TRUE(poster.post_pull_request_comment("Overall fine"));

    EXPECT_EQ(out.str(),
              "--- comment on src/app.ts:12 ---\nNice\n--- comment on pull request ---\nOverall fine\n");
}

TEST(ConsolePosterTest, RefusedAnchorPrintsNothing)
{
    std::ostringstream out;
    ConsolePoster poster(out, {{"src/app.ts", 12}});

    EXPECT_FALSE(poster.post_line_comment("src/app.ts", 12, "Nice"));
    EXPECT_TRUE(poster.post_line_comment("src/app.ts", 13, "Nice"));
    EXPECT_EQ(out.str(), "--- comment on src/app.ts:13 ---\nNice\n");
}

TEST(ThreadPacerTest, ZeroDelayReturnsImmediately)
{
    ThreadPacer pacer;
    auto start = std::chrono::steady_clock::now();

    pacer.wait(std::chrono::milliseconds(0));

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

TEST(ThreadPacerTest, WaitsAtLeastTheRequestedDelay)
{
    ThreadPacer pacer;
    auto start = std::chrono::steady_clock::now();

    pacer.wait(std::chrono::milliseconds(20));

    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
}

} // namespace patchmark
