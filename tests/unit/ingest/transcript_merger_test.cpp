#include <gtest/gtest.h>
#include <docsift/ingest/transcript_merger.h>

#include <string>
#include <vector>

using namespace docsift::ingest;

TEST(TranscriptMergerTest, EmptyInputYieldsNoBlocks) {
    EXPECT_TRUE(mergeSegments({}).empty());
}

TEST(TranscriptMergerTest, MergesCloseSegments) {
    std::vector<TranscriptSegment> segs{
        {"Hello there.", 0.0, 2.0}, {"  How are you?", 2.5, 4.0}, {"Fine.", 4.2, 5.0}};
    auto blocks = mergeSegments(segs);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].text, "Hello there. How are you? Fine.");
    EXPECT_DOUBLE_EQ(blocks[0].start, 0.0);
    EXPECT_DOUBLE_EQ(blocks[0].end, 5.0);
}

TEST(TranscriptMergerTest, SilenceGapStartsNewBlock) {
    std::vector<TranscriptSegment> segs{{"one", 0.0, 1.0}, {"two", 2.5, 3.0}, {"three", 3.1, 4.0}};
    auto blocks = mergeSegments(segs, 60.0, 1200, 1.5);
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].text, "one");
    EXPECT_EQ(blocks[1].text, "two three");
    EXPECT_DOUBLE_EQ(blocks[1].start, 2.5);
}

TEST(TranscriptMergerTest, DurationLimitStartsNewBlock) {
    std::vector<TranscriptSegment> segs;
    for (int i = 0; i < 8; ++i) {
        segs.push_back({"s" + std::to_string(i), i * 10.0, i * 10.0 + 9.5});
    }
    auto blocks = mergeSegments(segs, 30.0, 1200, 1.5);
    // A segment ending >= 30s after the block start opens a new block
    ASSERT_GE(blocks.size(), 2u);
    for (const auto& b : blocks) {
        EXPECT_LT(b.end - b.start, 30.0);
    }
}

TEST(TranscriptMergerTest, CharacterLimitStartsNewBlock) {
    std::string longText(60, 'a');
    std::vector<TranscriptSegment> segs{{longText, 0.0, 1.0}, {longText, 1.1, 2.0}};
    auto blocks = mergeSegments(segs, 60.0, 100, 1.5);
    ASSERT_EQ(blocks.size(), 2u);
}

TEST(TranscriptMergerTest, CharacterLimitCountsCodePoints) {
    // 40 characters (80 bytes) each: 41 + 40 stays under 100
    std::string greek;
    for (int i = 0; i < 40; ++i) {
        greek += "\u03bb";
    }
    std::vector<TranscriptSegment> segs{{greek, 0.0, 1.0}, {greek, 1.1, 2.0}};
    auto blocks = mergeSegments(segs, 60.0, 100, 1.5);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].text, greek + " " + greek);

    segs.push_back({greek, 2.1, 3.0});
    EXPECT_EQ(mergeSegments(segs, 60.0, 100, 1.5).size(), 2u);
}

TEST(TranscriptMergerTest, BlankSegmentsAreSkipped) {
    std::vector<TranscriptSegment> segs{{"first", 0.0, 1.0}, {"   ", 1.0, 8.0}, {"second", 1.2, 2.0}};
    auto blocks = mergeSegments(segs);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].text, "first second");
    EXPECT_DOUBLE_EQ(blocks[0].end, 2.0);
}
