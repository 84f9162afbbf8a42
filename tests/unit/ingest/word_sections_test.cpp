#include <gtest/gtest.h>
#include <docsift/ingest/normalizer.h>
#include <docsift/ingest/word_sections.h>

using namespace docsift;
using namespace docsift::extraction;
using namespace docsift::ingest;

namespace {

chunking::TokenChunker wordChunker() {
    return chunking::TokenChunker(chunking::TokenChunkerConfig{0},
                                  std::make_shared<chunking::CallbackTokenCounter>(
                                      [](std::string_view t) { return countWords(t); }));
}

} // namespace

TEST(WordSectionStateTest, BoundaryKinds) {
    EXPECT_TRUE(WordSectionState::isSectionBoundary(block::Heading{1, "a"}));
    EXPECT_TRUE(WordSectionState::isSectionBoundary(block::Heading{3, "a"}));
    EXPECT_FALSE(WordSectionState::isSectionBoundary(block::Heading{4, "a"}));
    EXPECT_TRUE(WordSectionState::isSectionBoundary(block::Emphasis{block::EmphasisKind::Italic, "a"}));
    EXPECT_TRUE(WordSectionState::isSectionBoundary(block::ParagraphBreak{"a"}));
    EXPECT_FALSE(WordSectionState::isSectionBoundary(block::Paragraph{"a"}));
    EXPECT_FALSE(WordSectionState::isSectionBoundary(block::Table{"| a |"}));
}

TEST(WordSectionStateTest, WarmupSuppressesBoundaries) {
    auto chunker = wordChunker();
    WordSectionState state(chunker, 512, 0, 3);

    EXPECT_FALSE(state.feed(block::Heading{1, "Title"}).has_value());
    EXPECT_EQ(state.currentSection(), "heading");
    EXPECT_FALSE(state.feed(block::Paragraph{"Para one."}).has_value());
    // Third block is still within warm-up even though it is a boundary kind
    EXPECT_FALSE(state.feed(block::Emphasis{block::EmphasisKind::Bold, "Bold lead"}).has_value());
    EXPECT_EQ(state.currentSection(), "heading");
    EXPECT_FALSE(state.warmingUp());

    EXPECT_FALSE(state.feed(block::Paragraph{"Para two."}).has_value());
    EXPECT_EQ(state.bufferedBlocks(), 4u);

    auto closed = state.feed(block::Heading{2, "Next"});
    ASSERT_TRUE(closed.has_value());
    EXPECT_EQ(closed->section, "heading");
    ASSERT_EQ(closed->texts.size(), 1u);
    EXPECT_NE(closed->texts[0].find("Title"), std::string::npos);
    EXPECT_NE(closed->texts[0].find("Para two."), std::string::npos);
    EXPECT_EQ(closed->texts[0].find("Next"), std::string::npos);

    // Block count restarted, so warm-up applies again
    EXPECT_EQ(state.bufferedBlocks(), 1u);
    EXPECT_TRUE(state.warmingUp());
}

TEST(WordSectionStateTest, SectionLabelFollowsOpeningBlock) {
    auto chunker = wordChunker();
    WordSectionState state(chunker, 512, 0, 1);

    EXPECT_FALSE(state.feed(block::Paragraph{"Intro text."}).has_value());
    EXPECT_EQ(state.currentSection(), "paragraph");

    auto closed = state.feed(block::Emphasis{block::EmphasisKind::Underline, "Key terms"});
    ASSERT_TRUE(closed.has_value());
    EXPECT_EQ(closed->section, "paragraph");
    EXPECT_EQ(state.currentSection(), "underline");

    auto tail = state.flush();
    EXPECT_EQ(tail.section, "underline");
    ASSERT_EQ(tail.texts.size(), 1u);
    EXPECT_EQ(tail.texts[0], "Key terms");
}

TEST(WordSectionStateTest, FlushOfEmptyBufferKeepsCount) {
    auto chunker = wordChunker();
    WordSectionState state(chunker, 512, 0, 3);
    auto empty = state.flush();
    EXPECT_TRUE(empty.texts.empty());
    EXPECT_EQ(state.bufferedBlocks(), 0u);

    state.feed(block::Paragraph{"one"});
    EXPECT_EQ(state.flush().texts.size(), 1u);
    EXPECT_EQ(state.bufferedBlocks(), 0u);
    state.resetBlockCount();
    EXPECT_TRUE(state.warmingUp());
}

TEST(WordSectionStateTest, LongSectionsAreChunked) {
    auto chunker = wordChunker();
    WordSectionState state(chunker, 10, 0, 1);
    state.feed(block::Paragraph{"One two three four five six. Seven eight nine ten eleven twelve."});
    auto out = state.flush();
    ASSERT_EQ(out.texts.size(), 2u);
    EXPECT_EQ(out.texts[0], "One two three four five six.");
}
