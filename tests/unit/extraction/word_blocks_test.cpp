#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <docsift/extraction/document_extractors.h>

#include "support/mock_services.h"

using namespace docsift;
using namespace docsift::extraction;
using ::testing::_;
using ::testing::Return;

namespace {

ParagraphInfo para(std::string text, std::string style = "Normal", size_t runs = 2,
                   std::optional<double> size = 12.0) {
    ParagraphInfo p;
    p.text = std::move(text);
    p.styleName = std::move(style);
    p.runCount = runs;
    p.fontSize = size;
    return p;
}

ParagraphInfo boldPara(std::string text) {
    auto p = para(std::move(text), "Normal", 1);
    p.bold = true;
    return p;
}

} // namespace

TEST(ClassifyParagraphsTest, RecognizesEachBlockKind) {
    std::vector<ParagraphInfo> paragraphs{
        para("Introduction", "Heading 1"),
        para("Body text with several runs."),
        boldPara("Key point"),
        boldPara("Second key point"),
        para(""),
        para("   "),
        para("After the gap."),
        para("Large callout", "Normal", 1, 16.0),
        para("Details", "heading 2"),
        para("Untitled", "Heading"),
    };
    auto blocks = classifyParagraphs(paragraphs);
    ASSERT_EQ(blocks.size(), 7u);

    auto* h1 = std::get_if<block::Heading>(&blocks[0]);
    ASSERT_NE(h1, nullptr);
    EXPECT_EQ(h1->level, 1);
    EXPECT_EQ(h1->text, "Introduction");

    EXPECT_TRUE(std::holds_alternative<block::Paragraph>(blocks[1]));

    auto* bold = std::get_if<block::Emphasis>(&blocks[2]);
    ASSERT_NE(bold, nullptr);
    EXPECT_EQ(bold->kind, block::EmphasisKind::Bold);
    EXPECT_EQ(bold->text, "Key point");

    auto* brk = std::get_if<block::ParagraphBreak>(&blocks[3]);
    ASSERT_NE(brk, nullptr);
    EXPECT_EQ(brk->text, "After the gap.");

    auto* bigger = std::get_if<block::Emphasis>(&blocks[4]);
    ASSERT_NE(bigger, nullptr);
    EXPECT_EQ(bigger->kind, block::EmphasisKind::BiggerFont);

    auto* h2 = std::get_if<block::Heading>(&blocks[5]);
    ASSERT_NE(h2, nullptr);
    EXPECT_EQ(h2->level, 2);

    auto* untitled = std::get_if<block::Heading>(&blocks[6]);
    ASSERT_NE(untitled, nullptr);
    EXPECT_EQ(untitled->level, 1);
}

TEST(ClassifyParagraphsTest, SingleEmptyParagraphIsNotABreak) {
    auto blocks = classifyParagraphs({para("One."), para(""), para("Two.")});
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<block::Paragraph>(blocks[1]));
}

TEST(ClassifyParagraphsTest, EmphasisNeedsSingleRun) {
    auto p = boldPara("Mixed formatting");
    p.runCount = 3;
    auto blocks = classifyParagraphs({p});
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<block::Paragraph>(blocks[0]));
}

TEST(BlockKindNameTest, NamesEveryKind) {
    EXPECT_STREQ(blockKindName(block::Heading{2, "h"}), "heading");
    EXPECT_STREQ(blockKindName(block::Emphasis{block::EmphasisKind::Underline, "u"}), "underline");
    EXPECT_STREQ(blockKindName(block::ParagraphBreak{"p"}), "paragraph_break");
    EXPECT_STREQ(blockKindName(block::Paragraph{"p"}), "paragraph");
    EXPECT_STREQ(blockKindName(block::Table{"| a |"}), "table");
    EXPECT_STREQ(blockKindName(block::Picture{}), "image");
}

TEST(RowsToMarkdownTest, RendersHeaderSeparatorAndPaddedRows) {
    auto md = rowsToMarkdown({{"Name", " Qty "}, {"Apple", "3"}, {"Pear"}});
    ASSERT_TRUE(md.has_value());
    EXPECT_EQ(*md, "| Name | Qty |\n| --- | --- |\n| Apple | 3 |\n| Pear |  |");
}

TEST(RowsToMarkdownTest, SingleRowIsBareHeader) {
    EXPECT_EQ(rowsToMarkdown({{"Only", "header"}}), std::optional<std::string>("| Only | header |"));
}

TEST(RowsToMarkdownTest, EmptyTablesRenderNothing) {
    EXPECT_FALSE(rowsToMarkdown({}).has_value());
    EXPECT_FALSE(rowsToMarkdown({{}, {}}).has_value());
    EXPECT_FALSE(rowsToMarkdown({{"", "  "}}).has_value());
}

TEST(ReadWordBlocksTest, AppendsTablesAndPicturesAfterParagraphs) {
    test_support::MockWordExtractor word;
    Image img;
    img.width = 600;
    img.height = 400;
    EXPECT_CALL(word, paragraphs(_))
        .WillOnce(Return(Result<std::vector<ParagraphInfo>>(
            std::vector<ParagraphInfo>{para("Title", "Heading 1"), para("Body.")})));
    EXPECT_CALL(word, tables(_))
        .WillOnce(Return(Result<test_support::TableRows>(
            test_support::TableRows{{{"a", "b"}, {"1", "2"}}, {{"", ""}}})));
    EXPECT_CALL(word, images(_))
        .WillOnce(Return(Result<std::vector<Image>>(std::vector<Image>{img})));

    auto blocks = readWordBlocks(word, "doc.docx");
    ASSERT_TRUE(blocks) << blocks.error().message;
    ASSERT_EQ(blocks.value().size(), 4u);
    EXPECT_TRUE(std::holds_alternative<block::Heading>(blocks.value()[0]));
    EXPECT_TRUE(std::holds_alternative<block::Paragraph>(blocks.value()[1]));
    auto* table = std::get_if<block::Table>(&blocks.value()[2]);
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->markdown, "| a | b |\n| --- | --- |\n| 1 | 2 |");
    auto* picture = std::get_if<block::Picture>(&blocks.value()[3]);
    ASSERT_NE(picture, nullptr);
    EXPECT_EQ(picture->image.area(), 240'000);
}

TEST(ReadWordBlocksTest, TableAndImageFailuresAreNotFatal) {
    test_support::MockWordExtractor word;
    EXPECT_CALL(word, paragraphs(_))
        .WillOnce(Return(Result<std::vector<ParagraphInfo>>(
            std::vector<ParagraphInfo>{para("Only text.")})));
    EXPECT_CALL(word, tables(_))
        .WillOnce(Return(Result<test_support::TableRows>(Error{ErrorCode::InvalidData, "bad"})));
    EXPECT_CALL(word, images(_))
        .WillOnce(Return(Result<std::vector<Image>>(Error{ErrorCode::InvalidData, "bad"})));

    auto blocks = readWordBlocks(word, "doc.docx");
    ASSERT_TRUE(blocks);
    EXPECT_EQ(blocks.value().size(), 1u);
}

TEST(ReadWordBlocksTest, ParagraphFailureIsFatal) {
    test_support::MockWordExtractor word;
    EXPECT_CALL(word, paragraphs(_))
        .WillOnce(Return(Result<std::vector<ParagraphInfo>>(
            Error{ErrorCode::InvalidData, "not a zip archive"})));
    EXPECT_CALL(word, tables(_)).Times(0);

    auto blocks = readWordBlocks(word, "doc.docx");
    ASSERT_FALSE(blocks);
    EXPECT_EQ(blocks.error().code, ErrorCode::InvalidData);
}
