#include <gtest/gtest.h>
#include <docsift/crypto/hasher.h>
#include <docsift/ingest/chunk_record.h>
#include <docsift/ingest/chunk_store.h>

#include "support/temp_dir_scope.hpp"

#include <regex>

using namespace docsift;
using namespace docsift::ingest;

TEST(ChunkRecordTest, SourceAndCaptionNamesRoundTrip) {
    for (auto s : {SourceType::Pdf, SourceType::Pptx, SourceType::Transcript, SourceType::Docx}) {
        EXPECT_EQ(parseSourceType(sourceTypeToString(s)), s);
    }
    EXPECT_FALSE(parseSourceType("xlsx").has_value());
    EXPECT_EQ(parseCaption("table"), CaptionKind::Table);
    EXPECT_EQ(std::string(captionToString(CaptionKind::Ocr)), "ocr");
}

TEST(ChunkRecordTest, MakeChunkFillsIdentityAndTimestamp) {
    auto c = makeChunk("doc1", SourceType::Pdf, "Report", "Some text", ChunkLocation{.page = 3},
                       CaptionKind::Ocr, 97.5);
    EXPECT_EQ(c.docId, "doc1");
    EXPECT_EQ(c.page, 3);
    EXPECT_FALSE(c.slide.has_value());
    EXPECT_EQ(c.caption, CaptionKind::Ocr);
    EXPECT_EQ(c.confidence, 97.5);
    EXPECT_EQ(c.chunkId.size(), 36u);
    EXPECT_TRUE(std::regex_match(c.createdAt,
                                 std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)")))
        << c.createdAt;

    auto other = makeChunk("doc1", SourceType::Pdf, "Report", "Some text", ChunkLocation{.page = 3});
    EXPECT_NE(c.chunkId, other.chunkId);
}

TEST(ChunkRecordTest, UtcTimestampFormatsEpoch) {
    TimePoint epoch{std::chrono::milliseconds(1'500)};
    EXPECT_EQ(utcTimestamp(epoch), "1970-01-01T00:00:01.500Z");
}

TEST(ChunkRecordTest, LocatorPrefersPageThenSlideThenTimecodeThenSection) {
    Chunk c;
    EXPECT_EQ(c.locator(), "0");
    c.section = "heading";
    EXPECT_EQ(c.locator(), "heading");
    c.timecode = "00:00:01-00:00:05";
    EXPECT_EQ(c.locator(), "00:00:01-00:00:05");
    c.slide = 4;
    EXPECT_EQ(c.locator(), "4");
    c.page = 2;
    EXPECT_EQ(c.locator(), "2");
}

TEST(ChunkRecordTest, StableChunkIdIsDeterministic) {
    auto id = stableChunkId("abc", SourceType::Pptx, "4", "hello");
    auto expectedSig = crypto::sha1Hex("4|hello").substr(0, 12);
    EXPECT_EQ(id, "abc:pptx:4:" + expectedSig);

    auto c = makeChunk("abc", SourceType::Pptx, "Deck", "hello", ChunkLocation{.slide = 4});
    EXPECT_EQ(stableChunkId(c), id);
    EXPECT_NE(stableChunkId("abc", SourceType::Pptx, "4", "hello!"), id);
}

TEST(ChunkRecordTest, TitleFromPath) {
    EXPECT_EQ(titleFromPath("/data/quarterly_report-final.pdf"), "Quarterly Report Final");
    EXPECT_EQ(titleFromPath("ONBOARDING.docx"), "Onboarding");
    EXPECT_EQ(titleFromPath("q3 2024 review.pptx"), "Q3 2024 Review");
}

TEST(ChunkRecordTest, Timecodes) {
    EXPECT_EQ(formatHhmmss(0.0), "00:00:00");
    EXPECT_EQ(formatHhmmss(3725.9), "01:02:05");
    EXPECT_EQ(formatHhmmss(-4.0), "00:00:00");
    EXPECT_EQ(formatTimecode(61.0, 125.5), "00:01:01-00:02:05");
}

TEST(ChunkRecordTest, DocumentIdIsContentHashPrefix) {
    auto tmp = test_support::TempDirScope::unique_under("docsift_docid");
    auto a = test_support::write_file(tmp.path() / "a.txt", "same bytes");
    auto b = test_support::write_file(tmp.path() / "b.txt", "same bytes");

    auto idA = documentId(a);
    auto idB = documentId(b);
    ASSERT_TRUE(idA);
    ASSERT_TRUE(idB);
    EXPECT_EQ(idA.value(), idB.value());
    EXPECT_EQ(idA.value(), crypto::sha256Hex("same bytes").substr(0, 32));

    EXPECT_FALSE(documentId(tmp.path() / "missing.pdf"));
}

TEST(ChunkRecordTest, JsonWritesNullForAbsentFields) {
    auto c = makeChunk("d", SourceType::Transcript, "Talk", "words",
                       ChunkLocation{.timecode = std::string("00:00:00-00:00:10")});
    nlohmann::json j = c;
    EXPECT_EQ(j["source"], "transcript");
    EXPECT_TRUE(j["page"].is_null());
    EXPECT_TRUE(j["caption"].is_null());
    EXPECT_EQ(j["timecode"], "00:00:00-00:00:10");

    auto back = j.get<Chunk>();
    EXPECT_EQ(back.timecode, c.timecode);
    EXPECT_EQ(back.chunkId, c.chunkId);
    EXPECT_FALSE(back.page.has_value());
}

TEST(ChunkRecordTest, JsonRejectsUnknownSource) {
    nlohmann::json j{{"doc_id", "d"}, {"source", "xlsx"}, {"text", "t"}};
    EXPECT_THROW(j.get<Chunk>(), std::invalid_argument);
}

TEST(ChunkStoreTest, SaveAndLoad) {
    auto tmp = test_support::TempDirScope::unique_under("docsift_store");
    ChunkStore store(tmp.path() / "chunks");
    std::vector<Chunk> chunks{
        makeChunk("d", SourceType::Pdf, "T", "alpha", ChunkLocation{.page = 1}),
        makeChunk("d", SourceType::Pdf, "T", "| a | b |", ChunkLocation{.page = 1},
                  CaptionKind::Table)};

    auto path = store.save("report", chunks);
    ASSERT_TRUE(path) << path.error().message;
    EXPECT_EQ(path.value().filename().string(), "report.json");

    auto loaded = store.load("report");
    ASSERT_TRUE(loaded) << loaded.error().message;
    ASSERT_EQ(loaded.value().size(), 2u);
    EXPECT_EQ(loaded.value()[1].caption, CaptionKind::Table);
    EXPECT_EQ(loaded.value()[0].text, "alpha");

    auto missing = store.load("nothing");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);

    test_support::write_file(tmp.path() / "chunks" / "broken.json", "[{\"doc_id\": 1");
    auto broken = store.load("broken");
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().code, ErrorCode::InvalidData);
}
