#include <gtest/gtest.h>
#include <docsift/search/fusion_ranker.h>

#include <string>
#include <vector>

using namespace docsift::search;

namespace {

SearchHit hit(std::string id, std::optional<std::string> highlight = std::nullopt) {
    SearchHit h;
    h.id = std::move(id);
    h.text = "text of " + h.id;
    h.highlight = std::move(highlight);
    return h;
}

std::vector<std::string> ids(const std::vector<FusedResult>& results) {
    std::vector<std::string> out;
    for (const auto& r : results) {
        out.push_back(r.hit.id);
    }
    return out;
}

} // namespace

TEST(FusionRankerTest, ReciprocalRankScores) {
    FusionRanker ranker;
    std::vector<SearchHit> vec{hit("a:pdf:1:x"), hit("b:pdf:1:x"), hit("c:pdf:1:x")};
    std::vector<SearchHit> lex{hit("b:pdf:1:x"), hit("d:pdf:1:x"), hit("a:pdf:1:x")};

    auto fused = ranker.fuse(vec, lex, 10, 0.0);
    EXPECT_EQ(ids(fused),
              (std::vector<std::string>{"b:pdf:1:x", "a:pdf:1:x", "d:pdf:1:x", "c:pdf:1:x"}));
    EXPECT_DOUBLE_EQ(fused[0].fusedScore, 1.0 / 62 + 1.0 / 61);
    EXPECT_DOUBLE_EQ(fused[1].fusedScore, 1.0 / 61 + 1.0 / 63);
    EXPECT_DOUBLE_EQ(fused[2].fusedScore, 1.0 / 62);
    EXPECT_DOUBLE_EQ(fused[3].fusedScore, 1.0 / 63);
}

TEST(FusionRankerTest, EqualSumsKeepFirstSeenOrder) {
    FusionRanker ranker;
    std::vector<SearchHit> vec{hit("A:1"), hit("B:1"), hit("C:1")};
    std::vector<SearchHit> lex{hit("B:1"), hit("A:1"), hit("D:1")};

    auto fused = ranker.fuse(vec, lex, 10, 0.0);
    EXPECT_EQ(ids(fused), (std::vector<std::string>{"A:1", "B:1", "C:1", "D:1"}));
    EXPECT_DOUBLE_EQ(fused[0].fusedScore, fused[1].fusedScore);
    EXPECT_DOUBLE_EQ(fused[2].fusedScore, 1.0 / 63);
    EXPECT_DOUBLE_EQ(fused[3].fusedScore, 1.0 / 63);
}

TEST(FusionRankerTest, TruncatesToK) {
    FusionRanker ranker;
    std::vector<SearchHit> vec{hit("a:1"), hit("b:1"), hit("c:1")};
    auto fused = ranker.fuse(vec, {}, 2, 0.0);
    EXPECT_EQ(ids(fused), (std::vector<std::string>{"a:1", "b:1"}));
}

TEST(FusionRankerTest, ScoreFloorDropsSingleListHits) {
    FusionRanker ranker;
    std::vector<SearchHit> vec{hit("a:1"), hit("b:1"), hit("c:1")};
    std::vector<SearchHit> lex{hit("b:1"), hit("d:1"), hit("a:1")};
    auto fused = ranker.fuse(vec, lex, 10, 0.03);
    EXPECT_EQ(ids(fused), (std::vector<std::string>{"b:1", "a:1"}));
}

TEST(FusionRankerTest, PerDocumentCapSkipsButKeepsWalking) {
    FusionRanker ranker(FusionConfig{60.0, 2});
    std::vector<SearchHit> vec{hit("doc1:pdf:1:a"), hit("doc1:pdf:2:b"), hit("doc1:pdf:3:c"),
                               hit("doc2:pdf:1:d")};
    auto fused = ranker.fuse(vec, {}, 3, 0.0);
    EXPECT_EQ(ids(fused),
              (std::vector<std::string>{"doc1:pdf:1:a", "doc1:pdf:2:b", "doc2:pdf:1:d"}));
}

TEST(FusionRankerTest, SnippetComesFromLexicalHighlight) {
    FusionRanker ranker;
    std::vector<SearchHit> vec{hit("a:1", std::string("vector side")), hit("b:1")};
    std::vector<SearchHit> lex{hit("b:1", std::string("<em>b</em> matched"))};
    auto fused = ranker.fuse(vec, lex, 10, 0.0);
    ASSERT_EQ(fused.size(), 2u);
    EXPECT_EQ(fused[0].hit.id, "b:1");
    EXPECT_EQ(fused[0].snippet, std::optional<std::string>("<em>b</em> matched"));
    EXPECT_FALSE(fused[1].snippet.has_value());
}

TEST(FusionRankerTest, HitInBothListsKeepsLexicalFields) {
    FusionRanker ranker;
    auto fromVector = hit("a:1");
    fromVector.title = "Vector copy";
    auto fromLexical = hit("a:1", std::string("<em>a</em>"));
    fromLexical.title = "Lexical copy";
    fromLexical.page = 4;

    auto fused = ranker.fuse({fromVector, hit("b:1")}, {fromLexical}, 10, 0.0);
    ASSERT_EQ(fused.size(), 2u);
    EXPECT_EQ(fused[0].hit.id, "a:1");
    EXPECT_EQ(fused[0].hit.title, "Lexical copy");
    EXPECT_EQ(fused[0].hit.page, std::optional<int>(4));
    EXPECT_DOUBLE_EQ(fused[0].fusedScore, 2.0 / 61);
    EXPECT_EQ(fused[1].hit.title, "");
}

TEST(FusionRankerTest, RepeatedIdInOneListCountsOnce) {
    FusionRanker ranker;
    std::vector<SearchHit> vec{hit("a:1"), hit("a:1"), hit("b:1")};
    auto fused = ranker.fuse(vec, {}, 10, 0.0);
    ASSERT_EQ(fused.size(), 2u);
    EXPECT_DOUBLE_EQ(fused[0].fusedScore, 1.0 / 61);
    // b keeps its list position
    EXPECT_DOUBLE_EQ(fused[1].fusedScore, 1.0 / 63);
}

TEST(FusionRankerTest, TiesKeepFirstSeenOrder) {
    FusionRanker ranker;
    std::vector<SearchHit> vec{hit("v:1")};
    std::vector<SearchHit> lex{hit("l:1")};
    auto fused = ranker.fuse(vec, lex, 10, 0.0);
    EXPECT_EQ(ids(fused), (std::vector<std::string>{"v:1", "l:1"}));

    auto again = ranker.fuse(vec, lex, 10, 0.0);
    EXPECT_EQ(ids(again), ids(fused));
}

TEST(FusionRankerTest, EmptyInputs) {
    FusionRanker ranker;
    EXPECT_TRUE(ranker.fuse({}, {}, 6, 0.0).empty());
}
