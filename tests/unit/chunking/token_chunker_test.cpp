#include <gtest/gtest.h>
#include <docsift/chunking/token_chunker.h>
#include <docsift/ingest/normalizer.h>

#include <string>
#include <vector>

using namespace docsift::chunking;

namespace {

std::shared_ptr<const ITokenCounter> wordCounter() {
    return std::make_shared<CallbackTokenCounter>(
        [](std::string_view text) { return docsift::ingest::countWords(text); });
}

// "S<id>w0 w1 ... w<n-1>." : n words, capitalised so the splitter breaks before it
std::string sentence(int id, size_t words) {
    std::string out = "S" + std::to_string(id) + "w0";
    for (size_t i = 1; i < words; ++i) {
        out += " w" + std::to_string(i);
    }
    out += ".";
    return out;
}

std::string sentences(int count, size_t words) {
    std::string out;
    for (int i = 1; i <= count; ++i) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += sentence(i, words);
    }
    return out;
}

std::string longProse() {
    std::string out;
    for (int i = 0; i < 40; ++i) {
        out += "Paragraph " + std::to_string(i) +
               " describes the quarterly figures in some detail and adds context. ";
        if (i % 7 == 0) {
            out += "An extremely long run-on sentence follows that keeps going with many many "
                   "words and clauses and qualifications so that it certainly exceeds the small "
                   "budget used here and has to be wrapped at word boundaries before emission. ";
        }
    }
    return out;
}

} // namespace

TEST(TokenChunkerTest, EmptyInputYieldsNoChunks) {
    TokenChunker chunker;
    EXPECT_TRUE(chunker.chunk("", 512, 120).empty());
    EXPECT_TRUE(chunker.chunk("  \n\t ", 512, 120).empty());
}

TEST(TokenChunkerTest, EffectiveBudgetSubtractsHeadroom) {
    TokenChunker chunker(TokenChunkerConfig{64});
    EXPECT_EQ(chunker.effectiveBudget(512), 448u);
    EXPECT_EQ(chunker.effectiveBudget(64), 1u);
    EXPECT_EQ(chunker.effectiveBudget(10), 1u);
}

TEST(TokenChunkerTest, HeuristicEstimateIsCeilOfCharactersOverThree) {
    EXPECT_EQ(estimateTokens(""), 1u);
    EXPECT_EQ(estimateTokens("abc"), 1u);
    EXPECT_EQ(estimateTokens("abcd"), 2u);
    EXPECT_EQ(HeuristicTokenCounter().count(std::string(300, 'a')), 100u);
}

TEST(TokenChunkerTest, HeuristicEstimateCountsCodePointsNotBytes) {
    EXPECT_EQ(estimateTokens("\u03b1\u03b2\u03b3\u03b4\u03b5\u03b6"), 2u); // six Greek letters
    EXPECT_EQ(estimateTokens("\u03b1\u03b2\u03b3\u03b4"), 2u);
    EXPECT_EQ(estimateTokens("caf\u00e9"), 2u);
}

TEST(TokenChunkerTest, GreekTextUsesTheFullBudget) {
    // 60 four-letter words: 299 characters, 539 bytes
    std::string text;
    for (int i = 0; i < 60; ++i) {
        if (!text.empty()) {
            text.push_back(' ');
        }
        text += "\u03b1\u03b2\u03b3\u03b4";
    }
    ASSERT_EQ(estimateTokens(text), 100u);

    TokenChunker chunker;
    auto chunks = chunker.chunk(text, 164, 0); // budget 100
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], text);
}

TEST(TokenChunkerTest, ShortTextIsOneChunk) {
    TokenChunker chunker;
    auto chunks = chunker.chunk("  A single short sentence.  ", 512, 120);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], "A single short sentence.");
}

TEST(TokenChunkerTest, OverlapLargerThanSentenceTailIsEmpty) {
    TokenChunker chunker(TokenChunkerConfig{0}, wordCounter());
    const auto text = sentences(3, 20);

    auto chunks = chunker.chunk(text, 50, 10);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], sentence(1, 20) + " " + sentence(2, 20));
    EXPECT_EQ(chunks[1], sentence(3, 20));
}

TEST(TokenChunkerTest, TrailingSentencesCarryOver) {
    TokenChunker chunker(TokenChunkerConfig{0}, wordCounter());
    auto chunks = chunker.chunk(sentences(8, 5), 20, 6);

    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], sentences(4, 5));
    // The last sentence of the previous chunk fits the 6-token overlap
    EXPECT_EQ(chunks[1].rfind(sentence(4, 5), 0), 0u);
}

TEST(TokenChunkerTest, EveryChunkFitsTheBudget) {
    TokenChunker chunker;
    for (size_t maxTokens : {80u, 100u, 200u, 512u}) {
        auto chunks = chunker.chunk(longProse(), maxTokens, 20);
        ASSERT_FALSE(chunks.empty());
        const size_t budget = chunker.effectiveBudget(maxTokens);
        for (const auto& c : chunks) {
            EXPECT_LE(estimateTokens(c), budget) << "max_tokens=" << maxTokens << " chunk=" << c;
            EXPECT_FALSE(c.empty());
        }
    }
}

TEST(TokenChunkerTest, ZeroOverlapPreservesWordOrder) {
    TokenChunker chunker;
    const auto text = longProse();
    auto chunks = chunker.chunk(text, 100, 0);

    std::vector<std::string> rebuilt;
    for (const auto& c : chunks) {
        for (auto& w : docsift::ingest::splitWords(c)) {
            rebuilt.push_back(std::move(w));
        }
    }
    EXPECT_EQ(rebuilt, docsift::ingest::splitWords(text));
}

TEST(TokenChunkerTest, IsDeterministic) {
    TokenChunker chunker;
    EXPECT_EQ(chunker.chunk(longProse(), 120, 30), chunker.chunk(longProse(), 120, 30));
}

TEST(TokenChunkerTest, UnbrokenTextIsBisected) {
    TokenChunker chunker;
    const std::string blob(1000, 'x');
    auto pieces = chunker.enforceTokenCap(blob, 10);
    ASSERT_GT(pieces.size(), 1u);

    std::string joined;
    for (const auto& p : pieces) {
        EXPECT_LE(estimateTokens(p), 10u);
        joined += p;
    }
    EXPECT_EQ(joined, blob);

    auto viaChunk = chunker.chunk(blob, 74, 0); // budget 10
    for (const auto& p : viaChunk) {
        EXPECT_LE(estimateTokens(p), 10u);
    }
}

TEST(TokenChunkerTest, BisectionDoesNotSplitCodePoints) {
    TokenChunker chunker;
    std::string blob;
    for (int i = 0; i < 200; ++i) {
        blob += "\xC3\xA9"; // é
    }
    for (const auto& p : chunker.enforceTokenCap(blob, 5)) {
        ASSERT_FALSE(p.empty());
        EXPECT_NE(static_cast<unsigned char>(p.front()) & 0xC0, 0x80);
    }
}

TEST(TokenChunkerTest, WrapWordsNeverSplitsWords) {
    auto parts = TokenChunker::wrapWords("alpha beta gamma delta", 11);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "alpha beta");
    EXPECT_EQ(parts[1], "gamma delta");

    auto single = TokenChunker::wrapWords("unbreakableword", 4);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0], "unbreakableword");
}

TEST(TokenChunkerTest, WrapWordsMeasuresCharacters) {
    // Each word is three characters in six bytes
    auto parts = TokenChunker::wrapWords("\u03b1\u03b2\u03b3 \u03b4\u03b5\u03b6 \u03b7\u03b8\u03b9", 7);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "\u03b1\u03b2\u03b3 \u03b4\u03b5\u03b6");
    EXPECT_EQ(parts[1], "\u03b7\u03b8\u03b9");
}
