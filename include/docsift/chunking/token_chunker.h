#pragma once

#include <docsift/chunking/sentence_splitter.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docsift::chunking {

// Room reserved below max_tokens for downstream prompt scaffolding
inline constexpr size_t kDefaultTokenHeadroom = 64;

class ITokenCounter {
public:
    virtual ~ITokenCounter() = default;
    virtual size_t count(std::string_view text) const = 0;
};

// ceil(code points / 3), minimum 1. Errs on the high side for English text.
class HeuristicTokenCounter : public ITokenCounter {
public:
    size_t count(std::string_view text) const override;
};

// Adapts an external subword tokenizer
class CallbackTokenCounter : public ITokenCounter {
public:
    using CountFn = std::function<size_t(std::string_view)>;
    explicit CallbackTokenCounter(CountFn fn) : fn_(std::move(fn)) {}
    size_t count(std::string_view text) const override;

private:
    CountFn fn_;
};

size_t estimateTokens(std::string_view text);

struct TokenChunkerConfig {
    size_t tokenHeadroom = kDefaultTokenHeadroom;
};

/**
 * @brief Sentence-respecting chunker with a token budget and trailing overlap.
 *
 * Deterministic for identical input. Every returned chunk satisfies
 * count(chunk) <= max(1, maxTokens - headroom), except a single code point
 * that the counter alone rates above the budget.
 */
class TokenChunker {
public:
    explicit TokenChunker(TokenChunkerConfig config = {},
                          std::shared_ptr<const ITokenCounter> counter = nullptr,
                          std::shared_ptr<const ISentenceSplitter> splitter = nullptr);

    std::vector<std::string> chunk(std::string_view text, size_t maxTokens,
                                   size_t overlapTokens) const;

    size_t effectiveBudget(size_t maxTokens) const;
    const ITokenCounter& counter() const { return *counter_; }

    // Greedy word wrap bounded by maxChars code points; words are never split.
    static std::vector<std::string> wrapWords(std::string_view sentence, size_t maxChars);

    // Bisect at the word boundary nearest the midpoint until each piece fits.
    std::vector<std::string> enforceTokenCap(std::string_view text, size_t budget) const;

private:
    TokenChunkerConfig config_;
    std::shared_ptr<const ITokenCounter> counter_;
    std::shared_ptr<const ISentenceSplitter> splitter_;
};

} // namespace docsift::chunking
