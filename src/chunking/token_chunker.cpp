#include <docsift/chunking/token_chunker.h>
#include <docsift/common/utf8_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <deque>

namespace docsift::chunking {

namespace {

std::string_view trimView(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return s.substr(b, e - b);
}

template <typename Container> std::string joinSentences(const Container& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += p;
    }
    return std::string(trimView(out));
}

using common::isContinuationByte;

// Split offset for bisecting `t`, or npos when it cannot shrink further.
size_t findSplit(std::string_view t) {
    const size_t mid = t.size() / 2;
    if (mid > 0) {
        size_t pos = t.rfind(' ', mid - 1);
        if (pos != std::string_view::npos && pos > 0) {
            return pos;
        }
    }
    size_t pos = t.find(' ', mid);
    if (pos != std::string_view::npos && pos > 0 && pos + 1 < t.size()) {
        return pos;
    }

    // No spaces: cut an unbroken token stream at a code point boundary
    size_t cut = mid;
    while (cut > 0 && isContinuationByte(t[cut])) {
        --cut;
    }
    if (cut == 0) {
        cut = mid;
        while (cut < t.size() && isContinuationByte(t[cut])) {
            ++cut;
        }
    }
    if (cut == 0 || cut >= t.size()) {
        return std::string_view::npos;
    }
    return cut;
}

} // namespace

size_t HeuristicTokenCounter::count(std::string_view text) const {
    return estimateTokens(text);
}

size_t CallbackTokenCounter::count(std::string_view text) const {
    return std::max<size_t>(1, fn_(text));
}

size_t estimateTokens(std::string_view text) {
    return std::max<size_t>(1, (common::utf8Length(text) + 2) / 3);
}

TokenChunker::TokenChunker(TokenChunkerConfig config,
                           std::shared_ptr<const ITokenCounter> counter,
                           std::shared_ptr<const ISentenceSplitter> splitter)
    : config_(config), counter_(std::move(counter)), splitter_(std::move(splitter)) {
    if (!counter_) {
        counter_ = std::make_shared<HeuristicTokenCounter>();
    }
    if (!splitter_) {
        splitter_ = std::make_shared<RuleBasedSentenceSplitter>();
    }
}

size_t TokenChunker::effectiveBudget(size_t maxTokens) const {
    if (maxTokens <= config_.tokenHeadroom) {
        return 1;
    }
    return maxTokens - config_.tokenHeadroom;
}

std::vector<std::string> TokenChunker::chunk(std::string_view text, size_t maxTokens,
                                             size_t overlapTokens) const {
    auto body = trimView(text);
    if (body.empty()) {
        return {};
    }
    const size_t budget = effectiveBudget(maxTokens);

    std::vector<std::string> sentences = splitter_->split(body);
    if (sentences.empty()) {
        sentences.emplace_back(body);
    }

    std::vector<std::string> assembled;
    std::deque<std::string> current;
    std::deque<size_t> currentCounts;
    size_t currentTokens = 0;

    auto closeCurrent = [&]() {
        if (!current.empty()) {
            assembled.push_back(joinSentences(current));
        }
    };

    for (auto& sentence : sentences) {
        const size_t st = counter_->count(sentence);
        if (currentTokens + st <= budget) {
            currentTokens += st;
            currentCounts.push_back(st);
            current.push_back(std::move(sentence));
            continue;
        }

        if (st > budget) {
            closeCurrent();
            current.clear();
            currentCounts.clear();
            currentTokens = 0;
            for (auto& piece : wrapWords(sentence, budget * 4)) {
                assembled.push_back(std::move(piece));
            }
            continue;
        }

        closeCurrent();

        // Seed the next buffer with trailing sentences that fit the overlap.
        // The tail may legitimately be empty.
        std::deque<std::string> tail;
        std::deque<size_t> tailCounts;
        size_t tailTokens = 0;
        for (size_t i = current.size(); i-- > 0;) {
            if (tailTokens + currentCounts[i] > overlapTokens) {
                break;
            }
            tailTokens += currentCounts[i];
            tail.push_front(std::move(current[i]));
            tailCounts.push_front(currentCounts[i]);
        }
        while (!tail.empty() && tailTokens + st > budget) {
            tailTokens -= tailCounts.front();
            tail.pop_front();
            tailCounts.pop_front();
        }

        current = std::move(tail);
        currentCounts = std::move(tailCounts);
        currentTokens = tailTokens + st;
        current.push_back(std::move(sentence));
        currentCounts.push_back(st);
    }
    closeCurrent();

    std::vector<std::string> chunks;
    for (const auto& c : assembled) {
        for (auto& piece : enforceTokenCap(c, budget)) {
            chunks.push_back(std::move(piece));
        }
    }

    spdlog::debug("Produced {} chunks (max_tokens={}, effective_max={}, overlap_tokens={})",
                  chunks.size(), maxTokens, budget, overlapTokens);
    return chunks;
}

std::vector<std::string> TokenChunker::wrapWords(std::string_view sentence, size_t maxChars) {
    std::vector<std::string> parts;
    std::string cur;
    size_t curChars = 0;
    size_t i = 0;
    while (i < sentence.size()) {
        while (i < sentence.size() && std::isspace(static_cast<unsigned char>(sentence[i]))) {
            ++i;
        }
        size_t start = i;
        while (i < sentence.size() && !std::isspace(static_cast<unsigned char>(sentence[i]))) {
            ++i;
        }
        if (i == start) {
            break;
        }
        auto word = sentence.substr(start, i - start);
        const size_t wordChars = common::utf8Length(word);
        const size_t addition = wordChars + (cur.empty() ? 0 : 1);
        if (!cur.empty() && curChars + addition > maxChars) {
            parts.push_back(std::move(cur));
            cur.assign(word);
            curChars = wordChars;
        } else {
            if (!cur.empty()) {
                cur.push_back(' ');
            }
            cur.append(word);
            curChars += addition;
        }
    }
    if (!cur.empty()) {
        parts.push_back(std::move(cur));
    }
    return parts;
}

std::vector<std::string> TokenChunker::enforceTokenCap(std::string_view text, size_t budget) const {
    std::vector<std::string> out;
    // Work stack in place of recursion; right half pushed first so output stays in order
    std::vector<std::string_view> pending{trimView(text)};
    while (!pending.empty()) {
        auto piece = trimView(pending.back());
        pending.pop_back();
        if (piece.empty()) {
            continue;
        }
        if (counter_->count(piece) <= budget) {
            out.emplace_back(piece);
            continue;
        }
        const size_t split = findSplit(piece);
        if (split == std::string_view::npos) {
            spdlog::warn("Cannot split {}-byte piece below {} tokens", piece.size(), budget);
            out.emplace_back(piece);
            continue;
        }
        pending.push_back(piece.substr(split));
        pending.push_back(piece.substr(0, split));
    }
    return out;
}

} // namespace docsift::chunking
