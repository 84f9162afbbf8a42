#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace docsift::chunking {

class ISentenceSplitter {
public:
    virtual ~ISentenceSplitter() = default;

    // Sentences in order, trimmed. May return empty when nothing can be split.
    virtual std::vector<std::string> split(std::string_view text) const = 0;
};

/**
 * @brief English sentence boundary detection.
 *
 * A boundary is terminal punctuation (. ! ?, possibly repeated and followed by
 * closing quotes/brackets) followed by whitespace, where the next word does not
 * start lower-case and the word before the period is not a known abbreviation
 * or a single-letter initial.
 */
class RuleBasedSentenceSplitter : public ISentenceSplitter {
public:
    RuleBasedSentenceSplitter();
    explicit RuleBasedSentenceSplitter(std::unordered_set<std::string> abbreviations);

    std::vector<std::string> split(std::string_view text) const override;

    bool isAbbreviation(std::string_view word) const;

private:
    std::unordered_set<std::string> abbreviations_;
};

} // namespace docsift::chunking
