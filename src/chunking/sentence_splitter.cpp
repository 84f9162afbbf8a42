#include <docsift/chunking/sentence_splitter.h>

#include <cctype>

namespace docsift::chunking {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isClosing(char c) {
    return c == '"' || c == '\'' || c == ')' || c == ']' || c == '}';
}

bool isTerminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

std::string lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

void appendTrimmed(std::vector<std::string>& out, std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isSpace(s[b])) {
        ++b;
    }
    while (e > b && isSpace(s[e - 1])) {
        --e;
    }
    if (e > b) {
        out.emplace_back(s.substr(b, e - b));
    }
}

} // namespace

RuleBasedSentenceSplitter::RuleBasedSentenceSplitter()
    : abbreviations_{"mr",   "mrs",  "ms",   "dr",   "prof", "sr",   "jr",  "st",  "vs",
                     "etc",  "e.g",  "i.e",  "inc",  "ltd",  "co",   "corp", "fig", "no",
                     "vol",  "pp",   "approx", "dept", "est", "jan",  "feb", "mar", "apr",
                     "jun",  "jul",  "aug",  "sep",  "sept", "oct",  "nov", "dec", "cf",
                     "al",   "gen",  "col",  "lt",   "sgt",  "capt", "mt",  "ave", "rd"} {}

RuleBasedSentenceSplitter::RuleBasedSentenceSplitter(std::unordered_set<std::string> abbreviations)
    : abbreviations_(std::move(abbreviations)) {}

bool RuleBasedSentenceSplitter::isAbbreviation(std::string_view word) const {
    if (word.empty()) {
        return false;
    }
    // Single-letter initials ("J. Smith")
    if (word.size() == 1 && std::isalpha(static_cast<unsigned char>(word[0]))) {
        return true;
    }
    return abbreviations_.contains(lower(word));
}

std::vector<std::string> RuleBasedSentenceSplitter::split(std::string_view text) const {
    std::vector<std::string> sentences;
    size_t start = 0;
    size_t i = 0;

    while (i < text.size()) {
        if (!isTerminal(text[i])) {
            ++i;
            continue;
        }

        size_t punctPos = i;
        size_t end = i + 1;
        while (end < text.size() && isTerminal(text[end])) {
            ++end;
        }
        while (end < text.size() && isClosing(text[end])) {
            ++end;
        }
        if (end < text.size() && !isSpace(text[end])) {
            // "3.14", "e.g.x", "a.b"
            i = end;
            continue;
        }

        size_t next = end;
        while (next < text.size() && isSpace(text[next])) {
            ++next;
        }
        bool boundary = true;
        if (next < text.size() && std::islower(static_cast<unsigned char>(text[next]))) {
            boundary = false;
        }
        if (boundary && text[punctPos] == '.' && end == punctPos + 1) {
            size_t wordStart = punctPos;
            while (wordStart > start && !isSpace(text[wordStart - 1])) {
                --wordStart;
            }
            auto word = text.substr(wordStart, punctPos - wordStart);
            while (!word.empty() && (word.front() == '(' || word.front() == '"' ||
                                     word.front() == '\'')) {
                word.remove_prefix(1);
            }
            if (isAbbreviation(word)) {
                boundary = false;
            }
        }

        if (boundary) {
            appendTrimmed(sentences, text.substr(start, end - start));
            start = next;
        }
        i = next > end ? next : end;
    }

    if (start < text.size()) {
        appendTrimmed(sentences, text.substr(start));
    }
    return sentences;
}

} // namespace docsift::chunking
