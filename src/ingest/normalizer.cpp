#include <docsift/ingest/normalizer.h>

#include <cctype>

namespace docsift::ingest {

namespace {

constexpr std::string_view kBulletDot = "\xE2\x80\xA2";    // U+2022
constexpr std::string_view kBulletSquare = "\xE2\x96\xAA"; // U+25AA

bool isHorizontalSpace(char c) {
    return c == ' ' || c == '\t';
}

// Length of the bullet glyph at `pos`, 0 if none.
size_t bulletAt(std::string_view line, size_t pos) {
    if (pos >= line.size()) {
        return 0;
    }
    if (line[pos] == '-') {
        return 1;
    }
    auto rest = line.substr(pos);
    if (rest.starts_with(kBulletDot)) {
        return kBulletDot.size();
    }
    if (rest.starts_with(kBulletSquare)) {
        return kBulletSquare.size();
    }
    return 0;
}

std::string unifyLineEndings(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < in.size() && in[i + 1] == '\n') {
                ++i;
            }
        } else {
            out.push_back(in[i]);
        }
    }
    return out;
}

std::string joinHyphenatedBreaks(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        if (c == '\n' && !out.empty() && out.back() == '-') {
            out.pop_back();
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string collapseHorizontalSpace(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        if (isHorizontalSpace(c)) {
            if (!out.empty() && out.back() == ' ') {
                continue;
            }
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string stripBullets(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    size_t lineStart = 0;
    while (lineStart <= in.size()) {
        size_t lineEnd = in.find('\n', lineStart);
        if (lineEnd == std::string::npos) {
            lineEnd = in.size();
        }
        std::string_view line(in.data() + lineStart, lineEnd - lineStart);

        size_t pos = 0;
        while (pos < line.size() && isHorizontalSpace(line[pos])) {
            ++pos;
        }
        if (bulletAt(line, pos) > 0) {
            while (size_t len = bulletAt(line, pos)) {
                pos += len;
                while (pos < line.size() && isHorizontalSpace(line[pos])) {
                    ++pos;
                }
            }
            line.remove_prefix(pos);
        }
        out.append(line);

        if (lineEnd == in.size()) {
            break;
        }
        out.push_back('\n');
        lineStart = lineEnd + 1;
    }
    return out;
}

std::string collapseBlankLines(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    size_t run = 0;
    for (char c : in) {
        if (c == '\n') {
            if (++run > 2) {
                continue;
            }
        } else {
            run = 0;
        }
        out.push_back(c);
    }
    return out;
}

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

} // namespace

std::string normalizeText(std::string_view text) {
    if (text.empty()) {
        return {};
    }
    auto s = unifyLineEndings(text);
    s = joinHyphenatedBreaks(s);
    s = collapseHorizontalSpace(s);
    s = stripBullets(s);
    s = collapseBlankLines(s);
    auto trimmed = trimView(s);
    if (trimmed.size() == s.size()) {
        return s;
    }
    // Trimming can expose a bullet on the new first line
    return normalizeText(trimmed);
}

std::vector<std::string> splitWords(std::string_view text) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        if (i > start) {
            words.emplace_back(text.substr(start, i - start));
        }
    }
    return words;
}

size_t countWords(std::string_view text) {
    size_t count = 0;
    bool inWord = false;
    for (char c : text) {
        bool space = std::isspace(static_cast<unsigned char>(c)) != 0;
        if (!space && !inWord) {
            ++count;
        }
        inWord = !space;
    }
    return count;
}

} // namespace docsift::ingest
