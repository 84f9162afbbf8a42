#include <docsift/common/utf8_utils.h>
#include <docsift/crypto/hasher.h>
#include <docsift/ingest/dedup.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace docsift::ingest {

namespace {

std::string_view trimLine(std::string_view s) {
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

template <typename Fn> void forEachLine(std::string_view text, Fn&& fn) {
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        fn(line);
        if (end == text.size()) {
            break;
        }
        start = end + 1;
    }
}

// "12", "page 12", "Page12" (case-insensitive)
bool isPageNumberLine(std::string_view line) {
    size_t i = 0;
    constexpr std::string_view kPage = "page";
    if (line.size() >= kPage.size()) {
        bool prefix = true;
        for (size_t k = 0; k < kPage.size(); ++k) {
            if (std::tolower(static_cast<unsigned char>(line[k])) != kPage[k]) {
                prefix = false;
                break;
            }
        }
        if (prefix) {
            i = kPage.size();
            while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) {
                ++i;
            }
        }
    }
    if (i >= line.size()) {
        return false;
    }
    for (; i < line.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(line[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

BoilerplateSet findBoilerplate(const std::vector<std::string>& pages, double minFraction,
                               size_t maxLineLength) {
    spdlog::debug("Scanning {} pages/slides for boilerplate (min_fraction={})", pages.size(),
                  minFraction);
    const double total = static_cast<double>(std::max<size_t>(pages.size(), 1));

    std::unordered_map<std::string, size_t> counts;
    for (const auto& page : pages) {
        std::unordered_set<std::string> seenOnPage;
        forEachLine(page, [&](std::string_view raw) {
            auto line = trimLine(raw);
            if (!line.empty() && common::utf8Length(line) <= maxLineLength) {
                seenOnPage.emplace(line);
            }
        });
        for (const auto& line : seenOnPage) {
            ++counts[line];
        }
    }

    BoilerplateSet boilerplate;
    for (const auto& [line, count] : counts) {
        if (static_cast<double>(count) / total >= minFraction) {
            boilerplate.insert(line);
        }
    }
    spdlog::debug("Found {} boilerplate lines", boilerplate.size());
    return boilerplate;
}

std::string dropBoilerplate(std::string_view text, const BoilerplateSet& boilerplate) {
    if (boilerplate.empty()) {
        return std::string(text);
    }
    std::string out;
    out.reserve(text.size());
    forEachLine(text, [&](std::string_view raw) {
        auto line = trimLine(raw);
        if (line.empty() || boilerplate.contains(std::string(line))) {
            return;
        }
        if (!out.empty()) {
            out.push_back('\n');
        }
        out.append(raw);
    });
    return out;
}

std::string canonicalizeForHash(std::string_view text) {
    if (text.empty()) {
        return {};
    }

    std::string joined;
    forEachLine(text, [&](std::string_view raw) {
        auto line = trimLine(raw);
        if (line.empty() || isPageNumberLine(line)) {
            return;
        }
        if (line.back() == '.') {
            line.remove_suffix(1);
        }
        if (!joined.empty()) {
            joined += ". ";
        }
        joined.append(line);
    });

    std::string out;
    out.reserve(joined.size());
    for (char c : joined) {
        if (c == ' ' || c == '\t') {
            if (!out.empty() && out.back() == ' ') {
                continue;
            }
            out.push_back(' ');
        } else {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    auto trimmed = trimLine(out);
    return std::string(trimmed);
}

DedupSignature signature(std::string_view canonical) {
    return crypto::sha1Hex(canonical);
}

bool isDuplicate(const DedupSignature& sig, SignatureSet& seen) {
    return !seen.insert(sig).second;
}

} // namespace docsift::ingest
