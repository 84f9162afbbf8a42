#include <docsift/extraction/document_extractors.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>

namespace docsift::extraction {

namespace {

enum class ParagraphStatus {
    None,
    Heading,
    BiggerFont,
    Underline,
    Bold,
    Italic,
    Empty,
    ParagraphBreak,
    Paragraph
};

bool isBlank(std::string_view s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string toLower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// "Heading 2" -> 2; "Heading" or anything unparsable -> 1
int headingLevel(std::string_view lowered) {
    auto rest = lowered.substr(std::string_view("heading").size());
    while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.front()))) {
        rest.remove_prefix(1);
    }
    while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.back()))) {
        rest.remove_suffix(1);
    }
    if (rest.empty()) {
        return 1;
    }
    int level = 0;
    auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), level);
    if (ec != std::errc{} || ptr != rest.data() + rest.size() || level == 0) {
        return 1;
    }
    return level;
}

} // namespace

const char* emphasisKindName(block::EmphasisKind kind) {
    switch (kind) {
        case block::EmphasisKind::BiggerFont: return "bigger_font";
        case block::EmphasisKind::Underline: return "underline";
        case block::EmphasisKind::Bold: return "bold";
        case block::EmphasisKind::Italic: return "italic";
    }
    return "paragraph";
}

const char* blockKindName(const DocBlock& b) {
    struct Visitor {
        const char* operator()(const block::Heading&) const { return "heading"; }
        const char* operator()(const block::Emphasis& e) const { return emphasisKindName(e.kind); }
        const char* operator()(const block::ParagraphBreak&) const { return "paragraph_break"; }
        const char* operator()(const block::Paragraph&) const { return "paragraph"; }
        const char* operator()(const block::Table&) const { return "table"; }
        const char* operator()(const block::Picture&) const { return "image"; }
    };
    return std::visit(Visitor{}, b);
}

std::vector<DocBlock> classifyParagraphs(const std::vector<ParagraphInfo>& paragraphs) {
    std::vector<DocBlock> blocks;
    auto status = ParagraphStatus::None;
    int previousSize = 12;
    size_t emptyRun = 0;

    auto emphasis = [&](ParagraphStatus next, block::EmphasisKind kind, const std::string& text) {
        if (status != next) {
            blocks.emplace_back(block::Emphasis{kind, text});
        }
        status = next;
    };

    for (const auto& p : paragraphs) {
        const int size = p.fontSize ? static_cast<int>(*p.fontSize) : 12;
        const auto style = toLower(p.styleName);

        if (style.starts_with("heading")) {
            if (!isBlank(p.text)) {
                blocks.emplace_back(block::Heading{headingLevel(style), p.text});
                status = ParagraphStatus::Heading;
                emptyRun = 0;
                previousSize = size;
            }
            continue;
        }

        if (isBlank(p.text)) {
            ++emptyRun;
            status = ParagraphStatus::Empty;
            continue;
        }

        const bool singleRun = p.runCount == 1;
        if (singleRun && size > previousSize) {
            emphasis(ParagraphStatus::BiggerFont, block::EmphasisKind::BiggerFont, p.text);
        } else if (singleRun && p.underline) {
            emphasis(ParagraphStatus::Underline, block::EmphasisKind::Underline, p.text);
        } else if (singleRun && p.bold) {
            emphasis(ParagraphStatus::Bold, block::EmphasisKind::Bold, p.text);
        } else if (singleRun && p.italic) {
            emphasis(ParagraphStatus::Italic, block::EmphasisKind::Italic, p.text);
        } else if (status == ParagraphStatus::Empty && emptyRun >= 2) {
            blocks.emplace_back(block::ParagraphBreak{p.text});
            status = ParagraphStatus::ParagraphBreak;
        } else {
            blocks.emplace_back(block::Paragraph{p.text});
            status = ParagraphStatus::Paragraph;
        }
        emptyRun = 0;
        previousSize = size;
    }
    return blocks;
}

Result<std::vector<DocBlock>> readWordBlocks(IWordExtractor& extractor,
                                             const std::filesystem::path& path) {
    spdlog::debug("Parsing word document: {}", path.string());
    auto paragraphs = extractor.paragraphs(path);
    if (!paragraphs) {
        return paragraphs.error();
    }
    auto blocks = classifyParagraphs(paragraphs.value());

    if (auto tables = extractor.tables(path)) {
        for (const auto& rows : tables.value()) {
            auto md = rowsToMarkdown(rows);
            if (md && !isBlank(*md)) {
                blocks.emplace_back(block::Table{std::move(*md)});
            }
        }
    } else {
        spdlog::warn("Table extraction failed for {}: {}", path.string(), tables.error().message);
    }

    if (auto images = extractor.images(path)) {
        for (auto& image : images.value()) {
            blocks.emplace_back(block::Picture{std::move(image)});
        }
    } else {
        spdlog::warn("Image extraction failed for {}: {}", path.string(), images.error().message);
    }

    spdlog::debug("{} blocks loaded from {}", blocks.size(), path.string());
    return blocks;
}

} // namespace docsift::extraction
