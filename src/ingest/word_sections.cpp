#include <docsift/ingest/normalizer.h>
#include <docsift/ingest/word_sections.h>

#include <spdlog/spdlog.h>

namespace docsift::ingest {

namespace {

constexpr int kMaxSectionHeadingLevel = 3;

} // namespace

WordSectionState::WordSectionState(const chunking::TokenChunker& chunker, size_t maxTokens,
                                   size_t overlapTokens, size_t warmupBlocks)
    : chunker_(chunker),
      maxTokens_(maxTokens),
      overlapTokens_(overlapTokens),
      warmupBlocks_(warmupBlocks) {}

bool WordSectionState::isSectionBoundary(const extraction::DocBlock& block) {
    if (const auto* h = std::get_if<extraction::block::Heading>(&block)) {
        return h->level <= kMaxSectionHeadingLevel;
    }
    return std::holds_alternative<extraction::block::Emphasis>(block) ||
           std::holds_alternative<extraction::block::ParagraphBreak>(block);
}

std::string WordSectionState::blockText(const extraction::DocBlock& block) {
    struct Visitor {
        std::string operator()(const extraction::block::Heading& b) const { return b.text; }
        std::string operator()(const extraction::block::Emphasis& b) const { return b.text; }
        std::string operator()(const extraction::block::ParagraphBreak& b) const { return b.text; }
        std::string operator()(const extraction::block::Paragraph& b) const { return b.text; }
        std::string operator()(const extraction::block::Table&) const { return {}; }
        std::string operator()(const extraction::block::Picture&) const { return {}; }
    };
    return std::visit(Visitor{}, block);
}

void WordSectionState::append(std::string text) {
    if (!text.empty()) {
        buffer_.push_back(std::move(text));
        ++blockCount_;
    }
}

std::optional<SectionChunks> WordSectionState::feed(const extraction::DocBlock& block) {
    const std::string kind = extraction::blockKindName(block);

    if (warmingUp()) {
        if (blockCount_ == 0) {
            section_ = kind;
        }
        append(blockText(block));
        return std::nullopt;
    }

    if (isSectionBoundary(block)) {
        auto closed = flush();
        section_ = kind;
        append(blockText(block));
        return closed;
    }

    append(blockText(block));
    return std::nullopt;
}

SectionChunks WordSectionState::flush() {
    SectionChunks out{section_, {}};
    if (buffer_.empty()) {
        return out;
    }

    std::string joined;
    for (const auto& part : buffer_) {
        if (!joined.empty()) {
            joined.push_back('\n');
        }
        joined += part;
    }
    out.texts = chunker_.chunk(normalizeText(joined), maxTokens_, overlapTokens_);
    buffer_.clear();
    blockCount_ = 0;
    spdlog::debug("Section '{}' -> {} chunks", out.section, out.texts.size());
    return out;
}

} // namespace docsift::ingest
