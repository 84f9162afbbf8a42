#pragma once

#include <docsift/chunking/token_chunker.h>
#include <docsift/extraction/document_extractors.h>

#include <optional>
#include <string>
#include <vector>

namespace docsift::ingest {

// Chunks produced by closing one section, labelled with that section's kind
struct SectionChunks {
    std::string section;
    std::vector<std::string> texts;
};

/**
 * @brief Section segmentation state for word-processor block streams.
 *
 * Holds the pending text buffer, the current section label and the number of
 * blocks buffered since the last flush. While fewer than `warmupBlocks` blocks
 * are buffered, blocks are appended without boundary checks and the first one
 * sets the label. After that, a heading of level <= 3, an emphasised
 * paragraph or a paragraph break closes the current section.
 *
 * Tables and pictures are not fed here; the driver calls flush() and
 * resetBlockCount() around them.
 */
class WordSectionState {
public:
    WordSectionState(const chunking::TokenChunker& chunker, size_t maxTokens, size_t overlapTokens,
                     size_t warmupBlocks = 3);

    // Returns the closed section's chunks when `block` starts a new section
    std::optional<SectionChunks> feed(const extraction::DocBlock& block);

    // Normalize and chunk the buffer; the block count resets only if text was pending
    SectionChunks flush();

    void resetBlockCount() { blockCount_ = 0; }

    const std::string& currentSection() const { return section_; }
    size_t bufferedBlocks() const { return blockCount_; }
    bool warmingUp() const { return blockCount_ < warmupBlocks_; }

    static bool isSectionBoundary(const extraction::DocBlock& block);
    static std::string blockText(const extraction::DocBlock& block);

private:
    void append(std::string text);

    const chunking::TokenChunker& chunker_;
    size_t maxTokens_;
    size_t overlapTokens_;
    size_t warmupBlocks_;

    std::vector<std::string> buffer_;
    std::string section_;
    size_t blockCount_ = 0;
};

} // namespace docsift::ingest
