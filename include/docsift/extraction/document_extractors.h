#pragma once

#include <docsift/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docsift::extraction {

/**
 * @brief Decoded raster handed to a recognizer. Pixel layout is the recognizer's concern.
 */
struct Image {
    int width = 0;
    int height = 0;
    std::string format; // "png", "jpeg", "rgb"
    std::vector<std::byte> data;

    int64_t area() const { return static_cast<int64_t>(width) * static_cast<int64_t>(height); }
};

struct PageText {
    int number = 0; // 1-based
    std::string text;
};

// Markdown tables keyed by 1-based page number
using PageTables = std::map<int, std::vector<std::string>>;

struct SlideContent {
    int number = 0; // 1-based
    std::string text; // shape texts joined by newlines
    std::vector<Image> images;
    std::vector<std::string> tables; // markdown
};

// Raw paragraph descriptor as read from a word-processor document
struct ParagraphInfo {
    std::string text;
    std::string styleName;
    std::optional<double> fontSize; // points, first run
    size_t runCount = 0;
    bool bold = false; // first run
    bool italic = false;
    bool underline = false;
};

// Typed document blocks; each case carries only its own fields
namespace block {

struct Heading {
    int level = 1;
    std::string text;
};

enum class EmphasisKind { BiggerFont, Underline, Bold, Italic };

struct Emphasis {
    EmphasisKind kind = EmphasisKind::Bold;
    std::string text;
};

struct ParagraphBreak {
    std::string text;
};

struct Paragraph {
    std::string text;
};

struct Table {
    std::string markdown;
};

struct Picture {
    Image image;
};

} // namespace block

using DocBlock = std::variant<block::Heading, block::Emphasis, block::ParagraphBreak,
                              block::Paragraph, block::Table, block::Picture>;

// Section label for a block kind: "heading", "bigger_font", "underline", "bold",
// "italic", "paragraph_break", "paragraph", "table", "image"
const char* blockKindName(const DocBlock& block);
const char* emphasisKindName(block::EmphasisKind kind);

/**
 * @brief Paginated documents (PDF): native text, tables and page rasters.
 */
class IPaginatedExtractor {
public:
    virtual ~IPaginatedExtractor() = default;

    virtual Result<std::vector<PageText>> pageTexts(const std::filesystem::path& path) = 0;

    // Failure is non-fatal to the document; callers continue without tables
    virtual Result<PageTables> tables(const std::filesystem::path& path) = 0;

    // Rasterized page for recognition
    virtual Result<Image> pageImage(const std::filesystem::path& path, int pageNumber) = 0;
};

/**
 * @brief Slide decks: per-slide text, embedded pictures and tables.
 */
class ISlideExtractor {
public:
    virtual ~ISlideExtractor() = default;

    virtual Result<std::vector<SlideContent>> slides(const std::filesystem::path& path) = 0;
};

/**
 * @brief Word-processor documents.
 */
class IWordExtractor {
public:
    virtual ~IWordExtractor() = default;

    virtual Result<std::vector<ParagraphInfo>> paragraphs(const std::filesystem::path& path) = 0;
    virtual Result<std::vector<std::vector<std::vector<std::string>>>>
    tables(const std::filesystem::path& path) = 0;
    virtual Result<std::vector<Image>> images(const std::filesystem::path& path) = 0;
};

/**
 * @brief Classify paragraph descriptors into typed blocks.
 *
 * Headings come from the style name ("Heading 2" -> level 2, default 1). Other
 * non-empty paragraphs are, in priority order: bigger font, underlined, bold,
 * italic (single-run paragraphs only; a run of consecutive paragraphs with the
 * same emphasis yields only the first), a paragraph break (first text after two
 * or more empty paragraphs), else a plain paragraph.
 */
std::vector<DocBlock> classifyParagraphs(const std::vector<ParagraphInfo>& paragraphs);

/**
 * @brief Full block stream: classified paragraphs, then tables, then pictures.
 *
 * Only the paragraph read is fatal; table and image failures are logged and skipped.
 */
Result<std::vector<DocBlock>> readWordBlocks(IWordExtractor& extractor,
                                             const std::filesystem::path& path);

/**
 * @brief GitHub-style markdown table; ragged rows are padded to the widest row.
 *
 * Returns nothing when there are no rows or every cell is empty. A single row
 * renders as a bare header line.
 */
std::optional<std::string> rowsToMarkdown(const std::vector<std::vector<std::string>>& rows);

/**
 * @brief Read a UTF-8 text file, dropping invalid byte sequences.
 */
Result<std::string> readPlainText(const std::filesystem::path& path);

// Drop bytes that do not form valid UTF-8 sequences
std::string sanitizeUtf8(std::string_view input);

} // namespace docsift::extraction
