#pragma once

#include <docsift/core/types.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace docsift::ingest {

// Closed set of source tags stored with every chunk. Video transcripts use Transcript.
enum class SourceType { Pdf, Pptx, Transcript, Docx };

// Absent caption means ordinary prose
enum class CaptionKind { Ocr, Table };

const char* sourceTypeToString(SourceType type);
std::optional<SourceType> parseSourceType(std::string_view name);

const char* captionToString(CaptionKind kind);
std::optional<CaptionKind> parseCaption(std::string_view name);

// At most one field is meaningful for a given source type
struct ChunkLocation {
    std::optional<int> page;
    std::optional<int> slide;
    std::optional<std::string> timecode;
    std::optional<std::string> section;
};

/**
 * @brief The atomic indexable unit handed from ingestion to indexing and back.
 */
struct Chunk {
    std::string docId;
    std::string chunkId;
    SourceType source = SourceType::Pdf;
    std::string title;

    std::optional<int> page;
    std::optional<int> slide;
    std::optional<std::string> timecode;
    std::optional<std::string> section;

    std::string text;
    std::optional<CaptionKind> caption;
    std::optional<double> confidence; // 0-100, recognition-derived text only
    std::string createdAt;

    // First present of page, slide, timecode, section; "0" otherwise
    std::string locator() const;
};

/**
 * @brief Build a chunk with a fresh v4 UUID and the current UTC timestamp.
 */
Chunk makeChunk(std::string docId, SourceType source, std::string title, std::string text,
                ChunkLocation location = {}, std::optional<CaptionKind> caption = std::nullopt,
                std::optional<double> confidence = std::nullopt);

// YYYY-MM-DDTHH:MM:SS.mmmZ
std::string utcTimestamp(TimePoint when = std::chrono::system_clock::now());

/**
 * @brief Stable per-file identifier: first 32 hex digits of SHA-256 over the contents.
 */
Result<std::string> documentId(const std::filesystem::path& path);

// "quarterly_report-final.pdf" -> "Quarterly Report Final"
std::string titleFromPath(const std::filesystem::path& path);

/**
 * @brief Deterministic index key so re-ingesting an unchanged unit overwrites it.
 *
 * "<docId>:<source>:<locator>:<first 12 hex of SHA-1(locator|text)>"
 */
std::string stableChunkId(std::string_view docId, SourceType source, std::string_view locator,
                          std::string_view text);
std::string stableChunkId(const Chunk& chunk);

// 3725.4 -> "01:02:05"
std::string formatHhmmss(double seconds);
// "HH:MM:SS-HH:MM:SS"
std::string formatTimecode(double start, double end);

void to_json(nlohmann::json& j, const Chunk& chunk);
void from_json(const nlohmann::json& j, Chunk& chunk);

} // namespace docsift::ingest
