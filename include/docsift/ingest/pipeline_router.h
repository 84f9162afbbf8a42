#pragma once

#include <docsift/chunking/token_chunker.h>
#include <docsift/config/pipeline_config.h>
#include <docsift/core/types.h>
#include <docsift/ingest/format_pipelines.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace docsift::ingest {

enum class DocumentKind { Paginated, SlideDeck, WordDocument, PlainTranscript, Video };

const char* documentKindToString(DocumentKind kind);

// By lower-cased extension: .pdf .pptx .docx .txt .md .mp4
std::optional<DocumentKind> kindFromPath(const std::filesystem::path& path);

/**
 * @brief Dispatches one file to its format pipeline and applies the chunk-level
 * dedup pass (all formats except video).
 *
 * Files are processed one at a time, start to finish.
 */
class PipelineRouter {
public:
    PipelineRouter(config::PipelineConfig config, IngestServices services);

    Result<size_t> process(const std::filesystem::path& path, const ChunkSink& sink);
    Result<size_t> process(const std::filesystem::path& path, size_t maxTokens,
                           size_t overlapTokens, const ChunkSink& sink);

    // Materialized form of process()
    Result<std::vector<Chunk>> collect(const std::filesystem::path& path);

    const config::PipelineConfig& config() const { return config_; }
    IngestServices& services() { return services_; }

private:
    config::PipelineConfig config_;
    IngestServices services_;
    chunking::TokenChunker chunker_;
};

} // namespace docsift::ingest
