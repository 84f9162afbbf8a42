#pragma once

#include <docsift/chunking/token_chunker.h>
#include <docsift/config/pipeline_config.h>
#include <docsift/core/types.h>
#include <docsift/extraction/document_extractors.h>
#include <docsift/ingest/chunk_record.h>
#include <docsift/media/video_tools.h>
#include <docsift/recognition/image_recognizer.h>
#include <docsift/recognition/speech_transcriber.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace docsift::ingest {

// Receives chunks in emission order
using ChunkSink = std::function<void(Chunk&&)>;

/**
 * @brief External collaborators used by the format pipelines.
 *
 * Any member may be null; a pipeline that needs a missing extractor fails with
 * NotSupported, a missing recognizer simply disables recognition enrichment.
 * A null token counter or sentence splitter selects the chunker's built-in one.
 */
struct IngestServices {
    std::shared_ptr<extraction::IPaginatedExtractor> paginated;
    std::shared_ptr<extraction::ISlideExtractor> slides;
    std::shared_ptr<extraction::IWordExtractor> word;
    std::shared_ptr<recognition::IImageRecognizer> recognizer;
    std::shared_ptr<recognition::ISpeechTranscriber> transcriber;
    std::shared_ptr<media::IProcessRunner> processRunner;
    std::shared_ptr<const chunking::ITokenCounter> tokenCounter;
    std::shared_ptr<const chunking::ISentenceSplitter> sentenceSplitter;
};

// Everything a pipeline needs for one file
struct PipelineContext {
    std::filesystem::path path;
    std::string docId;
    std::string title;
    size_t maxTokens = 512;
    size_t overlapTokens = 120;
    const config::PipelineConfig& config;
    IngestServices& services;
    const chunking::TokenChunker& chunker;
};

/**
 * @brief Chunk `text` and emit one record per piece. Returns the number emitted.
 */
size_t emitChunks(const PipelineContext& ctx, const ChunkSink& sink, SourceType source,
                  const std::string& text, const ChunkLocation& location,
                  std::optional<CaptionKind> caption = std::nullopt,
                  std::optional<double> confidence = std::nullopt);

// Each returns the number of chunks handed to the sink
Result<size_t> processPaginated(const PipelineContext& ctx, const ChunkSink& sink);
Result<size_t> processSlideDeck(const PipelineContext& ctx, const ChunkSink& sink);
Result<size_t> processWordDocument(const PipelineContext& ctx, const ChunkSink& sink);
Result<size_t> processPlainTranscript(const PipelineContext& ctx, const ChunkSink& sink);
Result<size_t> processVideo(const PipelineContext& ctx, const ChunkSink& sink);

} // namespace docsift::ingest
