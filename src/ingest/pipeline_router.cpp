#include <docsift/ingest/chunk_dedup.h>
#include <docsift/ingest/pipeline_router.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace docsift::ingest {

const char* documentKindToString(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::Paginated: return "paginated";
        case DocumentKind::SlideDeck: return "slide-deck";
        case DocumentKind::WordDocument: return "word-document";
        case DocumentKind::PlainTranscript: return "transcript";
        case DocumentKind::Video: return "video";
    }
    return "unknown";
}

std::optional<DocumentKind> kindFromPath(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".pdf") return DocumentKind::Paginated;
    if (ext == ".pptx") return DocumentKind::SlideDeck;
    if (ext == ".docx") return DocumentKind::WordDocument;
    if (ext == ".txt" || ext == ".md") return DocumentKind::PlainTranscript;
    if (ext == ".mp4") return DocumentKind::Video;
    return std::nullopt;
}

PipelineRouter::PipelineRouter(config::PipelineConfig config, IngestServices services)
    : config_(std::move(config)),
      services_(std::move(services)),
      chunker_(chunking::TokenChunkerConfig{config_.ingest.tokenHeadroom},
               services_.tokenCounter, services_.sentenceSplitter) {}

Result<size_t> PipelineRouter::process(const std::filesystem::path& path, const ChunkSink& sink) {
    return process(path, config_.ingest.maxTokens, config_.ingest.overlapTokens, sink);
}

Result<size_t> PipelineRouter::process(const std::filesystem::path& path, size_t maxTokens,
                                       size_t overlapTokens, const ChunkSink& sink) {
    auto kind = kindFromPath(path);
    if (!kind) {
        spdlog::error("Unsupported extension '{}' for {}. Supported: .pdf .pptx .docx .txt .md .mp4",
                      path.extension().string(), path.string());
        return Error{ErrorCode::NotSupported,
                     "Unsupported extension: " + path.extension().string() + " (" +
                         path.string() + ")"};
    }
    if (overlapTokens >= maxTokens) {
        spdlog::warn("overlap_tokens ({}) >= max_tokens ({}); consecutive chunks will repeat",
                     overlapTokens, maxTokens);
    }

    auto docId = documentId(path);
    if (!docId) {
        spdlog::error("Cannot read {}: {}", path.string(), docId.error().message);
        return docId.error();
    }
    spdlog::info("Routing {} as {}", path.string(), documentKindToString(*kind));

    PipelineContext ctx{.path = path,
                        .docId = docId.value(),
                        .title = titleFromPath(path),
                        .maxTokens = maxTokens,
                        .overlapTokens = overlapTokens,
                        .config = config_,
                        .services = services_,
                        .chunker = chunker_};

    if (*kind == DocumentKind::Video) {
        return processVideo(ctx, sink);
    }

    ChunkDeduplicator dedup;
    ChunkSink filtered = [&](Chunk&& chunk) {
        if (dedup.accept(chunk)) {
            sink(std::move(chunk));
        }
    };

    Result<size_t> produced = Error{ErrorCode::InternalError};
    switch (*kind) {
        case DocumentKind::Paginated:
            produced = processPaginated(ctx, filtered);
            break;
        case DocumentKind::SlideDeck:
            produced = processSlideDeck(ctx, filtered);
            break;
        case DocumentKind::WordDocument:
            produced = processWordDocument(ctx, filtered);
            break;
        case DocumentKind::PlainTranscript:
            produced = processPlainTranscript(ctx, filtered);
            break;
        case DocumentKind::Video:
            break;
    }
    if (!produced) {
        spdlog::error("Ingestion failed for {}: {}", path.string(), produced.error().message);
        return produced.error();
    }
    spdlog::info("Kept {} unique chunks after chunk-level dedup ({} dropped)", dedup.kept(),
                 dedup.dropped());
    return dedup.kept();
}

Result<std::vector<Chunk>> PipelineRouter::collect(const std::filesystem::path& path) {
    std::vector<Chunk> chunks;
    auto result = process(path, [&](Chunk&& c) { chunks.push_back(std::move(c)); });
    if (!result) {
        return result.error();
    }
    return chunks;
}

} // namespace docsift::ingest
