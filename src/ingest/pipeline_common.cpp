#include <docsift/ingest/format_pipelines.h>

namespace docsift::ingest {

size_t emitChunks(const PipelineContext& ctx, const ChunkSink& sink, SourceType source,
                  const std::string& text, const ChunkLocation& location,
                  std::optional<CaptionKind> caption, std::optional<double> confidence) {
    auto pieces = ctx.chunker.chunk(text, ctx.maxTokens, ctx.overlapTokens);
    for (auto& piece : pieces) {
        sink(makeChunk(ctx.docId, source, ctx.title, std::move(piece), location, caption,
                       confidence));
    }
    return pieces.size();
}

} // namespace docsift::ingest
