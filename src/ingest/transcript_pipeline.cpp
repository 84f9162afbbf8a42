#include <docsift/ingest/format_pipelines.h>
#include <docsift/ingest/normalizer.h>

#include <spdlog/spdlog.h>

namespace docsift::ingest {

Result<size_t> processPlainTranscript(const PipelineContext& ctx, const ChunkSink& sink) {
    spdlog::info("Transcript start: {} (doc_id={})", ctx.path.string(), ctx.docId);
    auto raw = extraction::readPlainText(ctx.path);
    if (!raw) {
        return raw.error();
    }
    auto n = emitChunks(ctx, sink, SourceType::Transcript, normalizeText(raw.value()), {});
    spdlog::info("Transcript done: {} ({} chunks)", ctx.path.string(), n);
    return n;
}

} // namespace docsift::ingest
