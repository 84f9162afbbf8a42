#include <docsift/ingest/format_pipelines.h>
#include <docsift/ingest/normalizer.h>
#include <docsift/ingest/word_sections.h>

#include <spdlog/spdlog.h>

namespace docsift::ingest {

Result<size_t> processWordDocument(const PipelineContext& ctx, const ChunkSink& sink) {
    if (!ctx.services.word) {
        return Error{ErrorCode::NotSupported, "No word-processor extractor configured"};
    }
    const auto& cfg = ctx.config.ingest;
    spdlog::info("Word document start: {} (doc_id={})", ctx.path.string(), ctx.docId);

    auto blocksResult = extraction::readWordBlocks(*ctx.services.word, ctx.path);
    if (!blocksResult) {
        return blocksResult.error();
    }
    const auto& blocks = blocksResult.value();

    WordSectionState state(ctx.chunker, ctx.maxTokens, ctx.overlapTokens, cfg.docxWarmupBlocks);
    size_t emitted = 0;

    auto emitSection = [&](const SectionChunks& closed) {
        for (const auto& text : closed.texts) {
            sink(makeChunk(ctx.docId, SourceType::Docx, ctx.title, text,
                           ChunkLocation{.section = closed.section}));
        }
        emitted += closed.texts.size();
    };

    for (const auto& block : blocks) {
        if (const auto* table = std::get_if<extraction::block::Table>(&block)) {
            emitSection(state.flush());
            auto md = normalizeText(table->markdown);
            auto n = emitChunks(ctx, sink, SourceType::Docx, md,
                                ChunkLocation{.section = std::string("table")}, CaptionKind::Table);
            spdlog::debug("Table -> {} chunks", n);
            emitted += n;
            state.resetBlockCount();
            continue;
        }

        if (const auto* picture = std::get_if<extraction::block::Picture>(&block)) {
            if (picture->image.area() <= cfg.largeImageArea) {
                continue;
            }
            emitSection(state.flush());
            if (ctx.services.recognizer) {
                auto recognized = recognition::recognizeImages(
                    *ctx.services.recognizer, {&picture->image}, cfg.ocrConfidenceFloor);
                auto text = normalizeText(recognized.text);
                if (countWords(text) >= cfg.minRecognizedWords) {
                    auto n = emitChunks(ctx, sink, SourceType::Docx, text,
                                        ChunkLocation{.section = std::string("image")},
                                        CaptionKind::Ocr, recognized.confidence);
                    spdlog::debug("Image recognized text -> {} chunks", n);
                    emitted += n;
                }
            }
            state.resetBlockCount();
            continue;
        }

        if (auto closed = state.feed(block)) {
            emitSection(*closed);
        }
    }
    emitSection(state.flush());

    spdlog::info("Word document done: {} ({} blocks, {} chunks)", ctx.path.string(), blocks.size(),
                 emitted);
    return emitted;
}

} // namespace docsift::ingest
