#include <docsift/ingest/dedup.h>
#include <docsift/ingest/format_pipelines.h>
#include <docsift/ingest/normalizer.h>

#include <spdlog/spdlog.h>

namespace docsift::ingest {

Result<size_t> processSlideDeck(const PipelineContext& ctx, const ChunkSink& sink) {
    if (!ctx.services.slides) {
        return Error{ErrorCode::NotSupported, "No slide deck extractor configured"};
    }
    const auto& cfg = ctx.config.ingest;
    spdlog::info("Slide deck start: {} (doc_id={})", ctx.path.string(), ctx.docId);

    auto slidesResult = ctx.services.slides->slides(ctx.path);
    if (!slidesResult) {
        return slidesResult.error();
    }
    const auto& slides = slidesResult.value();

    std::vector<std::string> rawSlides;
    rawSlides.reserve(slides.size());
    for (const auto& s : slides) {
        rawSlides.push_back(s.text);
    }
    auto boilerplate =
        findBoilerplate(rawSlides, cfg.slideBoilerplateFraction, cfg.boilerplateMaxLine);

    SignatureSet seenSlides;
    size_t emitted = 0;
    for (const auto& slide : slides) {
        auto slideText = normalizeText(dropBoilerplate(slide.text, boilerplate));

        std::string tableMd;
        for (const auto& t : slide.tables) {
            if (!tableMd.empty()) {
                tableMd += "\n\n";
            }
            tableMd += t;
        }

        std::string ocrText;
        std::optional<double> ocrConfidence;
        if (ctx.services.recognizer) {
            std::vector<const extraction::Image*> large;
            for (const auto& image : slide.images) {
                if (image.area() > cfg.largeImageArea) {
                    large.push_back(&image);
                }
            }
            if (!large.empty()) {
                auto recognized = recognition::recognizeImages(*ctx.services.recognizer, large,
                                                               cfg.ocrConfidenceFloor);
                ocrText = normalizeText(recognized.text);
                ocrConfidence = recognized.confidence;
            }
        }

        std::string combined = slideText;
        if (!tableMd.empty()) {
            combined += "\n" + tableMd;
        }
        if (!ocrText.empty()) {
            combined += "\n" + ocrText;
        }
        auto canon = canonicalizeForHash(combined);
        if (canon.empty()) {
            spdlog::debug("Slide {}: no text", slide.number);
            continue;
        }
        if (isDuplicate(signature(canon), seenSlides)) {
            spdlog::debug("Skip duplicate slide {}", slide.number);
            continue;
        }

        const ChunkLocation at{.slide = slide.number};
        if (countWords(slideText) >= cfg.minSlideWords) {
            auto n = emitChunks(ctx, sink, SourceType::Pptx, slideText, at);
            spdlog::debug("Slide {} text -> {} chunks", slide.number, n);
            emitted += n;
        }
        if (!tableMd.empty()) {
            auto n = emitChunks(ctx, sink, SourceType::Pptx, tableMd, at, CaptionKind::Table);
            spdlog::debug("Slide {} tables -> {} chunks", slide.number, n);
            emitted += n;
        }
        if (!ocrText.empty() && countWords(ocrText) >= cfg.minRecognizedWords) {
            auto n = emitChunks(ctx, sink, SourceType::Pptx, ocrText, at, CaptionKind::Ocr,
                                ocrConfidence);
            spdlog::debug("Slide {} recognized text -> {} chunks", slide.number, n);
            emitted += n;
        }
    }

    spdlog::info("Slide deck done: {} ({} slides, {} chunks)", ctx.path.string(), slides.size(),
                 emitted);
    return emitted;
}

} // namespace docsift::ingest
