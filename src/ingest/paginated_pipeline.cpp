#include <docsift/ingest/dedup.h>
#include <docsift/ingest/format_pipelines.h>
#include <docsift/ingest/normalizer.h>

#include <spdlog/spdlog.h>

namespace docsift::ingest {

namespace {

struct PageEnrichment {
    std::string text;
    std::optional<double> confidence;
};

// Recognized text for one page, or nothing when recognition is unavailable or weak
std::optional<PageEnrichment> recognizePage(const PipelineContext& ctx, int pageNumber) {
    auto& services = ctx.services;
    if (!services.recognizer) {
        return std::nullopt;
    }
    auto image = services.paginated->pageImage(ctx.path, pageNumber);
    if (!image) {
        spdlog::warn("Page {} of {}: rasterization failed: {}", pageNumber, ctx.path.string(),
                     image.error().message);
        return std::nullopt;
    }
    auto recognized = services.recognizer->recognize(image.value());
    if (!recognized) {
        spdlog::warn("Page {} of {}: recognition failed: {}", pageNumber, ctx.path.string(),
                     recognized.error().message);
        return std::nullopt;
    }
    auto& r = recognized.value();
    if (countWords(r.text) == 0 || !r.confidence ||
        *r.confidence <= ctx.config.ingest.ocrConfidenceFloor) {
        return std::nullopt;
    }
    return PageEnrichment{std::move(r.text), r.confidence};
}

} // namespace

Result<size_t> processPaginated(const PipelineContext& ctx, const ChunkSink& sink) {
    if (!ctx.services.paginated) {
        return Error{ErrorCode::NotSupported, "No paginated document extractor configured"};
    }
    const auto& cfg = ctx.config.ingest;
    spdlog::info("Paginated document start: {} (doc_id={})", ctx.path.string(), ctx.docId);

    // Pass 1: native text for boilerplate detection, tables per page
    auto pagesResult = ctx.services.paginated->pageTexts(ctx.path);
    if (!pagesResult) {
        return pagesResult.error();
    }
    const auto& pages = pagesResult.value();

    std::vector<std::string> rawPages;
    rawPages.reserve(pages.size());
    for (const auto& p : pages) {
        rawPages.push_back(p.text);
    }
    auto boilerplate = findBoilerplate(rawPages, cfg.pdfBoilerplateFraction, cfg.boilerplateMaxLine);

    extraction::PageTables tables;
    if (auto t = ctx.services.paginated->tables(ctx.path)) {
        tables = std::move(t).value();
    } else {
        spdlog::warn("Table extraction failed for {} ({}); continuing without tables",
                     ctx.path.string(), t.error().message);
    }

    // Pass 2: selective recognition, page dedup, chunking
    SignatureSet seenPages;
    size_t emitted = 0;
    for (const auto& page : pages) {
        std::optional<CaptionKind> caption;
        std::optional<double> confidence;
        auto base = normalizeText(dropBoilerplate(page.text, boilerplate));

        const size_t nativeWords = countWords(base);
        if (nativeWords < cfg.ocrFallbackMinWords) {
            if (auto ocr = recognizePage(ctx, page.number)) {
                auto clean = normalizeText(dropBoilerplate(ocr->text, boilerplate));
                if (countWords(clean) > nativeWords) {
                    spdlog::debug("Page {}: adopting recognized text", page.number);
                    base = std::move(clean);
                    caption = CaptionKind::Ocr;
                    confidence = ocr->confidence;
                }
            }
        }

        auto canon = canonicalizeForHash(base);
        if (canon.empty()) {
            spdlog::debug("Page {}: no text", page.number);
        } else if (isDuplicate(signature(canon), seenPages)) {
            spdlog::debug("Skip duplicate page {}", page.number);
        } else if (countWords(base) >= cfg.minProseWords) {
            auto n = emitChunks(ctx, sink, SourceType::Pdf, base, ChunkLocation{.page = page.number},
                                caption, confidence);
            spdlog::debug("Page {} -> {} chunks (caption={})", page.number, n,
                          caption ? captionToString(*caption) : "none");
            emitted += n;
        }

        // Tables are chunked independently of the prose dedup decision
        auto it = tables.find(page.number);
        if (it == tables.end()) {
            continue;
        }
        for (const auto& table : it->second) {
            auto md = normalizeText(table);
            if (countWords(md) < cfg.minTableWords) {
                continue;
            }
            auto n = emitChunks(ctx, sink, SourceType::Pdf, md, ChunkLocation{.page = page.number},
                                CaptionKind::Table);
            spdlog::debug("Page {} table -> {} chunks", page.number, n);
            emitted += n;
        }
    }

    spdlog::info("Paginated document done: {} ({} pages, {} chunks)", ctx.path.string(),
                 pages.size(), emitted);
    return emitted;
}

} // namespace docsift::ingest
