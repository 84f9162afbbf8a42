#include <docsift/ingest/format_pipelines.h>
#include <docsift/ingest/normalizer.h>
#include <docsift/ingest/transcript_merger.h>

#include <spdlog/spdlog.h>

namespace docsift::ingest {

Result<size_t> processVideo(const PipelineContext& ctx, const ChunkSink& sink) {
    if (!ctx.services.transcriber) {
        return Error{ErrorCode::NotSupported, "No speech transcriber configured"};
    }
    const auto& cfg = ctx.config.ingest;
    const auto& tcfg = ctx.config.transcript;

    media::PopenProcessRunner defaultRunner;
    media::IProcessRunner& runner =
        ctx.services.processRunner ? *ctx.services.processRunner : defaultRunner;

    std::error_code ec;
    const auto sizeBytes = std::filesystem::file_size(ctx.path, ec);
    if (ec) {
        return Error{ErrorCode::FileNotFound, "Cannot stat " + ctx.path.string()};
    }
    spdlog::info("Video start: {} (doc_id={}, {:.2f} MB)", ctx.path.string(), ctx.docId,
                 static_cast<double>(sizeBytes) / (1024.0 * 1024.0));

    auto duration = media::probeDuration(runner, ctx.path);
    if (!duration) {
        spdlog::error("Failed to inspect video duration for {}: {}", ctx.path.string(),
                      duration.error().message);
        return duration.error();
    }

    // Owns the temporary directory; released on every return path below
    auto split = media::splitVideo(runner, ctx.path, duration.value(), cfg.videoSegmentLimitBytes,
                                   cfg.videoFallbackSegmentSecs);
    if (!split) {
        spdlog::error("Failed to split {}: {}", ctx.path.string(), split.error().message);
        return split.error();
    }
    const auto& segments = split.value();

    size_t emitted = 0;
    double offset = 0.0;
    std::string language;

    for (size_t idx = 0; idx < segments.files.size(); ++idx) {
        const auto& segmentPath = segments.files[idx];
        auto segDuration = media::probeDuration(runner, segmentPath);
        if (!segDuration) {
            spdlog::error("Failed to probe segment {} of {}: {}", idx + 1, ctx.path.string(),
                          segDuration.error().message);
            return segDuration.error();
        }
        if (segments.tempDir) {
            auto segBytes = std::filesystem::file_size(segmentPath, ec);
            if (!ec && segBytes > cfg.videoSegmentLimitBytes) {
                spdlog::warn("Segment {} exceeds the size limit ({} bytes)", segmentPath.string(),
                             segBytes);
            }
        }
        spdlog::debug("Segment {}: {} ({:.1f}s)", idx + 1, segmentPath.filename().string(),
                      segDuration.value());

        auto transcription = ctx.services.transcriber->transcribe(segmentPath);
        if (!transcription) {
            spdlog::warn("Transcription failed for segment {} of {}: {}", idx + 1,
                         ctx.path.string(), transcription.error().message);
            offset += segDuration.value();
            continue;
        }
        if (language.empty()) {
            language = transcription.value().language;
        }

        auto blocks = mergeSegments(transcription.value().segments, tcfg.maxBlockSecs,
                                    tcfg.maxBlockChars, tcfg.gapBreakSecs);
        for (const auto& block : blocks) {
            auto text = normalizeText(block.text);
            if (countWords(text) < cfg.minProseWords) {
                continue;
            }
            auto timecode = formatTimecode(block.start + offset, block.end + offset);
            auto n = emitChunks(ctx, sink, SourceType::Transcript, text,
                                ChunkLocation{.timecode = timecode});
            spdlog::debug("Block {} -> {} chunks", timecode, n);
            emitted += n;
        }
        offset += segDuration.value();
    }

    spdlog::info("Video done: {} ({} chunks, language={})", ctx.path.string(), emitted,
                 language.empty() ? "unknown" : language);
    return emitted;
}

} // namespace docsift::ingest
