#include <docsift/common/utf8_utils.h>
#include <docsift/ingest/transcript_merger.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <optional>
#include <string_view>

namespace docsift::ingest {

namespace {

std::string_view strip(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

std::vector<TranscriptSegment> mergeSegments(const std::vector<TranscriptSegment>& segments,
                                             double maxDuration, size_t maxChars,
                                             double gapThreshold) {
    std::vector<TranscriptSegment> blocks;
    std::optional<TranscriptSegment> current;
    size_t currentChars = 0;
    double lastEnd = 0.0;

    for (const auto& seg : segments) {
        auto text = strip(seg.text);
        if (text.empty()) {
            continue;
        }

        const size_t textChars = common::utf8Length(text);
        if (!current) {
            current = TranscriptSegment{std::string(text), seg.start, seg.end};
            currentChars = textChars + 1;
            lastEnd = seg.end;
            continue;
        }

        const bool gap = (seg.start - lastEnd) >= gapThreshold;
        const bool tooLong = (seg.end - current->start) >= maxDuration;
        const bool tooBig = (currentChars + textChars) >= maxChars;

        if (gap || tooLong || tooBig) {
            blocks.push_back(std::move(*current));
            current = TranscriptSegment{std::string(text), seg.start, seg.end};
            currentChars = textChars + 1;
        } else {
            current->text.push_back(' ');
            current->text.append(text);
            current->end = seg.end;
            currentChars += textChars + 1;
        }
        lastEnd = seg.end;
    }
    if (current) {
        blocks.push_back(std::move(*current));
    }

    spdlog::debug("Merged {} segments into {} blocks", segments.size(), blocks.size());
    return blocks;
}

} // namespace docsift::ingest
