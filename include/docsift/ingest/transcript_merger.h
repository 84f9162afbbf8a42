#pragma once

#include <string>
#include <vector>

namespace docsift::ingest {

// One speech-recognition segment or merged block; times are seconds
struct TranscriptSegment {
    std::string text;
    double start = 0.0;
    double end = 0.0;
};

/**
 * @brief Merge raw recognizer segments into coherent time blocks.
 *
 * A new block starts when the silence before a segment is >= gapThreshold,
 * when the block has already spanned >= maxDuration seconds, or when adding the
 * segment would reach maxChars. Segments with blank text are skipped and do not
 * move the reference point for the next gap. Block text joins segments with a
 * single space.
 */
std::vector<TranscriptSegment> mergeSegments(const std::vector<TranscriptSegment>& segments,
                                             double maxDuration = 60.0, size_t maxChars = 1200,
                                             double gapThreshold = 1.5);

} // namespace docsift::ingest
