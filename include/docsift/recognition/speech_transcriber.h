#pragma once

#include <docsift/core/types.h>
#include <docsift/ingest/transcript_merger.h>

#include <filesystem>
#include <string>
#include <vector>

namespace docsift::recognition {

struct Transcription {
    std::vector<ingest::TranscriptSegment> segments; // times local to the input file
    std::string language;
};

// Speech-to-text over an audio or video file
class ISpeechTranscriber {
public:
    virtual ~ISpeechTranscriber() = default;
    virtual Result<Transcription> transcribe(const std::filesystem::path& mediaPath) = 0;
};

} // namespace docsift::recognition
