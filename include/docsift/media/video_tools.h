#pragma once

#include <docsift/core/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsift::media {

struct ProcessOutput {
    int exitCode = 0;
    std::string output; // stdout and stderr interleaved
};

/**
 * @brief Runs a short-lived external command to completion.
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;
    virtual Result<ProcessOutput> run(const std::vector<std::string>& argv) = 0;
};

// popen-based runner; exit code 127 means the shell could not find the program
class PopenProcessRunner : public IProcessRunner {
public:
    Result<ProcessOutput> run(const std::vector<std::string>& argv) override;
};

// Single-quote an argument for /bin/sh
std::string shellQuote(std::string_view arg);

/**
 * @brief Temporary directory removed (recursively) when the owner goes out of scope.
 */
class ScopedTempDir {
public:
    // Creates "<parent>/<prefix>XXXXXX"
    static Result<ScopedTempDir> create(const std::filesystem::path& parent,
                                        const std::string& prefix);

    ~ScopedTempDir();
    ScopedTempDir(ScopedTempDir&& other) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;
    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Remove now; safe to call repeatedly
    void cleanup();

private:
    explicit ScopedTempDir(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

/**
 * @brief Media duration in seconds via ffprobe.
 *
 * ExternalToolMissing when ffprobe is not on PATH, ExternalToolFailed when it
 * fails or prints something that is not a number.
 */
Result<double> probeDuration(IProcessRunner& runner, const std::filesystem::path& path);

/**
 * @brief Segment length that keeps each piece under limitBytes.
 *
 * max(5, limit / (size / duration) * 0.98); fallbackSecs when the bitrate is unknown.
 */
double planSegmentSeconds(uint64_t sizeBytes, double durationSecs, uint64_t limitBytes,
                          double fallbackSecs);

struct VideoSegments {
    std::vector<std::filesystem::path> files; // in playback order
    std::optional<ScopedTempDir> tempDir;     // empty when the source was not split
};

/**
 * @brief Split a video into stream-copied pieces under limitBytes with ffmpeg.
 *
 * Files at or below the limit come back unsplit. Pieces are written to a
 * temporary directory next to the source, named "<stem>_part_NNN<ext>".
 */
Result<VideoSegments> splitVideo(IProcessRunner& runner, const std::filesystem::path& path,
                                 double durationSecs, uint64_t limitBytes, double fallbackSecs);

} // namespace docsift::media
