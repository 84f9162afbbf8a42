#include <docsift/media/video_tools.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifndef _WIN32
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace docsift::media {

namespace {

constexpr int kCommandNotFound = 127;

std::string trimmed(std::string_view s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos) {
        return {};
    }
    auto e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

} // namespace

std::string shellQuote(std::string_view arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

Result<ProcessOutput> PopenProcessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty command"};
    }
    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty()) {
            cmd.push_back(' ');
        }
        cmd += shellQuote(arg);
    }
    cmd += " 2>&1";
    spdlog::debug("Running: {}", cmd);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        return Error{ErrorCode::ExternalToolFailed,
                     fmt::format("Failed to start {}: {}", argv.front(), std::strerror(errno))};
    }

    ProcessOutput result;
    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        result.output += buffer;
    }
    int status = pclose(pipe);
    if (status == -1) {
        return Error{ErrorCode::ExternalToolFailed,
                     fmt::format("Failed to wait for {}: {}", argv.front(), std::strerror(errno))};
    }
#ifndef _WIN32
    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#else
    result.exitCode = status;
#endif
    return result;
}

Result<ScopedTempDir> ScopedTempDir::create(const std::filesystem::path& parent,
                                            const std::string& prefix) {
    std::string pattern = (parent / (prefix + "XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        return Error{ErrorCode::PermissionDenied,
                     fmt::format("Cannot create temporary directory in {}: {}", parent.string(),
                                 std::strerror(errno))};
    }
    return ScopedTempDir(std::filesystem::path(buf.data()));
}

ScopedTempDir::~ScopedTempDir() {
    cleanup();
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
    if (this != &other) {
        cleanup();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScopedTempDir::cleanup() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove temporary directory {}: {}", path_.string(), ec.message());
    } else {
        spdlog::debug("Removed temporary directory {}", path_.string());
    }
    path_.clear();
}

Result<double> probeDuration(IProcessRunner& runner, const std::filesystem::path& path) {
    auto out = runner.run({"ffprobe", "-v", "error", "-show_entries", "format=duration", "-of",
                           "default=noprint_wrappers=1:nokey=1", path.string()});
    if (!out) {
        return out.error();
    }
    const auto& result = out.value();
    if (result.exitCode == kCommandNotFound) {
        return Error{ErrorCode::ExternalToolMissing,
                     "ffprobe is required to read the duration of " + path.string() +
                         " but was not found in PATH"};
    }
    if (result.exitCode != 0) {
        return Error{ErrorCode::ExternalToolFailed,
                     fmt::format("ffprobe failed to read duration for {}: {}", path.string(),
                                 trimmed(result.output))};
    }

    auto text = trimmed(result.output);
    char* end = nullptr;
    double duration = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || !std::isfinite(duration)) {
        return Error{ErrorCode::ExternalToolFailed,
                     fmt::format("Unable to parse ffprobe duration output '{}' for {}", text,
                                 path.string())};
    }
    return duration;
}

double planSegmentSeconds(uint64_t sizeBytes, double durationSecs, uint64_t limitBytes,
                          double fallbackSecs) {
    if (durationSecs <= 0.0 || sizeBytes == 0) {
        return fallbackSecs;
    }
    const double bytesPerSec = static_cast<double>(sizeBytes) / durationSecs;
    if (bytesPerSec <= 0.0 || !std::isfinite(bytesPerSec)) {
        return fallbackSecs;
    }
    return std::max(5.0, static_cast<double>(limitBytes) / bytesPerSec * 0.98);
}

Result<VideoSegments> splitVideo(IProcessRunner& runner, const std::filesystem::path& path,
                                 double durationSecs, uint64_t limitBytes, double fallbackSecs) {
    std::error_code ec;
    const auto sizeBytes = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("Cannot stat {}: {}", path.string(), ec.message())};
    }

    VideoSegments segments;
    if (sizeBytes <= limitBytes) {
        segments.files.push_back(path);
        return segments;
    }

    const double segmentSecs = planSegmentSeconds(sizeBytes, durationSecs, limitBytes, fallbackSecs);
    const auto stem = path.stem().string();
    const auto ext = path.extension().string();

    auto dir = ScopedTempDir::create(path.parent_path().empty() ? "." : path.parent_path(),
                                     stem + "_segments_");
    if (!dir) {
        return dir.error();
    }
    segments.tempDir.emplace(std::move(dir).value());
    const auto& tmp = segments.tempDir->path();

    auto pattern = tmp / (stem + "_part_%03d" + ext);
    auto out = runner.run({"ffmpeg", "-hide_banner", "-loglevel", "error", "-i", path.string(),
                           "-c", "copy", "-map", "0", "-f", "segment", "-segment_time",
                           fmt::format("{:.3f}", segmentSecs), "-reset_timestamps", "1",
                           pattern.string()});
    if (!out) {
        return out.error();
    }
    if (out.value().exitCode == kCommandNotFound) {
        return Error{ErrorCode::ExternalToolMissing,
                     "ffmpeg is required to split " + path.string() + " but was not found in PATH"};
    }
    if (out.value().exitCode != 0) {
        return Error{ErrorCode::ExternalToolFailed,
                     fmt::format("ffmpeg failed while splitting {}: {}", path.string(),
                                 trimmed(out.value().output))};
    }

    const auto prefix = stem + "_part_";
    for (const auto& entry : std::filesystem::directory_iterator(tmp, ec)) {
        auto name = entry.path().filename().string();
        if (entry.is_regular_file() && name.starts_with(prefix) && name.ends_with(ext)) {
            segments.files.push_back(entry.path());
        }
    }
    if (ec) {
        return Error{ErrorCode::InternalError,
                     fmt::format("Cannot list segments in {}: {}", tmp.string(), ec.message())};
    }
    std::sort(segments.files.begin(), segments.files.end());
    if (segments.files.empty()) {
        return Error{ErrorCode::ExternalToolFailed,
                     "ffmpeg did not produce segments for " + path.string()};
    }

    spdlog::info("Split {} into {} segments of ~{:.1f}s", path.string(), segments.files.size(),
                 segmentSecs);
    return segments;
}

} // namespace docsift::media
