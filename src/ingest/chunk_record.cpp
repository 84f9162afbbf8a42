#include <docsift/core/uuid.h>
#include <docsift/crypto/hasher.h>
#include <docsift/ingest/chunk_record.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace docsift::ingest {

namespace {

template <typename T> void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& v) {
    if (v) {
        j[key] = *v;
    } else {
        j[key] = nullptr;
    }
}

template <typename T> std::optional<T> getOptional(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

} // namespace

const char* sourceTypeToString(SourceType type) {
    switch (type) {
        case SourceType::Pdf: return "pdf";
        case SourceType::Pptx: return "pptx";
        case SourceType::Transcript: return "transcript";
        case SourceType::Docx: return "docx";
    }
    return "pdf";
}

std::optional<SourceType> parseSourceType(std::string_view name) {
    if (name == "pdf") return SourceType::Pdf;
    if (name == "pptx") return SourceType::Pptx;
    if (name == "transcript") return SourceType::Transcript;
    if (name == "docx") return SourceType::Docx;
    return std::nullopt;
}

const char* captionToString(CaptionKind kind) {
    switch (kind) {
        case CaptionKind::Ocr: return "ocr";
        case CaptionKind::Table: return "table";
    }
    return "ocr";
}

std::optional<CaptionKind> parseCaption(std::string_view name) {
    if (name == "ocr") return CaptionKind::Ocr;
    if (name == "table") return CaptionKind::Table;
    return std::nullopt;
}

std::string Chunk::locator() const {
    if (page) return std::to_string(*page);
    if (slide) return std::to_string(*slide);
    if (timecode) return *timecode;
    if (section) return *section;
    return "0";
}

Chunk makeChunk(std::string docId, SourceType source, std::string title, std::string text,
                ChunkLocation location, std::optional<CaptionKind> caption,
                std::optional<double> confidence) {
    Chunk c;
    c.docId = std::move(docId);
    c.chunkId = core::generateUUID();
    c.source = source;
    c.title = std::move(title);
    c.page = location.page;
    c.slide = location.slide;
    c.timecode = std::move(location.timecode);
    c.section = std::move(location.section);
    c.text = std::move(text);
    c.caption = caption;
    c.confidence = confidence;
    c.createdAt = utcTimestamp();
    return c;
}

std::string utcTimestamp(TimePoint when) {
    auto tt = std::chrono::system_clock::to_time_t(when);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() %
        1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm tmUtc{};
#ifdef _WIN32
    gmtime_s(&tmUtc, &tt);
#else
    gmtime_r(&tt, &tmUtc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tmUtc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << 'Z';
    return oss.str();
}

Result<std::string> documentId(const std::filesystem::path& path) {
    crypto::EvpHasher hasher(crypto::DigestAlgorithm::SHA256);
    auto digest = hasher.hashFile(path);
    if (!digest) {
        return digest.error();
    }
    spdlog::debug("sha256 of {}: {}", path.string(), digest.value());
    return digest.value().substr(0, 32);
}

std::string titleFromPath(const std::filesystem::path& path) {
    std::string stem = path.stem().string();
    for (auto& c : stem) {
        if (c == '_' || c == '-') {
            c = ' ';
        }
    }

    std::string title;
    bool startOfWord = true;
    for (char c : stem) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            title.push_back(static_cast<char>(startOfWord ? std::toupper(uc) : std::tolower(uc)));
            startOfWord = false;
        } else {
            title.push_back(c);
            startOfWord = true;
        }
    }

    auto b = title.find_first_not_of(' ');
    if (b == std::string::npos) {
        return {};
    }
    auto e = title.find_last_not_of(' ');
    return title.substr(b, e - b + 1);
}

std::string stableChunkId(std::string_view docId, SourceType source, std::string_view locator,
                          std::string_view text) {
    std::string keyed;
    keyed.reserve(locator.size() + 1 + text.size());
    keyed.append(locator).push_back('|');
    keyed.append(text);
    auto sig = crypto::sha1Hex(keyed).substr(0, 12);
    return fmt::format("{}:{}:{}:{}", docId, sourceTypeToString(source), locator, sig);
}

std::string stableChunkId(const Chunk& chunk) {
    return stableChunkId(chunk.docId, chunk.source, chunk.locator(), chunk.text);
}

std::string formatHhmmss(double seconds) {
    auto total = static_cast<long long>(std::floor(std::max(0.0, seconds)));
    return fmt::format("{:02}:{:02}:{:02}", total / 3600, (total % 3600) / 60, total % 60);
}

std::string formatTimecode(double start, double end) {
    return formatHhmmss(start) + "-" + formatHhmmss(end);
}

void to_json(nlohmann::json& j, const Chunk& chunk) {
    j = nlohmann::json::object();
    j["doc_id"] = chunk.docId;
    j["chunk_id"] = chunk.chunkId;
    j["source"] = sourceTypeToString(chunk.source);
    j["title"] = chunk.title;
    putOptional(j, "page", chunk.page);
    putOptional(j, "slide", chunk.slide);
    putOptional(j, "timecode", chunk.timecode);
    putOptional(j, "section", chunk.section);
    j["text"] = chunk.text;
    if (chunk.caption) {
        j["caption"] = captionToString(*chunk.caption);
    } else {
        j["caption"] = nullptr;
    }
    putOptional(j, "confidence", chunk.confidence);
    j["created_at"] = chunk.createdAt;
}

void from_json(const nlohmann::json& j, Chunk& chunk) {
    chunk.docId = j.at("doc_id").get<std::string>();
    chunk.chunkId = j.value("chunk_id", std::string{});
    auto source = j.at("source").get<std::string>();
    auto parsed = parseSourceType(source);
    if (!parsed) {
        throw std::invalid_argument(fmt::format("unknown source type '{}'", source));
    }
    chunk.source = *parsed;
    chunk.title = getOptional<std::string>(j, "title").value_or("");
    chunk.page = getOptional<int>(j, "page");
    chunk.slide = getOptional<int>(j, "slide");
    chunk.timecode = getOptional<std::string>(j, "timecode");
    chunk.section = getOptional<std::string>(j, "section");
    chunk.text = j.at("text").get<std::string>();
    chunk.caption.reset();
    if (auto caption = getOptional<std::string>(j, "caption")) {
        chunk.caption = parseCaption(*caption);
    }
    chunk.confidence = getOptional<double>(j, "confidence");
    chunk.createdAt = j.value("created_at", std::string{});
}

} // namespace docsift::ingest
