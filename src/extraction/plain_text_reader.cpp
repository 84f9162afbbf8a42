#include <docsift/extraction/document_extractors.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace docsift::extraction {

namespace {

// Length of the valid UTF-8 sequence starting at s[i], or 0
size_t validSequenceLength(std::string_view s, size_t i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    const unsigned char lead = byte(i);
    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead < 0x80) {
        return 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) {
            lo = 0xA0;
        } else if (lead == 0xED) {
            hi = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) {
            lo = 0x90;
        } else if (lead == 0xF4) {
            hi = 0x8F;
        }
    } else {
        return 0;
    }
    if (i + len > s.size()) {
        return 0;
    }
    if (byte(i + 1) < lo || byte(i + 1) > hi) {
        return 0;
    }
    for (size_t k = 2; k < len; ++k) {
        if ((byte(i + k) & 0xC0) != 0x80) {
            return 0;
        }
    }
    return len;
}

} // namespace

std::string sanitizeUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        const size_t len = validSequenceLength(input, i);
        if (len == 0) {
            ++i;
            continue;
        }
        out.append(input.substr(i, len));
        i += len;
    }
    return out;
}

Result<std::string> readPlainText(const std::filesystem::path& path) {
    spdlog::debug("Reading plain text: {}", path.string());
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return Error{ErrorCode::FileNotFound, "Failed to open file: " + path.string()};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    auto clean = sanitizeUtf8(content);
    if (clean.size() != content.size()) {
        spdlog::warn("Dropped {} invalid UTF-8 bytes from {}", content.size() - clean.size(),
                     path.string());
    }
    return clean;
}

} // namespace docsift::extraction
