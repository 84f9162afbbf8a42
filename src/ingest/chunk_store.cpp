#include <docsift/ingest/chunk_store.h>

#include <spdlog/spdlog.h>

#include <fstream>

namespace docsift::ingest {

Result<std::filesystem::path> ChunkStore::save(const std::string& name,
                                               const std::vector<Chunk>& chunks) const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot create chunk directory " + directory_.string() + ": " + ec.message()};
    }

    auto path = directory_ / (name + ".json");
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::PermissionDenied, "Cannot open for writing: " + path.string()};
    }

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& c : chunks) {
        arr.push_back(c);
    }
    out << arr.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (!out) {
        return Error{ErrorCode::InternalError, "Write failed: " + path.string()};
    }

    spdlog::info("Saved {} chunks to {}", chunks.size(), path.string());
    return path;
}

Result<std::vector<Chunk>> ChunkStore::load(const std::string& name) const {
    auto path = directory_ / (name + ".json");
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Chunk file not found: " + path.string()};
    }
    try {
        auto arr = nlohmann::json::parse(in);
        return arr.get<std::vector<Chunk>>();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, "Malformed chunk file " + path.string() + ": " + e.what()};
    }
}

} // namespace docsift::ingest
