#pragma once

#include <docsift/core/types.h>
#include <docsift/ingest/chunk_record.h>

#include <filesystem>
#include <string>
#include <vector>

namespace docsift::ingest {

/**
 * @brief Writes emitted chunks to `<dir>/<name>.json` for inspection.
 */
class ChunkStore {
public:
    explicit ChunkStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

    // Pretty-printed JSON array; returns the written path
    Result<std::filesystem::path> save(const std::string& name,
                                       const std::vector<Chunk>& chunks) const;

    Result<std::vector<Chunk>> load(const std::string& name) const;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
};

} // namespace docsift::ingest
