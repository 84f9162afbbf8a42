#include <docsift/ingest/chunk_dedup.h>

#include <spdlog/spdlog.h>

namespace docsift::ingest {

bool ChunkDeduplicator::accept(const Chunk& chunk) {
    auto canon = canonicalizeForHash(chunk.text);
    if (canon.empty() || isDuplicate(signature(canon), seen_)) {
        ++dropped_;
        spdlog::debug("Dropping duplicate chunk {} ({})", chunk.chunkId, chunk.locator());
        return false;
    }
    ++kept_;
    return true;
}

} // namespace docsift::ingest
