#pragma once

#include <docsift/ingest/chunk_record.h>
#include <docsift/ingest/dedup.h>

#include <cstddef>

namespace docsift::ingest {

/**
 * @brief Chunk-level duplicate filter scoped to one document's processing.
 *
 * A chunk is accepted the first time its canonical signature is seen. Chunks
 * with a blank canonical form are rejected.
 */
class ChunkDeduplicator {
public:
    bool accept(const Chunk& chunk);

    size_t kept() const { return kept_; }
    size_t dropped() const { return dropped_; }

private:
    SignatureSet seen_;
    size_t kept_ = 0;
    size_t dropped_ = 0;
};

} // namespace docsift::ingest
