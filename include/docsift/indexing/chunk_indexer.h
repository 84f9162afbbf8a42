#pragma once

#include <docsift/core/types.h>
#include <docsift/ingest/chunk_record.h>
#include <docsift/ingest/chunk_store.h>
#include <docsift/ingest/pipeline_router.h>
#include <docsift/search/search_service.h>
#include <docsift/vector/embedding_client.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docsift::indexing {

/**
 * @brief Embeds chunks and upserts them into the search index.
 *
 * Each document is keyed by stableChunkId(), so re-indexing an unchanged unit
 * overwrites the existing entry.
 */
class ChunkIndexer {
public:
    ChunkIndexer(std::shared_ptr<const vector::EmbeddingClient> embedder,
                 std::shared_ptr<search::ElasticSearchClient> client, size_t batchSize = 32);

    // Returns the number of chunks written
    Result<size_t> index(const std::vector<ingest::Chunk>& chunks);

    // Create the index with the chunk mapping unless it already exists
    Result<void> ensureIndex();

    // Delete all documents; a missing index is not an error
    Result<void> clearIndex();

    static nlohmann::json indexMapping(size_t dims);

    // NDJSON "update" + {"doc", "doc_as_upsert": true} pairs
    static std::string buildBulkBody(const std::string& indexName,
                                     const std::vector<ingest::Chunk>& chunks,
                                     const std::vector<Embedding>& vectors);

private:
    std::shared_ptr<const vector::EmbeddingClient> embedder_;
    std::shared_ptr<search::ElasticSearchClient> client_;
    size_t batchSize_;
};

struct IngestSummary {
    size_t files = 0;
    size_t failedFiles = 0;
    size_t chunks = 0;
};

/**
 * @brief Ingest files one by one: route -> save for inspection -> embed and index.
 *
 * A failing file is logged and counted; the remaining files are still processed.
 */
class IngestionService {
public:
    IngestionService(std::shared_ptr<ingest::PipelineRouter> router,
                     std::shared_ptr<ChunkIndexer> indexer,
                     std::optional<ingest::ChunkStore> store = std::nullopt);

    Result<size_t> ingestFile(const std::filesystem::path& path);
    IngestSummary ingestFiles(const std::vector<std::filesystem::path>& paths);

private:
    std::shared_ptr<ingest::PipelineRouter> router_;
    std::shared_ptr<ChunkIndexer> indexer_;
    std::optional<ingest::ChunkStore> store_;
};

} // namespace docsift::indexing
