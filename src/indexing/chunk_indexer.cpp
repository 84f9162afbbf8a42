#include <docsift/indexing/chunk_indexer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace docsift::indexing {

ChunkIndexer::ChunkIndexer(std::shared_ptr<const vector::EmbeddingClient> embedder,
                           std::shared_ptr<search::ElasticSearchClient> client, size_t batchSize)
    : embedder_(std::move(embedder)),
      client_(std::move(client)),
      batchSize_(std::max<size_t>(1, batchSize)) {}

nlohmann::json ChunkIndexer::indexMapping(size_t dims) {
    return nlohmann::json{
        {"settings", {{"number_of_shards", 1}, {"number_of_replicas", 0}, {"index", {{"knn", true}}}}},
        {"mappings",
         {{"properties",
           {{"doc_id", {{"type", "keyword"}}},
            {"source", {{"type", "keyword"}}},
            {"title", {{"type", "text"}}},
            {"page", {{"type", "integer"}}},
            {"slide", {{"type", "integer"}}},
            {"timecode", {{"type", "keyword"}}},
            {"section", {{"type", "keyword"}}},
            {"text", {{"type", "text"}}},
            {"caption", {{"type", "text"}}},
            {"confidence", {{"type", "float"}}},
            {"created_at", {{"type", "date"}}},
            {"vector",
             {{"type", "dense_vector"},
              {"dims", dims},
              {"index", true},
              {"similarity", "cosine"}}}}}}}};
}

std::string ChunkIndexer::buildBulkBody(const std::string& indexName,
                                        const std::vector<ingest::Chunk>& chunks,
                                        const std::vector<Embedding>& vectors) {
    std::string body;
    const size_t n = std::min(chunks.size(), vectors.size());
    for (size_t i = 0; i < n; ++i) {
        const auto& chunk = chunks[i];
        nlohmann::json action{
            {"update", {{"_index", indexName}, {"_id", ingest::stableChunkId(chunk)}}}};
        nlohmann::json doc = chunk;
        doc["vector"] = vectors[i];
        nlohmann::json payload{{"doc", std::move(doc)}, {"doc_as_upsert", true}};

        body += action.dump();
        body.push_back('\n');
        body += payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        body.push_back('\n');
    }
    return body;
}

Result<size_t> ChunkIndexer::index(const std::vector<ingest::Chunk>& chunks) {
    if (!embedder_ || !client_) {
        return Error{ErrorCode::InvalidArgument, "Indexer is missing a collaborator"};
    }
    size_t written = 0;
    for (size_t i = 0; i < chunks.size(); i += batchSize_) {
        const size_t end = std::min(chunks.size(), i + batchSize_);
        std::vector<ingest::Chunk> batch(chunks.begin() + static_cast<std::ptrdiff_t>(i),
                                         chunks.begin() + static_cast<std::ptrdiff_t>(end));
        std::vector<std::string> texts;
        texts.reserve(batch.size());
        for (const auto& c : batch) {
            texts.push_back(c.text);
        }

        auto vectors = embedder_->embed(texts);
        if (!vectors) {
            spdlog::error("Embedding failed for batch at {}: {}", i, vectors.error().message);
            return vectors.error();
        }
        auto result = client_->bulk(buildBulkBody(client_->indexName(), batch, vectors.value()));
        if (!result) {
            spdlog::error("Bulk upsert failed for batch at {}: {}", i, result.error().message);
            return result.error();
        }
        written += result.value().succeeded;
    }
    spdlog::info("Indexed {} chunks into '{}'", written, client_->indexName());
    return written;
}

Result<void> ChunkIndexer::ensureIndex() {
    if (!embedder_ || !client_) {
        return Error{ErrorCode::InvalidArgument, "Indexer is missing a collaborator"};
    }
    auto dims = embedder_->probeDimension();
    if (!dims) {
        return dims.error();
    }
    auto exists = client_->indexExists();
    if (!exists) {
        return exists.error();
    }
    if (exists.value()) {
        spdlog::info("Index '{}' already exists", client_->indexName());
        return {};
    }
    auto created = client_->createIndex(indexMapping(dims.value()));
    if (!created) {
        spdlog::error("Creating index '{}' failed: {}", client_->indexName(),
                      created.error().message);
        return created;
    }
    spdlog::info("Created index '{}' with dims={}", client_->indexName(), dims.value());
    return {};
}

Result<void> ChunkIndexer::clearIndex() {
    if (!client_) {
        return Error{ErrorCode::InvalidArgument, "Indexer is missing a search client"};
    }
    auto exists = client_->indexExists();
    if (!exists) {
        return exists.error();
    }
    if (!exists.value()) {
        spdlog::warn("Index '{}' does not exist", client_->indexName());
        return {};
    }
    auto deleted = client_->deleteAllDocuments();
    if (deleted) {
        spdlog::info("All documents deleted from index '{}'", client_->indexName());
    }
    return deleted;
}

IngestionService::IngestionService(std::shared_ptr<ingest::PipelineRouter> router,
                                   std::shared_ptr<ChunkIndexer> indexer,
                                   std::optional<ingest::ChunkStore> store)
    : router_(std::move(router)), indexer_(std::move(indexer)), store_(std::move(store)) {}

Result<size_t> IngestionService::ingestFile(const std::filesystem::path& path) {
    const auto start = std::chrono::steady_clock::now();
    spdlog::info("Ingesting {}", path.string());

    auto chunks = router_->collect(path);
    if (!chunks) {
        return chunks.error();
    }
    spdlog::info("{}: {} unique chunks extracted", path.string(), chunks.value().size());

    if (store_ && !chunks.value().empty()) {
        auto saved = store_->save(path.stem().string(), chunks.value());
        if (!saved) {
            spdlog::warn("Could not save chunks for {}: {}", path.string(), saved.error().message);
        }
    }

    auto written = indexer_->index(chunks.value());
    if (!written) {
        return written.error();
    }
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    spdlog::info("Done {} in {:.2f}s", path.string(), elapsed.count());
    return written.value();
}

IngestSummary IngestionService::ingestFiles(const std::vector<std::filesystem::path>& paths) {
    IngestSummary summary;
    for (const auto& path : paths) {
        ++summary.files;
        auto written = ingestFile(path);
        if (!written) {
            ++summary.failedFiles;
            spdlog::error("Failed to ingest {}: {}", path.string(), written.error().message);
            continue;
        }
        summary.chunks += written.value();
    }
    return summary;
}

} // namespace docsift::indexing
