#include <docsift/search/hybrid_retriever.h>

#include <spdlog/spdlog.h>

#include <future>

namespace docsift::search {

HybridRetriever::HybridRetriever(std::shared_ptr<const vector::EmbeddingClient> embedder,
                                 std::shared_ptr<IVectorSearch> vectorSearch,
                                 std::shared_ptr<ILexicalSearch> lexicalSearch,
                                 config::RetrievalConfig config)
    : embedder_(std::move(embedder)),
      vectorSearch_(std::move(vectorSearch)),
      lexicalSearch_(std::move(lexicalSearch)),
      config_(config),
      ranker_(FusionConfig{config.rrfK, config.perDocumentCap}) {}

Result<std::vector<FusedResult>> HybridRetriever::search(const std::string& query) const {
    return search(query, config_.topK, config_.minScore);
}

Result<std::vector<FusedResult>> HybridRetriever::search(const std::string& query, size_t k,
                                                         double minScore) const {
    if (!embedder_ || !vectorSearch_ || !lexicalSearch_) {
        return Error{ErrorCode::InvalidArgument, "Retriever is missing a collaborator"};
    }

    auto queryVec = embedder_->embedOne(query);
    if (!queryVec) {
        spdlog::error("Query embedding failed: {}", queryVec.error().message);
        return queryVec.error();
    }

    const size_t candidates = config_.candidates;
    auto vectorFuture = std::async(std::launch::async, [this, &queryVec, candidates]() {
        return vectorSearch_->knn(queryVec.value(), candidates);
    });
    auto lexicalFuture = std::async(std::launch::async, [this, &query, candidates]() {
        return lexicalSearch_->keyword(query, candidates);
    });

    auto vectorHits = vectorFuture.get();
    auto lexicalHits = lexicalFuture.get();
    if (!vectorHits) {
        spdlog::error("Vector search failed: {}", vectorHits.error().message);
        return vectorHits.error();
    }
    if (!lexicalHits) {
        spdlog::error("Keyword search failed: {}", lexicalHits.error().message);
        return lexicalHits.error();
    }

    auto fused = ranker_.fuse(vectorHits.value(), lexicalHits.value(), k, minScore);
    spdlog::info("Query '{}' -> {} results", query, fused.size());
    return fused;
}

} // namespace docsift::search
