#pragma once

#include <docsift/config/pipeline_config.h>
#include <docsift/core/types.h>
#include <docsift/search/fusion_ranker.h>
#include <docsift/search/search_service.h>
#include <docsift/vector/embedding_client.h>

#include <memory>
#include <string>
#include <vector>

namespace docsift::search {

/**
 * @brief Query -> embedding -> vector and lexical search in parallel -> RRF fusion.
 *
 * Both searches are independent read-only requests; a failure of either fails
 * the whole query.
 */
class HybridRetriever {
public:
    HybridRetriever(std::shared_ptr<const vector::EmbeddingClient> embedder,
                    std::shared_ptr<IVectorSearch> vectorSearch,
                    std::shared_ptr<ILexicalSearch> lexicalSearch,
                    config::RetrievalConfig config = {});

    Result<std::vector<FusedResult>> search(const std::string& query) const;
    Result<std::vector<FusedResult>> search(const std::string& query, size_t k,
                                            double minScore) const;

    const config::RetrievalConfig& config() const { return config_; }

private:
    std::shared_ptr<const vector::EmbeddingClient> embedder_;
    std::shared_ptr<IVectorSearch> vectorSearch_;
    std::shared_ptr<ILexicalSearch> lexicalSearch_;
    config::RetrievalConfig config_;
    FusionRanker ranker_;
};

} // namespace docsift::search
