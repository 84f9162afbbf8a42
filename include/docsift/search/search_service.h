#pragma once

#include <docsift/config/pipeline_config.h>
#include <docsift/core/types.h>
#include <docsift/net/http_client.h>
#include <docsift/search/search_hit.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace docsift::search {

// Approximate nearest-neighbour query over stored chunk vectors
class IVectorSearch {
public:
    virtual ~IVectorSearch() = default;
    virtual Result<std::vector<SearchHit>> knn(const Embedding& query, size_t k) = 0;
};

// Keyword / BM25 query over stored chunk text
class ILexicalSearch {
public:
    virtual ~ILexicalSearch() = default;
    virtual Result<std::vector<SearchHit>> keyword(const std::string& query, size_t size) = 0;
};

struct BulkSummary {
    size_t succeeded = 0;
    size_t failed = 0;
};

/**
 * @brief Elasticsearch-compatible REST client: search, index admin and bulk writes.
 *
 * Every call is a single request with the configured timeout. Non-2xx answers
 * and malformed bodies are returned as errors; nothing is retried.
 */
class ElasticSearchClient : public IVectorSearch, public ILexicalSearch {
public:
    ElasticSearchClient(config::ServiceConfig services, config::RetrievalConfig retrieval,
                        std::shared_ptr<net::IHttpTransport> transport);

    Result<std::vector<SearchHit>> knn(const Embedding& query, size_t k) override;
    Result<std::vector<SearchHit>> keyword(const std::string& query, size_t size) override;

    Result<bool> indexExists();
    Result<void> createIndex(const nlohmann::json& body);
    // Deletes every document, keeping the index and its mapping
    Result<void> deleteAllDocuments();
    // Body is newline-delimited action/document pairs
    Result<BulkSummary> bulk(const std::string& ndjson);

    const std::string& indexName() const { return services_.indexName; }

    static nlohmann::json buildKnnQuery(const Embedding& query, size_t k);
    nlohmann::json buildLexicalQuery(const std::string& query, size_t size) const;
    static Result<std::vector<SearchHit>> parseHits(const std::string& body);
    static Result<BulkSummary> parseBulkResponse(const std::string& body);

private:
    Result<net::HttpResponse> send(net::HttpMethod method, const std::string& path,
                                   std::string body, const char* contentType = "application/json");

    config::ServiceConfig services_;
    config::RetrievalConfig retrieval_;
    std::shared_ptr<net::IHttpTransport> transport_;
};

// Stored fields requested by both search paths
const std::vector<std::string>& storedFields();

} // namespace docsift::search
