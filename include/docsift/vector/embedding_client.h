#pragma once

#include <docsift/config/pipeline_config.h>
#include <docsift/core/types.h>
#include <docsift/net/http_client.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace docsift::vector {

/**
 * @brief One embedding request/response round trip.
 */
class IEmbeddingBackend {
public:
    virtual ~IEmbeddingBackend() = default;

    // Must return one vector per input, in input order
    virtual Result<std::vector<Embedding>> embedBatch(const std::vector<std::string>& texts) = 0;
};

/**
 * @brief Embedding service over HTTP.
 *
 * POSTs {"model_id", "inputs", "project_id"} and reads results[].embedding.
 */
class HttpEmbeddingBackend : public IEmbeddingBackend {
public:
    HttpEmbeddingBackend(config::ServiceConfig config,
                         std::shared_ptr<net::IHttpTransport> transport);

    Result<std::vector<Embedding>> embedBatch(const std::vector<std::string>& texts) override;

    nlohmann::json buildPayload(const std::vector<std::string>& texts) const;
    static Result<std::vector<Embedding>> parseResponse(const std::string& body);

private:
    config::ServiceConfig config_;
    std::shared_ptr<net::IHttpTransport> transport_;
};

/**
 * @brief Batches embedding requests to bound payload size.
 *
 * Batches are sent sequentially; output order equals input order. A batch whose
 * response length differs from the request is InvalidData. No retries.
 */
class EmbeddingClient {
public:
    explicit EmbeddingClient(std::shared_ptr<IEmbeddingBackend> backend, size_t batchSize = 16);

    Result<std::vector<Embedding>> embed(const std::vector<std::string>& texts) const;
    Result<Embedding> embedOne(const std::string& text) const;

    // Dimension of the model's vectors, found by embedding a fixed probe string
    Result<size_t> probeDimension() const;

    size_t batchSize() const { return batchSize_; }

private:
    std::shared_ptr<IEmbeddingBackend> backend_;
    size_t batchSize_;
};

// Common JSON headers plus "Authorization: Bearer <token>" when a token is set
std::vector<net::Header> serviceHeaders(const config::ServiceConfig& config);

} // namespace docsift::vector
