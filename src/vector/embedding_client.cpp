#include <docsift/vector/embedding_client.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace docsift::vector {

std::vector<net::Header> serviceHeaders(const config::ServiceConfig& config) {
    std::vector<net::Header> headers{{"Accept", "application/json"},
                                     {"Content-Type", "application/json"}};
    if (!config.apiToken.empty()) {
        headers.push_back({"Authorization", "Bearer " + config.apiToken});
    }
    return headers;
}

HttpEmbeddingBackend::HttpEmbeddingBackend(config::ServiceConfig config,
                                           std::shared_ptr<net::IHttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {}

nlohmann::json HttpEmbeddingBackend::buildPayload(const std::vector<std::string>& texts) const {
    return nlohmann::json{
        {"model_id", config_.embeddingModel}, {"inputs", texts}, {"project_id", config_.projectId}};
}

Result<std::vector<Embedding>> HttpEmbeddingBackend::parseResponse(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        std::vector<Embedding> out;
        for (const auto& row : j.at("results")) {
            out.push_back(row.at("embedding").get<Embedding>());
        }
        return out;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed embedding response: ") + e.what()};
    }
}

Result<std::vector<Embedding>>
HttpEmbeddingBackend::embedBatch(const std::vector<std::string>& texts) {
    if (!transport_) {
        return Error{ErrorCode::InvalidArgument, "No HTTP transport configured"};
    }
    if (config_.embeddingUrl.empty()) {
        return Error{ErrorCode::InvalidArgument, "services.embedding_url is not set"};
    }

    net::HttpRequest req;
    req.method = net::HttpMethod::Post;
    req.url = config_.embeddingUrl;
    req.headers = serviceHeaders(config_);
    req.body = buildPayload(texts).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    req.timeout = config_.timeout;

    auto resp = transport_->send(req);
    if (!resp) {
        return resp.error();
    }
    if (!resp.value().ok()) {
        spdlog::error("Embedding service error: HTTP {}", resp.value().status);
        return net::httpStatusError(resp.value(), "embedding request");
    }
    return parseResponse(resp.value().body);
}

EmbeddingClient::EmbeddingClient(std::shared_ptr<IEmbeddingBackend> backend, size_t batchSize)
    : backend_(std::move(backend)), batchSize_(std::max<size_t>(1, batchSize)) {}

Result<std::vector<Embedding>> EmbeddingClient::embed(const std::vector<std::string>& texts) const {
    if (!backend_) {
        return Error{ErrorCode::InvalidArgument, "No embedding backend configured"};
    }
    std::vector<Embedding> out;
    out.reserve(texts.size());

    for (size_t i = 0; i < texts.size(); i += batchSize_) {
        const size_t end = std::min(texts.size(), i + batchSize_);
        std::vector<std::string> batch(texts.begin() + static_cast<std::ptrdiff_t>(i),
                                       texts.begin() + static_cast<std::ptrdiff_t>(end));
        auto vecs = backend_->embedBatch(batch);
        if (!vecs) {
            return vecs.error();
        }
        if (vecs.value().size() != batch.size()) {
            return Error{ErrorCode::InvalidData,
                         "Embedding service returned " + std::to_string(vecs.value().size()) +
                             " vectors for " + std::to_string(batch.size()) + " inputs"};
        }
        for (auto& v : vecs.value()) {
            out.push_back(std::move(v));
        }
    }
    spdlog::debug("Embedded {} texts in batches of {}", texts.size(), batchSize_);
    return out;
}

Result<Embedding> EmbeddingClient::embedOne(const std::string& text) const {
    auto vecs = embed({text});
    if (!vecs) {
        return vecs.error();
    }
    return std::move(vecs.value().front());
}

Result<size_t> EmbeddingClient::probeDimension() const {
    auto v = embedOne("dimension probe");
    if (!v) {
        return v.error();
    }
    if (v.value().empty()) {
        return Error{ErrorCode::InvalidData, "Embedding service returned an empty vector"};
    }
    return v.value().size();
}

} // namespace docsift::vector
