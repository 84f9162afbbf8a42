#include <docsift/search/search_service.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace docsift::search {

namespace {

constexpr size_t kMinNumCandidates = 200;

std::optional<int> optionalInt(const nlohmann::json& src, const char* key) {
    auto it = src.find(key);
    if (it == src.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<int>();
}

std::optional<std::string> optionalString(const nlohmann::json& src, const char* key) {
    auto it = src.find(key);
    if (it == src.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

std::string_view documentIdOf(std::string_view hitId) {
    auto colon = hitId.find(':');
    return colon == std::string_view::npos ? hitId : hitId.substr(0, colon);
}

const std::vector<std::string>& storedFields() {
    static const std::vector<std::string> fields{"text", "title",   "page",  "slide",
                                                 "uri",  "source", "caption", "extra"};
    return fields;
}

ElasticSearchClient::ElasticSearchClient(config::ServiceConfig services,
                                         config::RetrievalConfig retrieval,
                                         std::shared_ptr<net::IHttpTransport> transport)
    : services_(std::move(services)),
      retrieval_(std::move(retrieval)),
      transport_(std::move(transport)) {}

Result<net::HttpResponse> ElasticSearchClient::send(net::HttpMethod method,
                                                    const std::string& path, std::string body,
                                                    const char* contentType) {
    if (!transport_) {
        return Error{ErrorCode::InvalidArgument, "No HTTP transport configured"};
    }
    net::HttpRequest req;
    req.method = method;
    req.url = net::joinUrl(services_.searchUrl, path);
    req.headers = {{"Accept", "application/json"}, {"Content-Type", contentType}};
    req.body = std::move(body);
    req.timeout = services_.timeout;
    if (!services_.searchUsername.empty()) {
        req.auth = net::BasicAuth{services_.searchUsername, services_.searchPassword};
    }
    return transport_->send(req);
}

nlohmann::json ElasticSearchClient::buildKnnQuery(const Embedding& query, size_t k) {
    return nlohmann::json{
        {"knn",
         {{"field", "vector"},
          {"query_vector", query},
          {"k", k},
          {"num_candidates", std::max(kMinNumCandidates, k * 10)}}},
        {"size", k},
        {"_source", {{"includes", storedFields()}}}};
}

nlohmann::json ElasticSearchClient::buildLexicalQuery(const std::string& query, size_t size) const {
    return nlohmann::json{
        {"query",
         {{"multi_match",
           {{"query", query},
            {"fields", {"text^3", "title^2", "caption"}},
            {"operator", "and"}}}}},
        {"size", size},
        {"highlight",
         {{"fields",
           {{"text",
             {{"fragment_size", retrieval_.highlightFragmentSize},
              {"number_of_fragments", 1}}}}}}},
        {"_source", {{"includes", storedFields()}}}};
}

Result<std::vector<SearchHit>> ElasticSearchClient::parseHits(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        std::vector<SearchHit> hits;
        for (const auto& h : j.at("hits").at("hits")) {
            SearchHit hit;
            hit.id = h.at("_id").get<std::string>();
            if (auto it = h.find("_score"); it != h.end() && it->is_number()) {
                hit.score = it->get<double>();
            }
            if (auto it = h.find("_source"); it != h.end() && it->is_object()) {
                const auto& src = *it;
                hit.text = optionalString(src, "text").value_or("");
                hit.title = optionalString(src, "title").value_or("");
                hit.page = optionalInt(src, "page");
                hit.slide = optionalInt(src, "slide");
                hit.uri = optionalString(src, "uri");
                hit.source = optionalString(src, "source");
                hit.caption = optionalString(src, "caption");
                if (auto e = src.find("extra"); e != src.end()) {
                    hit.extra = *e;
                }
            }
            if (auto hl = h.find("highlight"); hl != h.end()) {
                if (auto t = hl->find("text"); t != hl->end() && t->is_array() && !t->empty() &&
                                                 t->front().is_string()) {
                    hit.highlight = t->front().get<std::string>();
                }
            }
            hits.push_back(std::move(hit));
        }
        return hits;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed search response: ") + e.what()};
    }
}

Result<std::vector<SearchHit>> ElasticSearchClient::knn(const Embedding& query, size_t k) {
    auto resp = send(net::HttpMethod::Post, services_.indexName + "/_search",
                     buildKnnQuery(query, k).dump());
    if (!resp) {
        return resp.error();
    }
    if (!resp.value().ok()) {
        return net::httpStatusError(resp.value(), "knn search");
    }
    auto hits = parseHits(resp.value().body);
    if (hits) {
        spdlog::debug("knn search returned {} hits", hits.value().size());
    }
    return hits;
}

Result<std::vector<SearchHit>> ElasticSearchClient::keyword(const std::string& query, size_t size) {
    auto resp = send(net::HttpMethod::Post, services_.indexName + "/_search",
                     buildLexicalQuery(query, size).dump(-1, ' ', false,
                                                         nlohmann::json::error_handler_t::replace));
    if (!resp) {
        return resp.error();
    }
    if (!resp.value().ok()) {
        return net::httpStatusError(resp.value(), "keyword search");
    }
    auto hits = parseHits(resp.value().body);
    if (hits) {
        spdlog::debug("keyword search returned {} hits", hits.value().size());
    }
    return hits;
}

Result<bool> ElasticSearchClient::indexExists() {
    auto resp = send(net::HttpMethod::Head, services_.indexName, {});
    if (!resp) {
        return resp.error();
    }
    if (resp.value().status == 404) {
        return false;
    }
    if (!resp.value().ok()) {
        return net::httpStatusError(resp.value(), "index exists");
    }
    return true;
}

Result<void> ElasticSearchClient::createIndex(const nlohmann::json& body) {
    auto resp = send(net::HttpMethod::Put, services_.indexName, body.dump());
    if (!resp) {
        return resp.error();
    }
    if (!resp.value().ok()) {
        return net::httpStatusError(resp.value(), "create index");
    }
    return {};
}

Result<void> ElasticSearchClient::deleteAllDocuments() {
    nlohmann::json body{{"query", {{"match_all", nlohmann::json::object()}}}};
    auto resp = send(net::HttpMethod::Post,
                     services_.indexName + "/_delete_by_query?refresh=true&conflicts=proceed",
                     body.dump());
    if (!resp) {
        return resp.error();
    }
    if (!resp.value().ok()) {
        return net::httpStatusError(resp.value(), "delete by query");
    }
    return {};
}

Result<BulkSummary> ElasticSearchClient::parseBulkResponse(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        BulkSummary summary;
        std::string firstError;
        for (const auto& item : j.value("items", nlohmann::json::array())) {
            for (const auto& [op, result] : item.items()) {
                const int status = result.value("status", 0);
                if (status >= 200 && status < 300) {
                    ++summary.succeeded;
                } else {
                    ++summary.failed;
                    if (firstError.empty() && result.contains("error")) {
                        firstError = result["error"].dump();
                    }
                }
            }
        }
        if (summary.failed > 0) {
            return Error{ErrorCode::ServiceError,
                         fmt::format("{} of {} bulk actions failed: {}", summary.failed,
                                     summary.failed + summary.succeeded, firstError)};
        }
        return summary;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed bulk response: ") + e.what()};
    }
}

Result<BulkSummary> ElasticSearchClient::bulk(const std::string& ndjson) {
    auto resp = send(net::HttpMethod::Post, "_bulk", ndjson, "application/x-ndjson");
    if (!resp) {
        return resp.error();
    }
    if (!resp.value().ok()) {
        return net::httpStatusError(resp.value(), "bulk");
    }
    return parseBulkResponse(resp.value().body);
}

} // namespace docsift::search
