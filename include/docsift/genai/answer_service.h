#pragma once

#include <docsift/config/pipeline_config.h>
#include <docsift/core/types.h>
#include <docsift/net/http_client.h>
#include <docsift/search/hybrid_retriever.h>
#include <docsift/search/search_hit.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docsift::genai {

// "<title>, p.<page>", "<title>, slide <slide>", else the title (or "source")
std::string contextTag(const search::SearchHit& hit);

/**
 * @brief Render retrieved passages as "[tag] text" blocks separated by blank lines.
 *
 * A passage uses its snippet when present, else the full chunk text.
 */
std::string formatContext(const std::vector<search::FusedResult>& results);

struct GenerationOptions {
    size_t maxTokens = 350;
    double temperature = 0.0;
    int seed = 1337;
};

/**
 * @brief Natural-language answer from a query and formatted context.
 */
class IAnswerGenerator {
public:
    virtual ~IAnswerGenerator() = default;
    virtual Result<std::string> answer(const std::string& query, const std::string& context,
                                       const GenerationOptions& options) = 0;
};

/**
 * @brief Chat-completion endpoint with greedy decoding; reads choices[0].message.content.
 */
class HttpAnswerGenerator : public IAnswerGenerator {
public:
    HttpAnswerGenerator(config::ServiceConfig config,
                        std::shared_ptr<net::IHttpTransport> transport);

    Result<std::string> answer(const std::string& query, const std::string& context,
                               const GenerationOptions& options) override;

    nlohmann::json buildPayload(const std::string& query, const std::string& context,
                                const GenerationOptions& options) const;
    static Result<std::string> parseResponse(const std::string& body);

    static const char* systemPrompt();

private:
    config::ServiceConfig config_;
    std::shared_ptr<net::IHttpTransport> transport_;
};

struct AnswerSource {
    std::string title;
    std::optional<int> page;
    std::optional<int> slide;
    std::optional<std::string> uri;
    std::optional<std::string> source;
    std::string snippet;
};

struct QaAnswer {
    std::string answer;
    std::vector<AnswerSource> sources;
};

void to_json(nlohmann::json& j, const AnswerSource& source);
void to_json(nlohmann::json& j, const QaAnswer& answer);

/**
 * @brief Retrieve then generate. Service failures propagate; nothing is retried.
 */
class QaService {
public:
    QaService(std::shared_ptr<const search::HybridRetriever> retriever,
              std::shared_ptr<IAnswerGenerator> generator);

    Result<QaAnswer> ask(const std::string& query, size_t k = 6,
                         const GenerationOptions& options = {}) const;

    // Highlight when present, else the first 220 characters of text plus an ellipsis
    static std::string sourceSnippet(const search::FusedResult& result);

private:
    std::shared_ptr<const search::HybridRetriever> retriever_;
    std::shared_ptr<IAnswerGenerator> generator_;
};

} // namespace docsift::genai
