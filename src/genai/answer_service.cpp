#include <docsift/common/utf8_utils.h>
#include <docsift/genai/answer_service.h>
#include <docsift/vector/embedding_client.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace docsift::genai {

namespace {

constexpr size_t kSourceSnippetChars = 220;

// First maxChars code points of text
std::string utf8Prefix(const std::string& text, size_t maxChars) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (!common::isContinuationByte(text[i]) && seen++ == maxChars) {
            return text.substr(0, i);
        }
    }
    return text;
}

} // namespace

std::string contextTag(const search::SearchHit& hit) {
    if (hit.page && *hit.page != 0) {
        return fmt::format("{}, p.{}", hit.title, *hit.page);
    }
    if (hit.slide && *hit.slide != 0) {
        return fmt::format("{}, slide {}", hit.title, *hit.slide);
    }
    return hit.title.empty() ? std::string("source") : hit.title;
}

std::string formatContext(const std::vector<search::FusedResult>& results) {
    std::string out;
    for (const auto& r : results) {
        if (!out.empty()) {
            out += "\n\n";
        }
        const auto& text = (r.snippet && !r.snippet->empty()) ? *r.snippet : r.hit.text;
        out += fmt::format("[{}] {}", contextTag(r.hit), text);
    }
    return out;
}

const char* HttpAnswerGenerator::systemPrompt() {
    return "You are a retrieval-augmented assistant. Answer the user's question from the "
           "provided context passages.\n\n"
           "Rules (follow all):\n"
           "1) Base your answer on facts found in the Context. Light reasoning or summarization "
           "is allowed, new information is not.\n"
           "2) If the Context does not contain enough information to answer confidently, reply "
           "exactly: \"I can't answer that based on the provided documents.\"\n"
           "3) Answer in markdown, using lists for multiple items when appropriate.\n"
           "4) Preserve exact strings for emails, phone numbers, URLs, IDs, units and amounts.\n"
           "5) Be concise and polite. Provide only the answer, with no references to the "
           "Context or the prompt.\n"
           "6) Respond in the language of the question.\n";
}

HttpAnswerGenerator::HttpAnswerGenerator(config::ServiceConfig config,
                                         std::shared_ptr<net::IHttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {}

nlohmann::json HttpAnswerGenerator::buildPayload(const std::string& query,
                                                 const std::string& context,
                                                 const GenerationOptions& options) const {
    auto userText = fmt::format("Context:\n{}\n\nUser: {}\nAnswer:", context, query);
    return nlohmann::json{
        {"model_id", config_.generationModel},
        {"messages",
         nlohmann::json::array(
             {{{"role", "system"}, {"content", systemPrompt()}},
              {{"role", "user"},
               {"content", nlohmann::json::array({{{"type", "text"}, {"text", userText}}})}}})},
        {"decoding_method", "greedy"},
        {"max_tokens", options.maxTokens},
        {"repetition_penalty", 1.05},
        {"temperature", options.temperature},
        {"top_p", 0.1},
        {"seed", options.seed},
        {"project_id", config_.projectId}};
}

Result<std::string> HttpAnswerGenerator::parseResponse(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        return j.at("choices").at(0).at("message").at("content").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     std::string("Malformed generation response: ") + e.what()};
    }
}

Result<std::string> HttpAnswerGenerator::answer(const std::string& query,
                                                const std::string& context,
                                                const GenerationOptions& options) {
    if (!transport_) {
        return Error{ErrorCode::InvalidArgument, "No HTTP transport configured"};
    }
    if (config_.generationUrl.empty()) {
        return Error{ErrorCode::InvalidArgument, "services.generation_url is not set"};
    }

    net::HttpRequest req;
    req.method = net::HttpMethod::Post;
    req.url = config_.generationUrl;
    req.headers = vector::serviceHeaders(config_);
    req.body = buildPayload(query, context, options)
                   .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    req.timeout = config_.timeout;

    auto resp = transport_->send(req);
    if (!resp) {
        return resp.error();
    }
    if (!resp.value().ok()) {
        spdlog::error("Generation service error: HTTP {}", resp.value().status);
        return net::httpStatusError(resp.value(), "generation request");
    }
    return parseResponse(resp.value().body);
}

void to_json(nlohmann::json& j, const AnswerSource& source) {
    j = nlohmann::json{{"title", source.title}, {"snippet", source.snippet}};
    j["page"] = source.page ? nlohmann::json(*source.page) : nlohmann::json(nullptr);
    j["slide"] = source.slide ? nlohmann::json(*source.slide) : nlohmann::json(nullptr);
    j["uri"] = source.uri ? nlohmann::json(*source.uri) : nlohmann::json(nullptr);
    j["source"] = source.source ? nlohmann::json(*source.source) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const QaAnswer& answer) {
    j = nlohmann::json{{"answer", answer.answer}, {"sources", answer.sources}};
}

QaService::QaService(std::shared_ptr<const search::HybridRetriever> retriever,
                     std::shared_ptr<IAnswerGenerator> generator)
    : retriever_(std::move(retriever)), generator_(std::move(generator)) {}

std::string QaService::sourceSnippet(const search::FusedResult& result) {
    if (result.snippet) {
        return *result.snippet;
    }
    return utf8Prefix(result.hit.text, kSourceSnippetChars) + "…";
}

Result<QaAnswer> QaService::ask(const std::string& query, size_t k,
                                const GenerationOptions& options) const {
    if (!retriever_ || !generator_) {
        return Error{ErrorCode::InvalidArgument, "QA service is missing a collaborator"};
    }
    spdlog::info("Received query: {}", query);

    auto hits = retriever_->search(query, k, retriever_->config().minScore);
    if (!hits) {
        return hits.error();
    }

    auto text = generator_->answer(query, formatContext(hits.value()), options);
    if (!text) {
        spdlog::error("Answer generation failed: {}", text.error().message);
        return text.error();
    }

    QaAnswer out;
    out.answer = std::move(text).value();
    for (const auto& h : hits.value()) {
        out.sources.push_back(AnswerSource{h.hit.title, h.hit.page, h.hit.slide, h.hit.uri,
                                           h.hit.source, sourceSnippet(h)});
    }
    for (const auto& s : out.sources) {
        spdlog::debug("Source: {} - {} - {}", s.title,
                      s.page ? *s.page : (s.slide ? *s.slide : 0), s.source.value_or(""));
    }
    return out;
}

} // namespace docsift::genai
