#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <docsift/vector/embedding_client.h>

#include "support/mock_services.h"

#include <nlohmann/json.hpp>

using namespace docsift;
using namespace docsift::vector;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

namespace {

std::vector<std::string> numbered(size_t n) {
    std::vector<std::string> out;
    for (size_t i = 0; i < n; ++i) {
        out.push_back("text " + std::string(i + 1, 'x'));
    }
    return out;
}

config::ServiceConfig embeddingConfig() {
    config::ServiceConfig cfg;
    cfg.embeddingUrl = "https://ml.example.com/v1/embeddings";
    cfg.embeddingModel = "slate-30m";
    cfg.projectId = "proj-1";
    cfg.apiToken = "secret";
    return cfg;
}

} // namespace

TEST(EmbeddingClientTest, SplitsIntoBatchesAndKeepsOrder) {
    auto backend = std::make_shared<test_support::MockEmbeddingBackend>();
    std::vector<size_t> batchSizes;
    EXPECT_CALL(*backend, embedBatch(_))
        .Times(3)
        .WillRepeatedly(Invoke([&](const std::vector<std::string>& texts) {
            batchSizes.push_back(texts.size());
            return Result<std::vector<Embedding>>(test_support::lengthEmbeddings(texts));
        }));

    EmbeddingClient client(backend, 4);
    auto texts = numbered(10);
    auto vecs = client.embed(texts);
    ASSERT_TRUE(vecs) << vecs.error().message;
    ASSERT_EQ(vecs.value().size(), 10u);
    EXPECT_EQ(batchSizes, (std::vector<size_t>{4, 4, 2}));
    for (size_t i = 0; i < texts.size(); ++i) {
        EXPECT_FLOAT_EQ(vecs.value()[i][0], static_cast<float>(texts[i].size()));
    }
}

TEST(EmbeddingClientTest, EmptyInputMakesNoRequests) {
    auto backend = std::make_shared<test_support::MockEmbeddingBackend>();
    EXPECT_CALL(*backend, embedBatch(_)).Times(0);
    EmbeddingClient client(backend);
    auto vecs = client.embed({});
    ASSERT_TRUE(vecs);
    EXPECT_TRUE(vecs.value().empty());
    EXPECT_EQ(client.batchSize(), 16u);
}

TEST(EmbeddingClientTest, CountMismatchIsInvalidData) {
    auto backend = std::make_shared<test_support::MockEmbeddingBackend>();
    EXPECT_CALL(*backend, embedBatch(_))
        .WillOnce(Return(Result<std::vector<Embedding>>(std::vector<Embedding>{{1.0f}})));
    EmbeddingClient client(backend);
    auto vecs = client.embed({"a", "b"});
    ASSERT_FALSE(vecs);
    EXPECT_EQ(vecs.error().code, ErrorCode::InvalidData);
}

TEST(EmbeddingClientTest, BackendErrorStopsTheRun) {
    auto backend = std::make_shared<test_support::MockEmbeddingBackend>();
    EXPECT_CALL(*backend, embedBatch(_))
        .WillOnce(Return(Result<std::vector<Embedding>>(Error{ErrorCode::Timeout, "slow"})));
    EmbeddingClient client(backend, 2);
    auto vecs = client.embed(numbered(6));
    ASSERT_FALSE(vecs);
    EXPECT_EQ(vecs.error().code, ErrorCode::Timeout);
}

TEST(EmbeddingClientTest, ProbeDimension) {
    auto backend = std::make_shared<test_support::MockEmbeddingBackend>();
    EXPECT_CALL(*backend, embedBatch(_))
        .WillOnce(Return(Result<std::vector<Embedding>>(std::vector<Embedding>{Embedding(384, 0.5f)})))
        .WillOnce(Return(Result<std::vector<Embedding>>(std::vector<Embedding>{Embedding{}})));
    EmbeddingClient client(backend);

    auto dim = client.probeDimension();
    ASSERT_TRUE(dim);
    EXPECT_EQ(dim.value(), 384u);

    auto empty = client.probeDimension();
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidData);
}

TEST(ServiceHeadersTest, BearerOnlyWhenTokenSet) {
    config::ServiceConfig cfg;
    auto plain = serviceHeaders(cfg);
    for (const auto& h : plain) {
        EXPECT_NE(h.name, "Authorization");
    }

    cfg.apiToken = "abc";
    auto withToken = serviceHeaders(cfg);
    ASSERT_FALSE(withToken.empty());
    EXPECT_EQ(withToken.back().name, "Authorization");
    EXPECT_EQ(withToken.back().value, "Bearer abc");
}

TEST(HttpEmbeddingBackendTest, PostsPayloadAndParsesResults) {
    auto transport = std::make_shared<test_support::RecordingTransport>();
    transport->enqueue(200, R"({"results":[{"embedding":[0.1,0.2]},{"embedding":[0.3,0.4]}]})");
    HttpEmbeddingBackend backend(embeddingConfig(), transport);

    auto vecs = backend.embedBatch({"first", "second"});
    ASSERT_TRUE(vecs) << vecs.error().message;
    ASSERT_EQ(vecs.value().size(), 2u);
    EXPECT_FLOAT_EQ(vecs.value()[1][0], 0.3f);

    ASSERT_EQ(transport->requests.size(), 1u);
    const auto& req = transport->requests[0];
    EXPECT_EQ(req.method, net::HttpMethod::Post);
    EXPECT_EQ(req.url, "https://ml.example.com/v1/embeddings");
    auto body = nlohmann::json::parse(req.body);
    EXPECT_EQ(body["model_id"], "slate-30m");
    EXPECT_EQ(body["project_id"], "proj-1");
    EXPECT_EQ(body["inputs"], (nlohmann::json{"first", "second"}));

    bool bearer = false;
    for (const auto& h : req.headers) {
        bearer = bearer || (h.name == "Authorization" && h.value == "Bearer secret");
    }
    EXPECT_TRUE(bearer);
}

TEST(HttpEmbeddingBackendTest, StatusAndTransportErrors) {
    auto transport = std::make_shared<test_support::RecordingTransport>();
    transport->enqueue(401, "unauthorized");
    HttpEmbeddingBackend backend(embeddingConfig(), transport);

    auto denied = backend.embedBatch({"x"});
    ASSERT_FALSE(denied);
    EXPECT_EQ(denied.error().code, ErrorCode::PermissionDenied);

    auto offline = backend.embedBatch({"x"});
    ASSERT_FALSE(offline);
    EXPECT_EQ(offline.error().code, ErrorCode::NetworkError);
}

TEST(HttpEmbeddingBackendTest, MissingUrlIsAConfigurationError) {
    auto transport = std::make_shared<test_support::RecordingTransport>();
    config::ServiceConfig cfg;
    HttpEmbeddingBackend backend(cfg, transport);
    auto vecs = backend.embedBatch({"x"});
    ASSERT_FALSE(vecs);
    EXPECT_EQ(vecs.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(transport->requests.empty());
}

TEST(HttpEmbeddingBackendTest, MalformedBodyIsInvalidData) {
    auto bad = HttpEmbeddingBackend::parseResponse(R"({"results":[{"vector":[1]}]})");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidData);

    auto notJson = HttpEmbeddingBackend::parseResponse("<html>");
    ASSERT_FALSE(notJson);
    EXPECT_EQ(notJson.error().code, ErrorCode::InvalidData);
}
