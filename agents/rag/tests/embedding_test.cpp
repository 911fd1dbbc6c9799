#include <gtest/gtest.h>
#include <atomic>

#include "../include/embedding.hpp"
#include "../include/errors.hpp"
#include "test_support.hpp"

using json = nlohmann::json;

TEST(OpenAiEmbeddingsTest, RequestShapeAndResult) {
    ScriptedTransport http;
    http.push_json({{"data", json::array({json{{"embedding", {0.1, 0.2, 0.3}}}})}});
    OpenAiSettings s;
    s.api_key = "sk-test";
    s.base_url = "https://example.test/v1/";
    OpenAiEmbeddings embedder(s, 3, 5000, http.transport());

    auto v = embedder.embed("line one\nline two");
    ASSERT_EQ(v.size(), 3u);
    EXPECT_FLOAT_EQ(v[2], 0.3f);

    ASSERT_EQ(http.calls(), 1u);
    EXPECT_EQ(http.request(0).url, "https://example.test/v1/embeddings");
    EXPECT_EQ(http.request(0).timeout_ms, 5000);
    EXPECT_EQ(http.request(0).headers.at(0), "Authorization: Bearer sk-test");
    auto body = http.request_body(0);
    EXPECT_EQ(body["model"], "text-embedding-3-small");
    EXPECT_EQ(body["input"][0], "line one line two");
    EXPECT_EQ(body["dimensions"], 3);
}

TEST(OpenAiEmbeddingsTest, OlderModelsDoNotSendDimensions) {
    ScriptedTransport http;
    http.push_json({{"data", json::array({json{{"embedding", {1.0, 2.0}}}})}});
    OpenAiSettings s;
    s.embedding_model = "text-embedding-ada-002";
    OpenAiEmbeddings embedder(s, 2, 1000, http.transport());
    embedder.embed("x");
    EXPECT_FALSE(http.request_body(0).contains("dimensions"));
    EXPECT_TRUE(http.request(0).headers.empty());
}

TEST(OpenAiEmbeddingsTest, ProviderFailures) {
    ScriptedTransport http;
    http.push(500, "upstream exploded");
    http.push(200, "not json");
    http.push_json({{"data", json::array()}});
    http.push_json({{"data", json::array({json{{"embedding", {1.0, 2.0}}}})}});
    OpenAiEmbeddings embedder(OpenAiSettings{}, 3, 1000, http.transport());
    EXPECT_THROW(embedder.embed("a"), ProviderError);
    EXPECT_THROW(embedder.embed("b"), ProviderError);
    EXPECT_THROW(embedder.embed("c"), ProviderError);
    EXPECT_THROW(embedder.embed("d"), ProviderError); // wrong length
}

TEST(OllamaEmbeddingsTest, RequestShape) {
    ScriptedTransport http;
    http.push_json({{"embedding", {0.5, 0.5}}});
    OllamaSettings s;
    s.base_url = "http://gpu-box:11434";
    OllamaEmbeddings embedder(s, 2, 1000, http.transport());
    auto v = embedder.embed("hello\nworld");
    EXPECT_EQ(v.size(), 2u);
    EXPECT_EQ(http.request(0).url, "http://gpu-box:11434/api/embeddings");
    auto body = http.request_body(0);
    EXPECT_EQ(body["model"], "bge-m3");
    EXPECT_EQ(body["prompt"], "hello world");
}

TEST(EmbedBatchTest, KeepsInputOrderAcrossWorkers) {
    KeywordEmbeddings embedder(16);
    std::vector<std::string> texts;
    for (int i = 0; i < 40; ++i) texts.push_back("text number " + std::to_string(i));
    auto batch = embedder.embed_batch(texts, 4, 0.0f);
    ASSERT_EQ(batch.size(), texts.size());
    for (size_t i = 0; i < texts.size(); ++i) EXPECT_EQ(batch[i], embedder.embed(texts[i]));
    EXPECT_EQ(embedder.calls(), 80);
}

TEST(EmbedBatchTest, FirstFailureIsRethrown) {
    std::atomic<int> calls{0};
    HttpTransport flaky = [&calls](const HttpRequest& req, const Deadline&) {
        ++calls;
        auto body = json::parse(req.json_body);
        if (body["prompt"] == "poison") return HttpResponse{503, "busy"};
        return HttpResponse{200, json{{"embedding", {1.0, 0.0}}}.dump()};
    };
    OllamaEmbeddings embedder(OllamaSettings{}, 2, 1000, flaky);
    std::vector<std::string> texts = {"a", "b", "poison", "c"};
    EXPECT_THROW(embedder.embed_batch(texts, 1, 0.0f), ProviderError);
    EXPECT_EQ(calls.load(), 3); // a single worker stops at the failure
}

TEST(EmbedBatchTest, CancelledDeadline) {
    KeywordEmbeddings embedder(4);
    auto dl = Deadline::none();
    dl.cancel();
    EXPECT_THROW(embedder.embed("x", dl), DeadlineExceeded);
    EXPECT_THROW(embedder.embed_batch({"x", "y"}, 2, 0.0f, dl), DeadlineExceeded);
    EXPECT_EQ(embedder.calls(), 0);
}

TEST(EmbeddingFactoryTest, SelectsByName) {
    Settings s;
    s.vector_store.embedding_dimensions = 8;
    s.embed.provider = "ollama";
    auto p = make_embedding_provider(s, ScriptedTransport().transport());
    EXPECT_EQ(p->name(), "ollama:bge-m3");
    EXPECT_EQ(p->dimensions(), 8);
    s.embed.provider = "cohere";
    EXPECT_THROW(make_embedding_provider(s, ScriptedTransport().transport()), UnsupportedProvider);
}
