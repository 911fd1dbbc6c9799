#pragma once
#include "deadline.hpp"
#include "http.hpp"
#include "settings.hpp"
#include <memory>
#include <string>
#include <vector>

// Maps text to a fixed-length vector. Newlines are replaced with spaces
// before the provider sees the text; the returned length always equals
// dimensions() or ProviderError is thrown.
class EmbeddingProvider {
public:
    explicit EmbeddingProvider(int dimensions) : dimensions_(dimensions) {}
    virtual ~EmbeddingProvider() = default;

    int dimensions() const { return dimensions_; }
    virtual std::string name() const = 0;

    std::vector<float> embed(const std::string& text, const Deadline& deadline = Deadline::none());

    // Embeds with up to `workers` concurrent calls and at most `qps` calls per
    // second (0 = unthrottled). Output order matches input order. The first
    // failure stops the batch and is rethrown.
    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts, int workers, float qps,
                                                const Deadline& deadline = Deadline::none());

protected:
    virtual std::vector<float> embed_one(const std::string& text, const Deadline& deadline) = 0;

private:
    int dimensions_;
};

class OpenAiEmbeddings : public EmbeddingProvider {
public:
    OpenAiEmbeddings(const OpenAiSettings& settings, int dimensions, long timeout_ms,
                     HttpTransport transport = default_http_transport());
    std::string name() const override { return "openai:" + model_; }

protected:
    std::vector<float> embed_one(const std::string& text, const Deadline& deadline) override;

private:
    std::string base_url_;
    std::string api_key_;
    std::string model_;
    long timeout_ms_;
    HttpTransport transport_;
};

class OllamaEmbeddings : public EmbeddingProvider {
public:
    OllamaEmbeddings(const OllamaSettings& settings, int dimensions, long timeout_ms,
                     HttpTransport transport = default_http_transport());
    std::string name() const override { return "ollama:" + model_; }

protected:
    std::vector<float> embed_one(const std::string& text, const Deadline& deadline) override;

private:
    std::string base_url_;
    std::string model_;
    long timeout_ms_;
    HttpTransport transport_;
};

// Chooses by settings.embed.provider ("openai" or "ollama"); anything else
// throws UnsupportedProvider.
std::unique_ptr<EmbeddingProvider> make_embedding_provider(const Settings& settings,
                                                           HttpTransport transport = default_http_transport());
