#include "../include/embedding.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <thread>

using json = nlohmann::json;

static std::string strip_trailing_slash(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

static std::string snippet(const std::string& body) {
    return body.size() > 200 ? body.substr(0, 200) + "..." : body;
}

static json parse_provider_json(const HttpResponse& r, const std::string& what) {
    if (r.status < 200 || r.status >= 300) {
        throw ProviderError(what + " failed: status " + std::to_string(r.status) + ": " + snippet(r.body));
    }
    auto data = json::parse(r.body, nullptr, false);
    if (data.is_discarded()) throw ProviderError(what + " returned invalid JSON");
    return data;
}

static std::vector<float> to_vector(const json& arr, const std::string& what) {
    if (!arr.is_array()) throw ProviderError(what + " response has no embedding array");
    std::vector<float> vec;
    vec.reserve(arr.size());
    for (auto& v : arr) {
        if (!v.is_number()) throw ProviderError(what + " embedding contains a non-number");
        vec.push_back(v.get<float>());
    }
    return vec;
}

std::vector<float> EmbeddingProvider::embed(const std::string& text, const Deadline& deadline) {
    deadline.check("embed");
    auto vec = embed_one(replace_newlines(text), deadline);
    if ((int)vec.size() != dimensions_) {
        throw ProviderError(name() + " returned " + std::to_string(vec.size()) +
                            " dimensions, expected " + std::to_string(dimensions_));
    }
    return vec;
}

std::vector<std::vector<float>> EmbeddingProvider::embed_batch(const std::vector<std::string>& texts, int workers,
                                                               float qps, const Deadline& deadline) {
    std::vector<std::vector<float>> out(texts.size());
    if (texts.empty()) return out;
    int n_workers = std::max(1, std::min<int>(workers, (int)texts.size()));

    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex mtx;
    auto interval = qps > 0.0f ? std::chrono::microseconds((long long)(1e6 / qps)) : std::chrono::microseconds(0);
    auto next_slot = std::chrono::steady_clock::now();

    auto work = [&]() {
        while (!failed.load()) {
            size_t i = next.fetch_add(1);
            if (i >= texts.size()) return;
            if (interval.count() > 0) {
                std::chrono::steady_clock::time_point slot;
                {
                    std::lock_guard<std::mutex> lock(mtx);
                    slot = std::max(next_slot, std::chrono::steady_clock::now());
                    next_slot = slot + interval;
                }
                std::this_thread::sleep_until(slot);
            }
            try {
                out[i] = embed(texts[i], deadline);
            } catch (...) {
                std::lock_guard<std::mutex> lock(mtx);
                if (!failed.exchange(true)) first_error = std::current_exception();
                return;
            }
            if ((i + 1) % 50 == 0) RAG_DEBUG("embed", "embedded " << (i + 1) << "/" << texts.size());
        }
    };

    std::vector<std::thread> pool;
    for (int w = 1; w < n_workers; ++w) pool.emplace_back(work);
    work();
    for (auto& t : pool) t.join();
    if (first_error) std::rethrow_exception(first_error);
    return out;
}

OpenAiEmbeddings::OpenAiEmbeddings(const OpenAiSettings& settings, int dimensions, long timeout_ms,
                                   HttpTransport transport)
    : EmbeddingProvider(dimensions),
      base_url_(strip_trailing_slash(settings.base_url)),
      api_key_(settings.api_key),
      model_(settings.embedding_model),
      timeout_ms_(timeout_ms),
      transport_(std::move(transport)) {}

std::vector<float> OpenAiEmbeddings::embed_one(const std::string& text, const Deadline& deadline) {
    json body = {
        {"model", model_},
        {"input", json::array({text})}
    };
    // Only the v3 models accept a requested output size.
    if (model_.rfind("text-embedding-3", 0) == 0) body["dimensions"] = dimensions();

    HttpRequest req;
    req.url = base_url_ + "/embeddings";
    req.json_body = body.dump();
    req.timeout_ms = timeout_ms_;
    if (!api_key_.empty()) req.headers.push_back("Authorization: Bearer " + api_key_);
    auto data = parse_provider_json(transport_(req, deadline), "embedding");
    if (!data.contains("data") || !data["data"].is_array() || data["data"].empty()) {
        throw ProviderError("embedding response has no data");
    }
    return to_vector(data["data"][0].value("embedding", json()), "embedding");
}

OllamaEmbeddings::OllamaEmbeddings(const OllamaSettings& settings, int dimensions, long timeout_ms,
                                   HttpTransport transport)
    : EmbeddingProvider(dimensions),
      base_url_(strip_trailing_slash(settings.base_url)),
      model_(settings.embedding_model),
      timeout_ms_(timeout_ms),
      transport_(std::move(transport)) {}

std::vector<float> OllamaEmbeddings::embed_one(const std::string& text, const Deadline& deadline) {
    json body = {
        {"model", model_},
        {"prompt", text}
    };
    HttpRequest req;
    req.url = base_url_ + "/api/embeddings";
    req.json_body = body.dump();
    req.timeout_ms = timeout_ms_;
    auto data = parse_provider_json(transport_(req, deadline), "embedding");
    return to_vector(data.value("embedding", json()), "embedding");
}

std::unique_ptr<EmbeddingProvider> make_embedding_provider(const Settings& settings, HttpTransport transport) {
    const auto& p = settings.embed.provider;
    int dims = settings.vector_store.embedding_dimensions;
    if (p == "openai") {
        return std::make_unique<OpenAiEmbeddings>(settings.openai, dims, settings.embed.timeout_ms, std::move(transport));
    }
    if (p == "ollama") {
        return std::make_unique<OllamaEmbeddings>(settings.ollama, dims, settings.embed.timeout_ms, std::move(transport));
    }
    throw UnsupportedProvider("embedding provider not available: '" + p + "'");
}
