#pragma once
#include "../include/embedding.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/time_uuid.hpp"
#include <cctype>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Bag of words hashed into `dimensions` buckets. Texts sharing words end up close.
class KeywordEmbeddings : public EmbeddingProvider {
public:
    explicit KeywordEmbeddings(int dimensions) : EmbeddingProvider(dimensions) {}
    std::string name() const override { return "keywords"; }

    int calls() const { return calls_; }

protected:
    std::vector<float> embed_one(const std::string& text, const Deadline&) override {
        std::lock_guard<std::mutex> lock(mtx_);
        ++calls_;
        std::vector<float> vec((size_t)dimensions(), 0.0f);
        std::string word;
        auto flush = [&] {
            if (word.empty()) return;
            std::uint32_t h = 2166136261u;
            for (char c : word) h = (h ^ (unsigned char)c) * 16777619u;
            vec[h % (std::uint32_t)dimensions()] += 1.0f;
            word.clear();
        };
        for (char c : text) {
            if (std::isalnum((unsigned char)c)) word += (char)std::tolower((unsigned char)c);
            else flush();
        }
        flush();
        return vec;
    }

private:
    std::mutex mtx_;
    int calls_{0};
};

// Replays canned HTTP responses in order and remembers every request.
class ScriptedTransport {
public:
    struct State {
        std::mutex mtx;
        std::deque<HttpResponse> replies;
        std::vector<HttpRequest> requests;
    };

    void push(long status, std::string body) {
        std::lock_guard<std::mutex> lock(state_->mtx);
        state_->replies.push_back(HttpResponse{status, std::move(body)});
    }
    void push_json(const nlohmann::json& body) { push(200, body.dump()); }

    // Wraps `content` the way the chat completions endpoint returns it.
    void push_chat(const std::string& content) {
        nlohmann::json message = {{"role", "assistant"}, {"content", content}};
        nlohmann::json choice = {{"message", message}};
        push_json(nlohmann::json{{"choices", nlohmann::json::array({choice})}});
    }

    HttpTransport transport() const {
        auto state = state_;
        return [state](const HttpRequest& req, const Deadline&) {
            std::lock_guard<std::mutex> lock(state->mtx);
            state->requests.push_back(req);
            if (state->replies.empty()) throw ProviderError("no scripted reply left");
            HttpResponse r = state->replies.front();
            state->replies.pop_front();
            return r;
        };
    }

    std::size_t calls() const { return state_->requests.size(); }
    const HttpRequest& request(std::size_t i) const { return state_->requests.at(i); }
    nlohmann::json request_body(std::size_t i) const { return nlohmann::json::parse(request(i).json_body); }

private:
    std::shared_ptr<State> state_ = std::make_shared<State>();
};

// Removed with everything in it when the test ends.
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
                ("rag_test_" + uuid_from_time(std::chrono::system_clock::now()).to_string());
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path file(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline std::chrono::system_clock::time_point utc_seconds(long long secs) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(secs));
}
