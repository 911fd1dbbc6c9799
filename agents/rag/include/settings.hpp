#pragma once
#include "log.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>

struct LlmSettings {
    double temperature{0.0};
    std::optional<int> max_tokens;
    int max_retries{3};
    long timeout_ms{240000};
};

struct OpenAiSettings : LlmSettings {
    std::string api_key;
    std::string base_url{"https://api.openai.com/v1"};
    std::string default_model{"gpt-4o-mini"};
    std::string embedding_model{"text-embedding-3-small"};
};

struct OllamaSettings : LlmSettings {
    std::string base_url{"http://localhost:11434"};
    std::string default_model{"mistral"};
    std::string embedding_model{"bge-m3"};
};

struct DatabaseSettings {
    std::string service_url{"./data/rag.db"};
};

struct VectorStoreSettings {
    std::string table_name{"embeddings"};
    int embedding_dimensions{1536};
    std::chrono::seconds time_partition_interval{std::chrono::hours(24 * 7)};
};

struct EmbedSettings {
    std::string provider{"openai"};
    int workers{1};
    float qps{0.0f}; // 0 disables throttling
    long timeout_ms{120000};
};

// Built once at startup and passed by reference; nothing caches it globally.
struct Settings {
    OpenAiSettings openai;
    OllamaSettings ollama;
    DatabaseSettings database;
    VectorStoreSettings vector_store;
    EmbedSettings embed;
    std::string llm_provider{"openai"};
    LogLevel log_level{LogLevel::Info};
};

// KEY=VALUE lines; '#' comments, optional "export ", single or double quotes.
std::map<std::string, std::string> parse_dotenv(const std::string& text);

// Defaults, then `env_file` (if it exists), then the process environment.
Settings load_settings(const std::string& env_file = ".env");

// "7d", "12h", "30m", "45s" or a bare number of seconds.
std::chrono::seconds parse_interval(const std::string& text);
