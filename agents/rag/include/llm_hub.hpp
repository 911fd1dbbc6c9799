#pragma once
#include "deadline.hpp"
#include "http.hpp"
#include "schema.hpp"
#include "settings.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct ChatMessage {
    std::string role; // system | user | assistant
    std::string content;
};

// Per-call overrides; unset fields fall back to the provider settings.
struct CompletionParams {
    std::optional<std::string> model;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    std::optional<int> max_retries;
};

struct ResolvedParams {
    std::string model;
    double temperature{0.0};
    std::optional<int> max_tokens;
    int max_retries{3};
};

class OpenAiProvider {
public:
    explicit OpenAiProvider(OpenAiSettings settings, HttpTransport transport = default_http_transport());

    static constexpr const char* kName = "openai";

    void initialize(); // ProviderError when no API key is configured
    const OpenAiSettings& settings() const { return settings_; }
    const std::string& default_model() const { return settings_.default_model; }

    // Returns the raw assistant message text.
    std::string create_completion(const std::vector<ChatMessage>& messages, const ResolvedParams& params,
                                  const ResponseSchema& schema, const Deadline& deadline);

private:
    OpenAiSettings settings_;
    HttpTransport transport_;
};

class OllamaProvider {
public:
    explicit OllamaProvider(OllamaSettings settings, HttpTransport transport = default_http_transport());

    static constexpr const char* kName = "ollama";

    void initialize();
    const OllamaSettings& settings() const { return settings_; }
    const std::string& default_model() const { return settings_.default_model; }

    std::string create_completion(const std::vector<ChatMessage>& messages, const ResolvedParams& params,
                                  const ResponseSchema& schema, const Deadline& deadline);

private:
    OllamaSettings settings_;
    HttpTransport transport_;
};

// Closed set of supported providers.
using LlmProvider = std::variant<OpenAiProvider, OllamaProvider>;

// Maps a selector ("openai", "ollama") to a provider; UnsupportedProvider otherwise.
LlmProvider make_llm_provider(const std::string& name, const Settings& settings,
                              HttpTransport transport = default_http_transport());

enum class CompletionState { Pending, Attempting, RetryScheduled, Validated, Exhausted };

const char* to_string(CompletionState state);

// Structured completion client. Each call walks
//   Pending -> Attempting -> Validated
//                        \-> RetryScheduled -> Attempting ...
//                        \-> Exhausted
// max_retries is the total number of attempts (at least one). A failed
// attempt appends the model's reply and the validation errors to the
// conversation before asking again. Transport errors are not retried here.
class LlmHub {
public:
    using Observer = std::function<void(CompletionState state, int attempt, const std::string& detail)>;

    explicit LlmHub(LlmProvider provider);

    const char* provider_name() const;
    void set_observer(Observer observer) { observer_ = std::move(observer); }

    ResolvedParams resolve(const CompletionParams& params) const;

    // T provides `static ResponseSchema response_schema()` and
    // `static T from_json(const nlohmann::json&)` (throws SchemaViolation).
    template <class T>
    T create_completion(const std::vector<ChatMessage>& messages, const CompletionParams& params = {},
                        const Deadline& deadline = Deadline::none()) {
        std::optional<T> out;
        complete_structured(T::response_schema(), messages, params, deadline,
                            [&](const nlohmann::json& j) { out = T::from_json(j); });
        return std::move(*out);
    }

    // Returns the first reply that satisfies the schema and `accept`.
    // SchemaValidationError once attempts run out; DeadlineExceeded when the
    // deadline passes between attempts.
    nlohmann::json complete_structured(const ResponseSchema& schema, const std::vector<ChatMessage>& messages,
                                       const CompletionParams& params, const Deadline& deadline,
                                       const std::function<void(const nlohmann::json&)>& accept);

private:
    void notify(CompletionState state, int attempt, const std::string& detail) const;

    LlmProvider provider_;
    Observer observer_;
};
