#include "../include/llm_hub.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include <algorithm>

using json = nlohmann::json;

static std::string strip_trailing_slash(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

static json messages_json(const std::vector<ChatMessage>& messages) {
    json arr = json::array();
    for (const auto& m : messages) arr.push_back(json{{"role", m.role}, {"content", m.content}});
    return arr;
}

static json parse_chat_response(const HttpResponse& r) {
    if (r.status < 200 || r.status >= 300) {
        std::string body = r.body.size() > 200 ? r.body.substr(0, 200) + "..." : r.body;
        throw ProviderError("chat failed: status " + std::to_string(r.status) + ": " + body);
    }
    auto data = json::parse(r.body, nullptr, false);
    if (data.is_discarded()) throw ProviderError("chat returned invalid JSON");
    return data;
}

OpenAiProvider::OpenAiProvider(OpenAiSettings settings, HttpTransport transport)
    : settings_(std::move(settings)), transport_(std::move(transport)) {
    settings_.base_url = strip_trailing_slash(settings_.base_url);
}

void OpenAiProvider::initialize() {
    if (settings_.api_key.empty()) throw ProviderError("OPENAI_API_KEY is not set");
}

std::string OpenAiProvider::create_completion(const std::vector<ChatMessage>& messages, const ResolvedParams& params,
                                              const ResponseSchema& schema, const Deadline& deadline) {
    json body = {
        {"model", params.model},
        {"messages", messages_json(messages)},
        {"temperature", params.temperature},
        {"response_format", {
            {"type", "json_schema"},
            {"json_schema", {{"name", schema.name}, {"schema", schema.schema}}}
        }}
    };
    if (params.max_tokens) body["max_tokens"] = *params.max_tokens;

    HttpRequest req;
    req.url = settings_.base_url + "/chat/completions";
    req.json_body = body.dump();
    req.timeout_ms = settings_.timeout_ms;
    req.headers.push_back("Authorization: Bearer " + settings_.api_key);
    auto data = parse_chat_response(transport_(req, deadline));

    if (!data.contains("choices") || !data["choices"].is_array() || data["choices"].empty()) {
        throw ProviderError("chat response has no choices");
    }
    const auto& choice = data["choices"][0];
    if (!choice.is_object()) throw ProviderError("chat response choice is not an object");
    const auto msg = choice.value("message", json::object());
    auto content = msg.find("content");
    // A refusal comes back with null content; treat it as an empty reply.
    if (content == msg.end() || !content->is_string()) return {};
    return content->get<std::string>();
}

OllamaProvider::OllamaProvider(OllamaSettings settings, HttpTransport transport)
    : settings_(std::move(settings)), transport_(std::move(transport)) {
    settings_.base_url = strip_trailing_slash(settings_.base_url);
}

void OllamaProvider::initialize() {
    if (settings_.base_url.empty()) throw ProviderError("OLLAMA_URL is empty");
}

std::string OllamaProvider::create_completion(const std::vector<ChatMessage>& messages, const ResolvedParams& params,
                                              const ResponseSchema& schema, const Deadline& deadline) {
    json options = {{"temperature", params.temperature}};
    if (params.max_tokens) options["num_predict"] = *params.max_tokens;
    json body = {
        {"model", params.model},
        {"messages", messages_json(messages)},
        {"stream", false},
        {"format", schema.schema},
        {"options", options}
    };
    HttpRequest req;
    req.url = settings_.base_url + "/api/chat";
    req.json_body = body.dump();
    req.timeout_ms = settings_.timeout_ms;
    auto data = parse_chat_response(transport_(req, deadline));
    if (data.contains("message") && data["message"].contains("content") && data["message"]["content"].is_string()) {
        return data["message"]["content"].get<std::string>();
    }
    return {};
}

LlmProvider make_llm_provider(const std::string& name, const Settings& settings, HttpTransport transport) {
    if (name == OpenAiProvider::kName) return OpenAiProvider(settings.openai, std::move(transport));
    if (name == OllamaProvider::kName) return OllamaProvider(settings.ollama, std::move(transport));
    throw UnsupportedProvider("Selected provider not available: '" + name + "'");
}

const char* to_string(CompletionState state) {
    switch (state) {
        case CompletionState::Pending: return "pending";
        case CompletionState::Attempting: return "attempting";
        case CompletionState::RetryScheduled: return "retry_scheduled";
        case CompletionState::Validated: return "validated";
        case CompletionState::Exhausted: return "exhausted";
    }
    return "unknown";
}

LlmHub::LlmHub(LlmProvider provider) : provider_(std::move(provider)) {
    std::visit([](auto& p) { p.initialize(); }, provider_);
}

const char* LlmHub::provider_name() const {
    return std::visit([](const auto& p) -> const char* { return p.kName; }, provider_);
}

ResolvedParams LlmHub::resolve(const CompletionParams& params) const {
    return std::visit([&](const auto& p) {
        const auto& s = p.settings();
        ResolvedParams r;
        r.model = params.model.value_or(p.default_model());
        r.temperature = params.temperature.value_or(s.temperature);
        r.max_tokens = params.max_tokens ? params.max_tokens : s.max_tokens;
        r.max_retries = params.max_retries.value_or(s.max_retries);
        return r;
    }, provider_);
}

void LlmHub::notify(CompletionState state, int attempt, const std::string& detail) const {
    if (observer_) observer_(state, attempt, detail);
}

static std::string join_errors(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "\n";
        out += "- " + e;
    }
    return out;
}

json LlmHub::complete_structured(const ResponseSchema& schema, const std::vector<ChatMessage>& messages,
                                 const CompletionParams& params, const Deadline& deadline,
                                 const std::function<void(const json&)>& accept) {
    const ResolvedParams resolved = resolve(params);
    const int attempts = std::max(1, resolved.max_retries);
    std::vector<ChatMessage> conversation = messages;
    notify(CompletionState::Pending, 0, schema.name);

    for (int attempt = 1;; ++attempt) {
        if (deadline.expired()) {
            notify(CompletionState::Exhausted, attempt - 1, "deadline");
            deadline.check("structured completion '" + schema.name + "'");
        }
        notify(CompletionState::Attempting, attempt, resolved.model);
        RAG_DEBUG("llm", provider_name() << " attempt " << attempt << "/" << attempts << " model=" << resolved.model);

        std::string raw = std::visit([&](auto& p) {
            return p.create_completion(conversation, resolved, schema, deadline);
        }, provider_);

        std::vector<std::string> errors;
        json value;
        try {
            value = parse_model_json(raw);
            errors = schema_errors(value, schema.schema);
            if (errors.empty()) accept(value);
        } catch (const SchemaViolation& e) {
            errors.push_back(e.what());
        }

        if (errors.empty()) {
            notify(CompletionState::Validated, attempt, schema.name);
            RAG_INFO("llm", schema.name << " validated on attempt " << attempt);
            return value;
        }

        std::string detail = join_errors(errors);
        RAG_WARN("llm", schema.name << " attempt " << attempt << " failed validation: " << errors.front());
        if (attempt >= attempts) {
            notify(CompletionState::Exhausted, attempt, detail);
            throw SchemaValidationError("no reply matched schema '" + schema.name + "' after " +
                                        std::to_string(attempt) + " attempt(s):\n" + detail,
                                        attempt, raw);
        }
        notify(CompletionState::RetryScheduled, attempt, detail);
        conversation.push_back(ChatMessage{"assistant", raw});
        conversation.push_back(ChatMessage{"user",
            "Your reply did not match the required JSON schema '" + schema.name + "':\n" + detail +
            "\nReply again with only a JSON object that fixes these errors."});
    }
}
