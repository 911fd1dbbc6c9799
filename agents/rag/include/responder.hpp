#pragma once
#include "deadline.hpp"
#include "llm_hub.hpp"
#include "schema.hpp"
#include "store.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Only the literals "yes" and "no" are recognised.
enum class EnoughContext { Yes, No };

const char* to_string(EnoughContext value);

struct SynthesizedAnswer {
    std::vector<std::string> thought_process;
    std::string answer;
    EnoughContext enough_context{EnoughContext::No};

    static ResponseSchema response_schema();
    static SynthesizedAnswer from_json(const nlohmann::json& j); // throws SchemaViolation
    nlohmann::json to_json() const;
};

// Grounds an answer in ranked search results. Retrying on malformed output
// is LlmHub's job; a returned answer is already validated.
class Responder {
public:
    static const char* const kSystemPrompt;

    explicit Responder(LlmHub& llm, CompletionParams params = {});

    // JSON array of {"content", "category"} in rank order.
    static std::string context_to_json(const std::vector<SearchResult>& context);
    static std::vector<ChatMessage> build_messages(const std::string& question,
                                                   const std::vector<SearchResult>& context);

    SynthesizedAnswer generate_response(const std::string& question, const std::vector<SearchResult>& context,
                                        const Deadline& deadline = Deadline::none());

private:
    LlmHub& llm_;
    CompletionParams params_;
};
