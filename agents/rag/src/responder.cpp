#include "../include/responder.hpp"
#include "../include/log.hpp"

using json = nlohmann::json;

const char* const Responder::kSystemPrompt = R"(# Role and Purpose
You are an AI assistant for an e-commerce FAQ system. Your task is to synthesize a coherent and helpful answer
based on the given question and relevant context retrieved from a knowledge database.

# Guidelines:
1. Provide a clear and concise answer to the question.
2. Use only the information from the relevant context to support your answer.
3. The context is retrieved based on cosine similarity, so some information might be missing or irrelevant.
4. Be transparent when there is insufficient information to fully answer the question.
5. Do not make up or infer information not present in the provided context.
6. If you cannot answer the question based on the given context, clearly state that.
7. Maintain a helpful and professional tone appropriate for customer service.
8. Adhere strictly to company guidelines and policies by using only the provided knowledge base.

Reply with a JSON object containing "thought_process" (list of strings), "answer" (string)
and "enough_context" ("yes" or "no").

Review the question from the user:
)";

const char* to_string(EnoughContext value) {
    return value == EnoughContext::Yes ? "yes" : "no";
}

ResponseSchema SynthesizedAnswer::response_schema() {
    json schema = {
        {"type", "object"},
        {"properties", {
            {"thought_process", {
                {"type", "array"},
                {"items", {{"type", "string"}}},
                {"description", "List of thoughts that the AI assistant had while synthesizing the answer"}
            }},
            {"answer", {
                {"type", "string"},
                {"description", "The synthesized answer to the user's question"}
            }},
            {"enough_context", {
                {"type", "string"},
                {"enum", json::array({"yes", "no"})},
                {"description", "Whether the assistant has enough context to answer the question"}
            }}
        }},
        {"required", json::array({"thought_process", "answer", "enough_context"})},
        {"additionalProperties", false}
    };
    return ResponseSchema{"SynthesizedResponse", schema};
}

SynthesizedAnswer SynthesizedAnswer::from_json(const json& j) {
    if (!j.is_object()) throw SchemaViolation("answer is not an object");
    for (const char* f : {"thought_process", "answer", "enough_context"}) {
        if (!j.contains(f)) throw SchemaViolation(std::string("missing required field '") + f + "'");
    }
    SynthesizedAnswer a;
    const auto& tp = j["thought_process"];
    if (!tp.is_array()) throw SchemaViolation("thought_process must be an array of strings");
    for (const auto& t : tp) {
        if (!t.is_string()) throw SchemaViolation("thought_process must be an array of strings");
        a.thought_process.push_back(t.get<std::string>());
    }
    if (!j["answer"].is_string()) throw SchemaViolation("answer must be a string");
    a.answer = j["answer"].get<std::string>();

    const auto& ec = j["enough_context"];
    if (ec == "yes") a.enough_context = EnoughContext::Yes;
    else if (ec == "no") a.enough_context = EnoughContext::No;
    else throw SchemaViolation("enough_context must be \"yes\" or \"no\", got " + ec.dump());
    return a;
}

json SynthesizedAnswer::to_json() const {
    return json{
        {"thought_process", thought_process},
        {"answer", answer},
        {"enough_context", to_string(enough_context)}
    };
}

Responder::Responder(LlmHub& llm, CompletionParams params) : llm_(llm), params_(std::move(params)) {}

std::string Responder::context_to_json(const std::vector<SearchResult>& context) {
    json rows = json::array();
    for (const auto& r : context) {
        const auto& md = r.record.metadata;
        json category = md.is_object() && md.contains("category") ? md["category"] : json();
        rows.push_back(json{{"content", r.record.content}, {"category", category}});
    }
    return rows.dump(4);
}

std::vector<ChatMessage> Responder::build_messages(const std::string& question,
                                                   const std::vector<SearchResult>& context) {
    return {
        ChatMessage{"system", kSystemPrompt},
        ChatMessage{"user", "# User question:\n" + question},
        ChatMessage{"assistant", "# Retrieved information:\n" + context_to_json(context)},
    };
}

SynthesizedAnswer Responder::generate_response(const std::string& question, const std::vector<SearchResult>& context,
                                               const Deadline& deadline) {
    RAG_INFO("responder", "answering with " << context.size() << " context rows");
    return llm_.create_completion<SynthesizedAnswer>(build_messages(question, context), params_, deadline);
}
