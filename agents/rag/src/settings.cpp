#include "../include/settings.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <cstdlib>
#include <filesystem>
#include <sstream>

std::map<std::string, std::string> parse_dotenv(const std::string& text) {
    std::map<std::string, std::string> out;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        auto t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        if (t.rfind("export ", 0) == 0) t = trim(t.substr(7));
        auto eq = t.find('=');
        if (eq == std::string::npos) continue;
        auto key = trim(t.substr(0, eq));
        auto value = trim(t.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            auto hash = value.find(" #");
            if (hash != std::string::npos) value = trim(value.substr(0, hash));
        }
        if (!key.empty()) out[key] = value;
    }
    return out;
}

std::chrono::seconds parse_interval(const std::string& text) {
    auto t = trim(text);
    if (t.empty()) throw InvalidArgument("empty interval");
    long long mult = 1;
    char unit = t.back();
    if (unit == 'd' || unit == 'h' || unit == 'm' || unit == 's') {
        mult = unit == 'd' ? 86400 : unit == 'h' ? 3600 : unit == 'm' ? 60 : 1;
        t.pop_back();
    }
    long long n = 0;
    try {
        size_t used = 0;
        n = std::stoll(t, &used);
        if (used != t.size()) throw std::invalid_argument(t);
    } catch (const std::exception&) {
        throw InvalidArgument("bad interval: '" + text + "'");
    }
    if (n <= 0) throw InvalidArgument("interval must be positive: '" + text + "'");
    return std::chrono::seconds(n * mult);
}

namespace {
struct EnvLookup {
    std::map<std::string, std::string> file;

    std::optional<std::string> get(const char* key) const {
        if (const char* v = std::getenv(key)) return std::string(v);
        auto it = file.find(key);
        if (it != file.end()) return it->second;
        return std::nullopt;
    }
    std::string str(const char* key, const std::string& def) const {
        auto v = get(key);
        return v ? *v : def;
    }
    int integer(const char* key, int def) const {
        auto v = get(key);
        if (!v || v->empty()) return def;
        try { return std::stoi(*v); }
        catch (const std::exception&) { throw InvalidArgument(std::string("bad integer for ") + key + ": '" + *v + "'"); }
    }
    double real(const char* key, double def) const {
        auto v = get(key);
        if (!v || v->empty()) return def;
        try { return std::stod(*v); }
        catch (const std::exception&) { throw InvalidArgument(std::string("bad number for ") + key + ": '" + *v + "'"); }
    }
};

void apply_llm(const EnvLookup& env, LlmSettings& s) {
    s.temperature = env.real("RAG_TEMPERATURE", s.temperature);
    s.max_retries = env.integer("RAG_MAX_RETRIES", s.max_retries);
    if (auto mt = env.get("RAG_MAX_TOKENS")) {
        if (!mt->empty()) s.max_tokens = env.integer("RAG_MAX_TOKENS", 0);
    }
    s.timeout_ms = env.integer("RAG_LLM_TIMEOUT_MS", (int)s.timeout_ms);
}
}

Settings load_settings(const std::string& env_file) {
    EnvLookup env;
    if (!env_file.empty() && std::filesystem::exists(env_file)) {
        env.file = parse_dotenv(read_text_file(env_file));
    }

    Settings s;
    apply_llm(env, s.openai);
    s.openai.api_key = env.str("OPENAI_API_KEY", "");
    s.openai.base_url = env.str("OPENAI_BASE_URL", s.openai.base_url);
    s.openai.default_model = env.str("OPENAI_MODEL", s.openai.default_model);
    s.openai.embedding_model = env.str("OPENAI_EMBEDDING_MODEL", s.openai.embedding_model);

    apply_llm(env, s.ollama);
    s.ollama.base_url = env.str("OLLAMA_URL", s.ollama.base_url);
    s.ollama.default_model = env.str("RAG_LLM_MODEL", s.ollama.default_model);
    s.ollama.embedding_model = env.str("RAG_EMBED_MODEL", s.ollama.embedding_model);

    s.database.service_url = env.str("TIMESCALE_SERVICE_URL", env.str("RAG_DB_PATH", s.database.service_url));

    s.vector_store.table_name = env.str("RAG_TABLE", s.vector_store.table_name);
    s.vector_store.embedding_dimensions = env.integer("RAG_EMBED_DIMS", s.vector_store.embedding_dimensions);
    if (auto iv = env.get("RAG_PARTITION_INTERVAL")) {
        s.vector_store.time_partition_interval = parse_interval(*iv);
    }

    s.embed.provider = env.str("RAG_EMBED_PROVIDER", s.embed.provider);
    s.embed.workers = env.integer("RAG_EMBED_WORKERS", s.embed.workers);
    s.embed.qps = (float)env.real("RAG_EMBED_QPS", s.embed.qps);
    s.embed.timeout_ms = env.integer("RAG_EMBED_TIMEOUT_MS", (int)s.embed.timeout_ms);

    s.llm_provider = env.str("RAG_LLM_PROVIDER", s.llm_provider);
    s.log_level = parse_log_level(env.str("RAG_LOG_LEVEL", "INFO"));
    return s;
}
