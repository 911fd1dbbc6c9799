#include "../include/errors.hpp"
#include "../include/llm_hub.hpp"
#include "../include/log.hpp"
#include "../include/rag.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>

using json = nlohmann::json;

static void usage() {
    std::cerr << "rag_cli usage:\n"
              << "  init\n"
              << "  index create|drop\n"
              << "  ingest --csv <file> [--delimiter ';'] [--reset] [--no-index]\n"
              << "  search --query \"...\" [--limit N] [--category C] [--where EXPR]... [--from T --to T]\n"
              << "  ask --question \"...\" [--limit N] [--category C] [--model M]\n"
              << "  delete (--ids a,b,... | --category C | --all)\n"
              << "global: [--env-file F] [--db <path>] [--table T] [--dims N] [--provider openai|ollama]\n"
              << "        [--embed-provider openai|ollama] [--timeout-ms N]\n"
              << "EXPR is field<op>value with op one of == != < <= > >= @>; T is ISO-8601 (UTC).\n";
}

struct Args {
    std::string cmd;
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> flags;

    bool has(const std::string& name) const {
        for (auto& f : flags) if (f.first == name) return true;
        return false;
    }
    std::string get(const std::string& name, const std::string& def = {}) const {
        for (auto it = flags.rbegin(); it != flags.rend(); ++it) if (it->first == name) return it->second;
        return def;
    }
    std::vector<std::string> all(const std::string& name) const {
        std::vector<std::string> out;
        for (auto& f : flags) if (f.first == name) out.push_back(f.second);
        return out;
    }
};

static Args parse_args(int argc, char** argv) {
    static const std::vector<std::string> switches = {"--reset", "--no-index", "--all"};
    Args a;
    a.cmd = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string s = argv[i];
        if (s.rfind("--", 0) != 0) { a.positional.push_back(s); continue; }
        bool is_switch = std::find(switches.begin(), switches.end(), s) != switches.end();
        if (is_switch) a.flags.emplace_back(s, "1");
        else if (i + 1 < argc) a.flags.emplace_back(s, argv[++i]);
        else throw InvalidArgument("missing value for " + s);
    }
    return a;
}

static int to_int(const std::string& flag, const std::string& v) {
    try { return std::stoi(v); }
    catch (const std::exception&) { throw InvalidArgument("bad number for " + flag + ": '" + v + "'"); }
}

static SearchOptions search_options(const Args& a, int default_limit) {
    SearchOptions o;
    o.limit = to_int("--limit", a.get("--limit", std::to_string(default_limit)));
    if (a.has("--category")) o.metadata_filter = json{{"category", a.get("--category")}};
    std::vector<Predicate> preds;
    for (const auto& w : a.all("--where")) preds.push_back(Predicate::parse(w));
    if (!preds.empty()) o.predicates = Predicate::all_of(std::move(preds));
    if (a.has("--from") || a.has("--to")) {
        if (!a.has("--from") || !a.has("--to")) throw InvalidArgument("--from and --to must be given together");
        o.time_range = TimeRange{parse_iso8601(a.get("--from")), parse_iso8601(a.get("--to"))};
    }
    return o;
}

static void print_results(const std::vector<SearchResult>& results) {
    int i = 1;
    for (const auto& r : results) {
        std::cout << "[" << i++ << "] distance=" << r.distance << " id=" << r.record.id.to_string()
                  << " metadata=" << r.record.metadata.dump() << "\n"
                  << r.record.content << "\n\n";
    }
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    try {
        Args a = parse_args(argc, argv);
        Settings settings = load_settings(a.get("--env-file", ".env"));
        if (a.has("--db")) settings.database.service_url = a.get("--db");
        if (a.has("--table")) settings.vector_store.table_name = a.get("--table");
        if (a.has("--dims")) settings.vector_store.embedding_dimensions = to_int("--dims", a.get("--dims"));
        if (a.has("--provider")) settings.llm_provider = a.get("--provider");
        if (a.has("--embed-provider")) settings.embed.provider = a.get("--embed-provider");
        set_log_level(settings.log_level);

        auto deadline = a.has("--timeout-ms")
            ? Deadline::after(std::chrono::milliseconds(to_int("--timeout-ms", a.get("--timeout-ms"))))
            : Deadline::none();

        std::shared_ptr<EmbeddingProvider> embedder = make_embedding_provider(settings);
        VectorStore store(settings.database, settings.vector_store, embedder);

        if (a.cmd == "init") {
            store.create_schema(deadline);
            std::cout << "[OK] Table " << store.table_name() << " ready\n";
            return 0;
        } else if (a.cmd == "index") {
            std::string what = a.positional.empty() ? "" : a.positional[0];
            if (what == "create") store.create_index(deadline);
            else if (what == "drop") store.drop_index(deadline);
            else { usage(); return 2; }
            std::cout << "[OK] index " << what << "\n";
            return 0;
        } else if (a.cmd == "ingest") {
            IngestOptions opts;
            opts.csv = a.get("--csv");
            if (opts.csv.empty()) { usage(); return 2; }
            auto delim = a.get("--delimiter", ";");
            opts.delimiter = delim.empty() ? ';' : delim[0];
            opts.reset = a.has("--reset");
            opts.create_index = !a.has("--no-index");
            int n = rag_ingest(store, *embedder, settings.embed, opts, deadline);
            std::cout << "[OK] Ingested records: " << n << "\n";
            return 0;
        } else if (a.cmd == "search") {
            std::string query = a.get("--query");
            if (query.empty()) { usage(); return 2; }
            print_results(store.search(query, search_options(a, 5), deadline));
            return 0;
        } else if (a.cmd == "ask") {
            std::string question = a.get("--question");
            if (question.empty()) { usage(); return 2; }
            LlmHub llm(make_llm_provider(settings.llm_provider, settings));
            CompletionParams params;
            if (a.has("--model")) params.model = a.get("--model");
            Responder responder(llm, params);
            auto res = rag_query(store, responder, question, search_options(a, 3), deadline);
            std::cout << "\n" << res.answer.answer << "\n\nThought process:\n";
            for (const auto& t : res.answer.thought_process) std::cout << "- " << t << "\n";
            std::cout << "\nContext: " << to_string(res.answer.enough_context) << "\n\n==== Sources ====\n";
            int i = 1;
            for (const auto& s : res.sources) {
                std::cout << "[" << i++ << "] " << s.record.metadata.value("category", std::string("?"))
                          << " (" << s.distance << ") " << s.record.id.to_string() << "\n";
            }
            return 0;
        } else if (a.cmd == "delete") {
            DeleteRequest req;
            if (a.has("--ids")) req.ids = split(a.get("--ids"), ',');
            if (a.has("--category")) req.metadata_filter = json{{"category", a.get("--category")}};
            req.delete_all = a.has("--all");
            auto n = store.delete_records(req, deadline);
            std::cout << "[OK] Deleted records: " << n << "\n";
            return 0;
        } else {
            usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
