#include "../include/rag.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <chrono>

using json = nlohmann::json;

std::vector<FaqRow> load_faq_csv(const std::filesystem::path& path, char delimiter) {
    auto rows = parse_csv(read_text_file(path), delimiter);
    if (rows.empty()) return {};

    int q = -1, a = -1, c = -1;
    for (size_t i = 0; i < rows[0].size(); ++i) {
        auto name = to_lower(trim(rows[0][i]));
        if (name == "question") q = (int)i;
        else if (name == "answer") a = (int)i;
        else if (name == "category") c = (int)i;
    }
    if (q < 0 || a < 0 || c < 0) {
        throw InvalidArgument(path.string() + ": header must name question, answer and category columns");
    }
    int needed = std::max(q, std::max(a, c)) + 1;

    std::vector<FaqRow> out;
    for (size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        if ((int)row.size() < needed) {
            throw InvalidArgument(path.string() + ": row " + std::to_string(r + 1) + " has " +
                                  std::to_string(row.size()) + " fields, expected " + std::to_string(needed));
        }
        out.push_back(FaqRow{trim(row[q]), trim(row[a]), trim(row[c])});
    }
    return out;
}

std::vector<Record> prepare_records(const std::vector<FaqRow>& rows, EmbeddingProvider& embedder,
                                    TimeUuidGenerator& ids, const EmbedSettings& embed, const Deadline& deadline) {
    std::vector<std::string> contents;
    contents.reserve(rows.size());
    for (const auto& row : rows) contents.push_back("Question: " + row.question + "\nAnswer: " + row.answer);

    auto vectors = embedder.embed_batch(contents, embed.workers, embed.qps, deadline);

    std::vector<Record> records;
    records.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        Record r;
        r.id = ids.next();
        r.metadata = json{
            {"category", rows[i].category},
            {"created_at", format_iso8601(r.id.time())}
        };
        r.content = std::move(contents[i]);
        r.embedding = std::move(vectors[i]);
        records.push_back(std::move(r));
    }
    return records;
}

int rag_ingest(VectorStore& store, EmbeddingProvider& embedder, const EmbedSettings& embed,
               const IngestOptions& opts, const Deadline& deadline) {
    auto rows = load_faq_csv(opts.csv, opts.delimiter);
    RAG_INFO("ingest", "loaded " << rows.size() << " rows from " << opts.csv.string());

    TimeUuidGenerator ids;
    auto records = prepare_records(rows, embedder, ids, embed, deadline);

    store.create_schema(deadline);
    if (opts.reset) store.replace_all(records, deadline);
    else store.upsert(records, deadline);
    // The index is rebuilt once over the loaded rows.
    store.drop_index(deadline);
    if (opts.create_index) store.create_index(deadline);
    return (int)records.size();
}

QueryResult rag_query(VectorStore& store, Responder& responder, const std::string& question,
                      const SearchOptions& options, const Deadline& deadline) {
    QueryResult res;
    res.sources = store.search(question, options, deadline);
    res.answer = responder.generate_response(question, res.sources, deadline);
    return res;
}
