#pragma once
#include "deadline.hpp"
#include "embedding.hpp"
#include "responder.hpp"
#include "settings.hpp"
#include "store.hpp"
#include "time_uuid.hpp"
#include <filesystem>
#include <string>
#include <vector>

struct FaqRow {
    std::string question;
    std::string answer;
    std::string category;
};

// Header row names the columns; "question", "answer" and "category" are required.
std::vector<FaqRow> load_faq_csv(const std::filesystem::path& path, char delimiter = ';');

// content "Question: ...\nAnswer: ...", metadata {category, created_at}, time-ordered id.
std::vector<Record> prepare_records(const std::vector<FaqRow>& rows, EmbeddingProvider& embedder,
                                    TimeUuidGenerator& ids, const EmbedSettings& embed,
                                    const Deadline& deadline = Deadline::none());

struct IngestOptions {
    std::filesystem::path csv;
    char delimiter{';'};
    bool reset{false};
    bool create_index{true};
};

// Creates the schema, writes the rows (with `reset`, clearing and loading
// happen in one transaction) and then rebuilds the index. Returns the number
// of records written.
int rag_ingest(VectorStore& store, EmbeddingProvider& embedder, const EmbedSettings& embed,
               const IngestOptions& opts, const Deadline& deadline = Deadline::none());

struct QueryResult {
    SynthesizedAnswer answer;
    std::vector<SearchResult> sources;
};

QueryResult rag_query(VectorStore& store, Responder& responder, const std::string& question,
                      const SearchOptions& options, const Deadline& deadline = Deadline::none());
