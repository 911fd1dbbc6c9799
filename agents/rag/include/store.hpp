#pragma once
#include "ann_index.hpp"
#include "deadline.hpp"
#include "embedding.hpp"
#include "query.hpp"
#include "settings.hpp"
#include "time_uuid.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct Record {
    TimeUuid id;
    nlohmann::json metadata = nlohmann::json::object();
    std::string content;
    std::vector<float> embedding;
};

struct SearchResult {
    Record record;
    double distance{0.0}; // cosine distance, smaller is closer
};

// Exactly one selector must be set. An empty id list or an empty filter
// counts as not set.
struct DeleteRequest {
    std::vector<std::string> ids;
    std::optional<nlohmann::json> metadata_filter;
    bool delete_all{false};
};

// Accepts "sqlite:///abs/path", "sqlite://rel/path", "file:path", a bare path or ":memory:".
std::string sqlite_path_from_url(const std::string& service_url);

// Records in one SQLite table, clustered by (time partition, time-ordered id).
// One connection per store, serialised by an internal mutex, so a store can
// be shared between threads. Writes commit atomically and are visible to the
// next read on any store opened on the same file; an index held in memory is
// rebuilt on the next search when another handle wrote to the table.
class VectorStore {
public:
    VectorStore(const DatabaseSettings& db, const VectorStoreSettings& table,
                std::shared_ptr<EmbeddingProvider> embedder = nullptr, IvfOptions ivf = {});
    ~VectorStore();

    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    const std::string& table_name() const { return table_; }
    int dimensions() const { return dims_; }
    std::chrono::seconds partition_interval() const { return interval_; }

    // Idempotent. SchemaError when an existing table disagrees on dimensions,
    // partition interval or columns.
    void create_schema(const Deadline& deadline = Deadline::none());

    // IndexAlreadyExists when an index is already present.
    void create_index(const Deadline& deadline = Deadline::none());
    // No-op without an index.
    void drop_index(const Deadline& deadline = Deadline::none());
    bool has_index();

    // Insert-or-replace by id, all or nothing.
    void upsert(const std::vector<Record>& records, const Deadline& deadline = Deadline::none());
    // Empties the table and loads `records` in one transaction.
    void replace_all(const std::vector<Record>& records, const Deadline& deadline = Deadline::none());

    // Ascending distance, ties broken by ascending id.
    std::vector<SearchResult> search(const SearchRequest& request, const Deadline& deadline = Deadline::none());
    std::vector<SearchResult> search(const std::string& query_text, const SearchOptions& options,
                                     const Deadline& deadline = Deadline::none());

    std::vector<float> get_embedding(const std::string& text, const Deadline& deadline = Deadline::none());

    // Returns the number of records removed.
    std::size_t delete_records(const DeleteRequest& request, const Deadline& deadline = Deadline::none());
    std::size_t delete_by_ids(const std::vector<std::string>& ids, const Deadline& deadline = Deadline::none());
    std::size_t delete_by_metadata(const nlohmann::json& filter, const Deadline& deadline = Deadline::none());
    std::size_t delete_all(const Deadline& deadline = Deadline::none());

    std::size_t count(const Deadline& deadline = Deadline::none());
    // Partition key -> record count.
    std::map<std::int64_t, std::size_t> partitions(const Deadline& deadline = Deadline::none());

    std::int64_t partition_of(const TimeUuid& id) const;

private:
    void exec(const std::string& sql);
    bool table_exists(const std::string& name);
    std::optional<std::string> read_meta(const std::string& key);
    void write_meta(const std::string& key, const std::string& value);
    void delete_meta(const std::string& key);
    void write_records(const std::vector<Record>& records, bool clear_first, const Deadline& deadline);
    std::int64_t write_generation();
    std::int64_t bump_write_generation();
    void sync_index(const Deadline& deadline);
    std::vector<IndexEntry> load_index_entries(const Deadline& deadline);
    std::vector<SearchResult> scan(const SearchRequest& request, const Deadline& deadline);
    std::vector<SearchResult> probe_index(const SearchRequest& request, const Deadline& deadline);

    struct sqlite3* db_ {nullptr};
    std::mutex mtx_;
    std::string table_;
    std::string meta_table_;
    int dims_;
    std::chrono::seconds interval_;
    std::shared_ptr<EmbeddingProvider> embedder_;
    IvfOptions ivf_opts_;

    std::unique_ptr<AnnIndex> index_;
    std::int64_t index_generation_{0};
};
