#include "../include/store.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <set>

using json = nlohmann::json;

static constexpr std::int64_t kTicksPerSecond = 10000000;

namespace {
struct Stmt {
    sqlite3_stmt* st{nullptr};
    Stmt(sqlite3* db, const std::string& sql) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
            throw StoreError("prepare failed: " + std::string(sqlite3_errmsg(db)) + " [" + sql + "]");
        }
    }
    ~Stmt() { if (st) sqlite3_finalize(st); }
    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;
};

[[noreturn]] void throw_sqlite(sqlite3* db, int rc, const std::string& what) {
    if (rc == SQLITE_INTERRUPT) throw DeadlineExceeded(what + ": interrupted by deadline");
    throw StoreError(what + ": " + sqlite3_errmsg(db));
}

void exec_sql(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        if (rc == SQLITE_INTERRUPT) throw DeadlineExceeded("SQLite statement interrupted by deadline");
        throw StoreError("SQLite error: " + msg);
    }
}

int on_progress(void* p) {
    return static_cast<const Deadline*>(p)->expired() ? 1 : 0;
}

// Interrupts the running statement once the deadline passes or is cancelled.
struct ProgressGuard {
    sqlite3* db;
    ProgressGuard(sqlite3* db, const Deadline& dl) : db(db) {
        sqlite3_progress_handler(db, 1000, &on_progress, const_cast<Deadline*>(&dl));
    }
    ~ProgressGuard() { sqlite3_progress_handler(db, 0, nullptr, nullptr); }
};

// Rolls back unless commit() was reached.
struct Transaction {
    sqlite3* db;
    bool open{true};
    explicit Transaction(sqlite3* db, const char* begin = "BEGIN IMMEDIATE;") : db(db) { exec_sql(db, begin); }
    void commit() {
        exec_sql(db, "COMMIT;");
        open = false;
    }
    ~Transaction() {
        if (!open || sqlite3_get_autocommit(db)) return;
        char* err = nullptr;
        if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            RAG_ERROR("store", "rollback failed: " << (err ? err : "unknown"));
            sqlite3_free(err);
        }
    }
};
}

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_blob(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    sqlite3_bind_blob(st, idx, v.data(), (int)(v.size() * sizeof(float)), SQLITE_TRANSIENT);
}

static void bind_key(sqlite3_stmt* st, int idx, const TimeUuid::Bytes& k) {
    sqlite3_bind_blob(st, idx, k.data(), (int)k.size(), SQLITE_TRANSIENT);
}

static std::string column_string(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), (size_t)sqlite3_column_bytes(st, col)) : std::string();
}

static std::vector<float> column_floats(sqlite3_stmt* st, int col) {
    const void* blob = sqlite3_column_blob(st, col);
    int bytes = sqlite3_column_bytes(st, col);
    std::vector<float> vec(bytes / (int)sizeof(float));
    if (blob && !vec.empty()) std::memcpy(vec.data(), blob, vec.size() * sizeof(float));
    return vec;
}

static TimeUuid::Bytes column_key(sqlite3_stmt* st, int col) {
    TimeUuid::Bytes k{};
    const void* blob = sqlite3_column_blob(st, col);
    if (!blob || sqlite3_column_bytes(st, col) != (int)k.size()) throw StoreError("corrupt id_key column");
    std::memcpy(k.data(), blob, k.size());
    return k;
}

static json column_metadata(sqlite3_stmt* st, int col) {
    auto md = json::parse(column_string(st, col), nullptr, false);
    if (md.is_discarded()) throw StoreError("corrupt metadata column");
    return md;
}

// Columns: id, metadata, contents, embedding.
static Record read_record(sqlite3_stmt* st, int first) {
    Record r;
    r.id = TimeUuid::parse(column_string(st, first));
    r.metadata = column_metadata(st, first + 1);
    r.content = column_string(st, first + 2);
    r.embedding = column_floats(st, first + 3);
    return r;
}

static bool valid_identifier(const std::string& name) {
    if (name.empty() || name.size() > 63) return false;
    if (!(std::isalpha((unsigned char)name[0]) || name[0] == '_')) return false;
    return std::all_of(name.begin(), name.end(), [](char c){ return std::isalnum((unsigned char)c) || c == '_'; });
}

static long long meta_int(const std::string& key, const std::string& value) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        throw SchemaError("table metadata '" + key + "' is not a number: '" + value + "'");
    }
}

static bool accepts(const SearchRequest& req, const json& metadata) {
    if (req.metadata_filter && !metadata_matches(metadata, *req.metadata_filter)) return false;
    if (req.predicates && !req.predicates->matches(metadata)) return false;
    return true;
}

static bool closer(const SearchResult& a, const SearchResult& b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    return a.record.id < b.record.id;
}

std::string sqlite_path_from_url(const std::string& service_url) {
    const std::string& u = service_url;
    if (u.rfind("sqlite:///", 0) == 0) return u.substr(9);
    if (u.rfind("sqlite://", 0) == 0) return u.substr(9);
    if (u.rfind("sqlite:", 0) == 0) return u.substr(7);
    if (u.rfind("file:", 0) == 0) return u.substr(5);
    if (u.find("://") != std::string::npos) {
        throw InvalidArgument("unsupported service url (expected a SQLite path): " + u);
    }
    if (u.empty()) throw InvalidArgument("empty service url");
    return u;
}

VectorStore::VectorStore(const DatabaseSettings& db, const VectorStoreSettings& table,
                         std::shared_ptr<EmbeddingProvider> embedder, IvfOptions ivf)
    : table_(table.table_name),
      meta_table_(table.table_name + "_meta"),
      dims_(table.embedding_dimensions),
      interval_(table.time_partition_interval),
      embedder_(std::move(embedder)),
      ivf_opts_(ivf) {
    if (!valid_identifier(table_)) throw InvalidArgument("invalid table name: '" + table_ + "'");
    if (dims_ <= 0) throw InvalidArgument("embedding dimensions must be positive");
    if (interval_.count() <= 0) throw InvalidArgument("time partition interval must be positive");
    if (embedder_ && embedder_->dimensions() != dims_) {
        throw InvalidArgument("embedding provider produces " + std::to_string(embedder_->dimensions()) +
                              " dimensions but the table is configured for " + std::to_string(dims_));
    }

    auto path = sqlite_path_from_url(db.service_url);
    if (path != ":memory:") {
        auto parent = std::filesystem::path(path).parent_path();
        std::error_code ec;
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    }
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open SQLite DB: " + path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    if (path != ":memory:") exec("PRAGMA journal_mode=WAL;");
}

VectorStore::~VectorStore() {
    if (db_) sqlite3_close(db_);
}

void VectorStore::exec(const std::string& sql) {
    exec_sql(db_, sql);
}

bool VectorStore::table_exists(const std::string& name) {
    Stmt st(db_, "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?;");
    bind_text(st.st, 1, name);
    int rc = sqlite3_step(st.st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite(db_, rc, "table lookup");
}

std::optional<std::string> VectorStore::read_meta(const std::string& key) {
    Stmt st(db_, "SELECT value FROM " + meta_table_ + " WHERE key=?;");
    bind_text(st.st, 1, key);
    int rc = sqlite3_step(st.st);
    if (rc == SQLITE_ROW) return column_string(st.st, 0);
    if (rc == SQLITE_DONE) return std::nullopt;
    throw_sqlite(db_, rc, "read table metadata");
}

void VectorStore::write_meta(const std::string& key, const std::string& value) {
    Stmt st(db_, "INSERT OR REPLACE INTO " + meta_table_ + " (key, value) VALUES (?, ?);");
    bind_text(st.st, 1, key);
    bind_text(st.st, 2, value);
    int rc = sqlite3_step(st.st);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "write table metadata");
}

// Bumped inside every transaction that changes rows, by any handle.
std::int64_t VectorStore::write_generation() {
    auto stored = read_meta("write_generation");
    return stored ? meta_int("write_generation", *stored) : 0;
}

std::int64_t VectorStore::bump_write_generation() {
    auto next = write_generation() + 1;
    write_meta("write_generation", std::to_string(next));
    return next;
}

void VectorStore::delete_meta(const std::string& key) {
    Stmt st(db_, "DELETE FROM " + meta_table_ + " WHERE key=?;");
    bind_text(st.st, 1, key);
    int rc = sqlite3_step(st.st);
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "delete table metadata");
}

std::int64_t VectorStore::partition_of(const TimeUuid& id) const {
    return static_cast<std::int64_t>(id.ticks() / (std::uint64_t)(interval_.count() * kTicksPerSecond));
}

void VectorStore::create_schema(const Deadline& deadline) {
    std::lock_guard<std::mutex> lock(mtx_);
    deadline.check("create_schema");
    Transaction tx(db_);
    ProgressGuard pg(db_, deadline);

    if (table_exists(table_)) {
        std::set<std::string> cols;
        Stmt info(db_, "PRAGMA table_info(" + table_ + ");");
        int rc;
        while ((rc = sqlite3_step(info.st)) == SQLITE_ROW) cols.insert(column_string(info.st, 1));
        if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "table_info");
        for (const char* c : {"partition_key", "id_key", "id", "metadata", "contents", "embedding"}) {
            if (!cols.count(c)) {
                throw SchemaError("existing table '" + table_ + "' has no column '" + c + "'");
            }
        }
    }

    exec("CREATE TABLE IF NOT EXISTS " + table_ + " (\n"
         "  partition_key INTEGER NOT NULL,\n"
         "  id_key BLOB NOT NULL,\n"
         "  id TEXT NOT NULL,\n"
         "  metadata TEXT NOT NULL,\n"
         "  contents TEXT NOT NULL,\n"
         "  embedding BLOB NOT NULL,\n"
         "  PRIMARY KEY (partition_key, id_key)\n"
         ") WITHOUT ROWID;");
    exec("CREATE TABLE IF NOT EXISTS " + meta_table_ + " (key TEXT PRIMARY KEY, value TEXT NOT NULL);");

    if (auto stored = read_meta("embedding_dimensions")) {
        if (meta_int("embedding_dimensions", *stored) != dims_) {
            throw SchemaError("table '" + table_ + "' stores " + *stored + "-dimensional embeddings, configured for " +
                              std::to_string(dims_));
        }
    } else {
        Stmt sample(db_, "SELECT length(embedding) FROM " + table_ + " LIMIT 1;");
        int rc = sqlite3_step(sample.st);
        if (rc == SQLITE_ROW) {
            auto bytes = sqlite3_column_int64(sample.st, 0);
            if (bytes != (sqlite3_int64)(dims_ * sizeof(float))) {
                throw SchemaError("table '" + table_ + "' holds " + std::to_string(bytes / sizeof(float)) +
                                  "-dimensional embeddings, configured for " + std::to_string(dims_));
            }
        } else if (rc != SQLITE_DONE) {
            throw_sqlite(db_, rc, "sample embedding");
        }
        write_meta("embedding_dimensions", std::to_string(dims_));
    }

    if (auto stored = read_meta("time_partition_interval")) {
        if (meta_int("time_partition_interval", *stored) != interval_.count()) {
            throw SchemaError("table '" + table_ + "' is partitioned every " + *stored + "s, configured for " +
                              std::to_string(interval_.count()) + "s");
        }
    } else {
        write_meta("time_partition_interval", std::to_string(interval_.count()));
    }

    tx.commit();
    RAG_INFO("store", "schema ready: table=" << table_ << " dims=" << dims_ << " partition=" << interval_.count() << "s");
}

std::vector<IndexEntry> VectorStore::load_index_entries(const Deadline& deadline) {
    std::vector<IndexEntry> entries;
    Stmt st(db_, "SELECT partition_key, id_key, embedding FROM " + table_ + ";");
    int rc;
    while ((rc = sqlite3_step(st.st)) == SQLITE_ROW) {
        IndexEntry e;
        e.partition = sqlite3_column_int64(st.st, 0);
        e.key = column_key(st.st, 1);
        e.embedding = column_floats(st.st, 2);
        entries.push_back(std::move(e));
    }
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "load index entries");
    deadline.check("load index entries");
    return entries;
}

void VectorStore::create_index(const Deadline& deadline) {
    std::lock_guard<std::mutex> lock(mtx_);
    deadline.check("create_index");
    auto idx = make_ann_index("ivf", ivf_opts_);
    {
        Transaction tx(db_);
        ProgressGuard pg(db_, deadline);
        if (read_meta("index_kind")) {
            throw IndexAlreadyExists("table '" + table_ + "' already has an embedding index");
        }
        idx->build(load_index_entries(deadline));
        write_meta("index_kind", idx->kind());
        index_generation_ = write_generation();
        tx.commit();
    }
    RAG_INFO("store", "created " << idx->kind() << " index over " << idx->size() << " embeddings ("
                                 << idx->probe_units() << " lists)");
    index_ = std::move(idx);
}

void VectorStore::drop_index(const Deadline& deadline) {
    std::lock_guard<std::mutex> lock(mtx_);
    deadline.check("drop_index");
    {
        Transaction tx(db_);
        ProgressGuard pg(db_, deadline);
        if (!read_meta("index_kind")) {
            index_.reset();
            return;
        }
        delete_meta("index_kind");
        tx.commit();
    }
    RAG_INFO("store", "dropped embedding index on " << table_);
    index_.reset();
}

bool VectorStore::has_index() {
    std::lock_guard<std::mutex> lock(mtx_);
    return table_exists(meta_table_) && read_meta("index_kind").has_value();
}

// Follows index changes and row writes made through other handles: the
// in-memory index is rebuilt whenever the stored write generation moved
// past the one it was built at.
void VectorStore::sync_index(const Deadline& deadline) {
    std::optional<std::string> kind;
    if (table_exists(meta_table_)) kind = read_meta("index_kind");
    if (!kind) {
        index_.reset();
        return;
    }
    auto generation = write_generation();
    if (index_ && index_->kind() == *kind && index_generation_ == generation) return;
    auto idx = make_ann_index(*kind, ivf_opts_);
    idx->build(load_index_entries(deadline));
    RAG_INFO("store", "rebuilt " << idx->kind() << " index over " << idx->size() << " embeddings at generation "
                                 << generation);
    index_ = std::move(idx);
    index_generation_ = generation;
}

void VectorStore::upsert(const std::vector<Record>& records, const Deadline& deadline) {
    write_records(records, false, deadline);
}

void VectorStore::replace_all(const std::vector<Record>& records, const Deadline& deadline) {
    write_records(records, true, deadline);
}

void VectorStore::write_records(const std::vector<Record>& records, bool clear_first, const Deadline& deadline) {
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& r = records[i];
        if ((r.id.bytes()[6] >> 4) != 1) {
            throw ValidationError("record " + std::to_string(i) + " has no time-based id");
        }
        if ((int)r.embedding.size() != dims_) {
            throw ValidationError("record " + r.id.to_string() + ": embedding has " + std::to_string(r.embedding.size()) +
                                  " dimensions, table expects " + std::to_string(dims_));
        }
        if (!std::all_of(r.embedding.begin(), r.embedding.end(), [](float x){ return std::isfinite(x); })) {
            throw ValidationError("record " + r.id.to_string() + ": embedding contains a non-finite value");
        }
        if (r.content.empty()) {
            throw ValidationError("record " + r.id.to_string() + ": content is empty");
        }
        if (!r.metadata.is_object() && !r.metadata.is_null()) {
            throw ValidationError("record " + r.id.to_string() + ": metadata must be an object");
        }
    }
    if (records.empty() && !clear_first) return;

    std::lock_guard<std::mutex> lock(mtx_);
    deadline.check("upsert");
    bool index_current = false;
    std::size_t cleared = 0;
    {
        Transaction tx(db_);
        ProgressGuard pg(db_, deadline);
        if (clear_first) {
            exec("DELETE FROM " + table_ + ";");
            cleared = (std::size_t)sqlite3_changes(db_);
        }
        Stmt ins(db_, "INSERT OR REPLACE INTO " + table_ +
                      " (partition_key, id_key, id, metadata, contents, embedding) VALUES (?, ?, ?, ?, ?, ?);");
        for (const auto& r : records) {
            sqlite3_reset(ins.st);
            sqlite3_clear_bindings(ins.st);
            sqlite3_bind_int64(ins.st, 1, partition_of(r.id));
            bind_key(ins.st, 2, r.id.key());
            bind_text(ins.st, 3, r.id.to_string());
            bind_text(ins.st, 4, r.metadata.is_null() ? std::string("{}") : r.metadata.dump());
            bind_text(ins.st, 5, r.content);
            bind_blob(ins.st, 6, r.embedding);
            int rc = sqlite3_step(ins.st);
            if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "upsert " + r.id.to_string());
        }
        index_current = index_ && index_generation_ == write_generation();
        auto generation = bump_write_generation();
        deadline.check("upsert");
        tx.commit();
        if (index_current) index_generation_ = generation;
    }
    if (index_current) {
        if (clear_first) index_->clear();
        for (const auto& r : records) index_->insert(IndexEntry{partition_of(r.id), r.id.key(), r.embedding});
    }
    if (clear_first) {
        RAG_INFO("store", "replaced " << cleared << " records in " << table_ << " with " << records.size());
    } else {
        RAG_INFO("store", "upserted " << records.size() << " records into " << table_);
    }
}

std::vector<SearchResult> VectorStore::scan(const SearchRequest& req, const Deadline& deadline) {
    std::string sql = "SELECT id, metadata, contents, embedding FROM " + table_;
    if (req.time_range) sql += " WHERE partition_key BETWEEN ? AND ? AND id_key BETWEEN ? AND ?";
    sql += ";";
    Stmt st(db_, sql);
    if (req.time_range) {
        auto lo = TimeUuid::min_for(req.time_range->start);
        auto hi = TimeUuid::max_for(req.time_range->end);
        sqlite3_bind_int64(st.st, 1, partition_of(lo));
        sqlite3_bind_int64(st.st, 2, partition_of(hi));
        bind_key(st.st, 3, lo.key());
        bind_key(st.st, 4, hi.key());
    }
    std::vector<SearchResult> out;
    int rc;
    while ((rc = sqlite3_step(st.st)) == SQLITE_ROW) {
        auto metadata = column_metadata(st.st, 1);
        if (!accepts(req, metadata)) continue;
        SearchResult sr;
        sr.record = read_record(st.st, 0);
        sr.distance = cosine_distance(req.query_embedding, sr.record.embedding);
        out.push_back(std::move(sr));
    }
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "search");
    deadline.check("search");
    return out;
}

std::vector<SearchResult> VectorStore::probe_index(const SearchRequest& req, const Deadline& deadline) {
    std::optional<TimeUuid::Bytes> lo, hi;
    if (req.time_range) {
        lo = TimeUuid::min_for(req.time_range->start).key();
        hi = TimeUuid::max_for(req.time_range->end).key();
    }
    Stmt get(db_, "SELECT id, metadata, contents, embedding FROM " + table_ + " WHERE partition_key=? AND id_key=?;");
    std::set<TimeUuid::Bytes> seen;
    std::vector<SearchResult> out;
    const std::size_t units = index_->probe_units();
    std::size_t nprobe = std::max<std::size_t>(1, std::min(ivf_opts_.nprobe, units));
    std::size_t examined = 0;
    while (units > 0) {
        for (const auto& ref : index_->probe(req.query_embedding, nprobe)) {
            if (!seen.insert(ref.key).second) continue;
            if (lo && (ref.key < *lo || ref.key > *hi)) continue;
            sqlite3_reset(get.st);
            sqlite3_bind_int64(get.st, 1, ref.partition);
            bind_key(get.st, 2, ref.key);
            int rc = sqlite3_step(get.st);
            if (rc == SQLITE_DONE) continue;
            if (rc != SQLITE_ROW) throw_sqlite(db_, rc, "search");
            ++examined;
            auto metadata = column_metadata(get.st, 1);
            if (!accepts(req, metadata)) continue;
            SearchResult sr;
            sr.record = read_record(get.st, 0);
            sr.distance = cosine_distance(req.query_embedding, sr.record.embedding);
            out.push_back(std::move(sr));
        }
        deadline.check("search");
        // Widen until enough rows survive the filters or every list was probed.
        if ((int)out.size() >= req.limit || nprobe >= units) break;
        nprobe = std::min(units, nprobe * 2);
    }
    RAG_DEBUG("store", "index probe examined " << examined << " rows, nprobe=" << nprobe << "/" << units);
    return out;
}

std::vector<SearchResult> VectorStore::search(const SearchRequest& req, const Deadline& deadline) {
    if (req.limit <= 0) throw InvalidArgument("search limit must be positive, got " + std::to_string(req.limit));
    if ((int)req.query_embedding.size() != dims_) {
        throw InvalidArgument("query embedding has " + std::to_string(req.query_embedding.size()) +
                              " dimensions, table expects " + std::to_string(dims_));
    }
    if (req.time_range && req.time_range->start > req.time_range->end) {
        throw InvalidArgument("time range start is after its end");
    }

    std::lock_guard<std::mutex> lock(mtx_);
    deadline.check("search");
    ProgressGuard pg(db_, deadline);
    std::vector<SearchResult> results;
    {
        // One read snapshot for the generation check, the index rebuild and the row reads.
        Transaction snapshot(db_, "BEGIN;");
        sync_index(deadline);
        results = index_ ? probe_index(req, deadline) : scan(req, deadline);
        snapshot.commit();
    }

    std::size_t keep = std::min<std::size_t>((std::size_t)req.limit, results.size());
    std::partial_sort(results.begin(), results.begin() + keep, results.end(), closer);
    results.resize(keep);
    RAG_DEBUG("store", "search returned " << results.size() << " of limit " << req.limit);
    return results;
}

std::vector<float> VectorStore::get_embedding(const std::string& text, const Deadline& deadline) {
    if (!embedder_) throw InvalidArgument("no embedding provider configured for this store");
    return embedder_->embed(text, deadline);
}

std::vector<SearchResult> VectorStore::search(const std::string& query_text, const SearchOptions& options,
                                              const Deadline& deadline) {
    auto builder = QueryBuilder::from_options(options);
    return search(builder.build(get_embedding(query_text, deadline)), deadline);
}

std::size_t VectorStore::delete_records(const DeleteRequest& req, const Deadline& deadline) {
    bool by_ids = !req.ids.empty();
    bool by_filter = req.metadata_filter && !filter_is_empty(*req.metadata_filter);
    int selectors = (int)by_ids + (int)by_filter + (int)req.delete_all;
    if (selectors != 1) {
        throw InvalidArgument("exactly one of ids, metadata_filter or delete_all must be given (got " +
                              std::to_string(selectors) + ")");
    }

    std::vector<TimeUuid> ids;
    for (const auto& s : req.ids) ids.push_back(TimeUuid::parse(s));
    if (by_filter) {
        // Reuses the search-side shape check.
        QueryBuilder(1).metadata_filter(*req.metadata_filter);
    }

    std::lock_guard<std::mutex> lock(mtx_);
    deadline.check("delete");
    std::vector<TimeUuid::Bytes> removed_keys;
    std::size_t removed = 0;
    bool index_current = false;
    {
        Transaction tx(db_);
        ProgressGuard pg(db_, deadline);
        if (req.delete_all) {
            exec("DELETE FROM " + table_ + ";");
            removed = (std::size_t)sqlite3_changes(db_);
        } else {
            std::vector<std::pair<std::int64_t, TimeUuid::Bytes>> targets;
            if (by_ids) {
                for (const auto& id : ids) targets.emplace_back(partition_of(id), id.key());
            } else {
                Stmt sel(db_, "SELECT partition_key, id_key, metadata FROM " + table_ + ";");
                int rc;
                while ((rc = sqlite3_step(sel.st)) == SQLITE_ROW) {
                    if (metadata_matches(column_metadata(sel.st, 2), *req.metadata_filter)) {
                        targets.emplace_back(sqlite3_column_int64(sel.st, 0), column_key(sel.st, 1));
                    }
                }
                if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "delete scan");
            }
            Stmt del(db_, "DELETE FROM " + table_ + " WHERE partition_key=? AND id_key=?;");
            for (const auto& t : targets) {
                sqlite3_reset(del.st);
                sqlite3_bind_int64(del.st, 1, t.first);
                bind_key(del.st, 2, t.second);
                int rc = sqlite3_step(del.st);
                if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "delete");
                if (sqlite3_changes(db_) > 0) {
                    ++removed;
                    removed_keys.push_back(t.second);
                }
            }
        }
        index_current = index_ && index_generation_ == write_generation();
        auto generation = bump_write_generation();
        deadline.check("delete");
        tx.commit();
        if (index_current) index_generation_ = generation;
    }

    if (index_current) {
        if (req.delete_all) index_->clear();
        else for (const auto& k : removed_keys) index_->erase(k);
    }
    const char* how = req.delete_all ? "delete_all" : by_ids ? "ids" : "metadata_filter";
    RAG_INFO("store", "deleted " << removed << " records from " << table_ << " by " << how);
    return removed;
}

std::size_t VectorStore::delete_by_ids(const std::vector<std::string>& ids, const Deadline& deadline) {
    DeleteRequest req;
    req.ids = ids;
    return delete_records(req, deadline);
}

std::size_t VectorStore::delete_by_metadata(const json& filter, const Deadline& deadline) {
    DeleteRequest req;
    req.metadata_filter = filter;
    return delete_records(req, deadline);
}

std::size_t VectorStore::delete_all(const Deadline& deadline) {
    DeleteRequest req;
    req.delete_all = true;
    return delete_records(req, deadline);
}

std::size_t VectorStore::count(const Deadline& deadline) {
    std::lock_guard<std::mutex> lock(mtx_);
    deadline.check("count");
    Stmt st(db_, "SELECT COUNT(*) FROM " + table_ + ";");
    int rc = sqlite3_step(st.st);
    if (rc != SQLITE_ROW) throw_sqlite(db_, rc, "count");
    return (std::size_t)sqlite3_column_int64(st.st, 0);
}

std::map<std::int64_t, std::size_t> VectorStore::partitions(const Deadline& deadline) {
    std::lock_guard<std::mutex> lock(mtx_);
    deadline.check("partitions");
    std::map<std::int64_t, std::size_t> out;
    Stmt st(db_, "SELECT partition_key, COUNT(*) FROM " + table_ + " GROUP BY partition_key ORDER BY partition_key;");
    int rc;
    while ((rc = sqlite3_step(st.st)) == SQLITE_ROW) {
        out[sqlite3_column_int64(st.st, 0)] = (std::size_t)sqlite3_column_int64(st.st, 1);
    }
    if (rc != SQLITE_DONE) throw_sqlite(db_, rc, "partitions");
    return out;
}
