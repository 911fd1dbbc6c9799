#include "../include/query.hpp"
#include "../include/errors.hpp"
#include <algorithm>
#include <utility>

using json = nlohmann::json;

QueryBuilder::QueryBuilder(int limit) {
    if (limit <= 0) throw InvalidArgument("search limit must be positive, got " + std::to_string(limit));
    req_.limit = limit;
}

QueryBuilder QueryBuilder::from_options(const SearchOptions& opts) {
    QueryBuilder qb(opts.limit);
    if (opts.metadata_filter) qb.metadata_filter(*opts.metadata_filter);
    if (opts.predicates) qb.predicates(*opts.predicates);
    if (opts.time_range) qb.time_range(opts.time_range->start, opts.time_range->end);
    return qb;
}

QueryBuilder& QueryBuilder::metadata_filter(json filter) {
    if (filter_is_empty(filter)) {
        req_.metadata_filter.reset();
        return *this;
    }
    bool ok = filter.is_object() ||
              (filter.is_array() && std::all_of(filter.begin(), filter.end(), [](const json& f){ return f.is_object(); }));
    if (!ok) throw InvalidArgument("metadata filter must be an object or an array of objects");
    req_.metadata_filter = std::move(filter);
    return *this;
}

QueryBuilder& QueryBuilder::predicates(Predicate p) {
    req_.predicates = std::move(p);
    return *this;
}

QueryBuilder& QueryBuilder::time_range(std::chrono::system_clock::time_point start,
                                       std::chrono::system_clock::time_point end) {
    if (start > end) throw InvalidArgument("time range start is after its end");
    req_.time_range = TimeRange{start, end};
    return *this;
}

SearchRequest QueryBuilder::build(std::vector<float> query_embedding) const {
    SearchRequest out = req_;
    out.query_embedding = std::move(query_embedding);
    return out;
}

bool filter_is_empty(const json& filter) {
    return filter.is_null() || ((filter.is_object() || filter.is_array()) && filter.empty());
}

bool metadata_matches(const json& metadata, const json& filter) {
    if (filter_is_empty(filter)) return true;
    if (filter.is_array()) {
        return std::any_of(filter.begin(), filter.end(), [&](const json& f){ return metadata_matches(metadata, f); });
    }
    if (!metadata.is_object()) return false;
    for (auto it = filter.begin(); it != filter.end(); ++it) {
        auto m = metadata.find(it.key());
        if (m == metadata.end() || *m != it.value()) return false;
    }
    return true;
}
