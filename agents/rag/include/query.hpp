#pragma once
#include "predicate.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

struct TimeRange {
    std::chrono::system_clock::time_point start;
    std::chrono::system_clock::time_point end; // inclusive
};

struct SearchRequest {
    std::vector<float> query_embedding;
    int limit{5};
    std::optional<nlohmann::json> metadata_filter; // object, or array of objects (any-of)
    std::optional<Predicate> predicates;
    std::optional<TimeRange> time_range;
};

// Every field except `limit` is optional; unset fields impose no constraint.
struct SearchOptions {
    int limit{5};
    std::optional<nlohmann::json> metadata_filter;
    std::optional<Predicate> predicates;
    std::optional<TimeRange> time_range;
};

class QueryBuilder {
public:
    explicit QueryBuilder(int limit); // throws InvalidArgument when limit <= 0

    static QueryBuilder from_options(const SearchOptions& opts);

    QueryBuilder& metadata_filter(nlohmann::json filter);
    QueryBuilder& predicates(Predicate p);
    QueryBuilder& time_range(std::chrono::system_clock::time_point start,
                             std::chrono::system_clock::time_point end);

    SearchRequest build(std::vector<float> query_embedding) const;

private:
    SearchRequest req_;
};

// AND of equalities for an object filter, OR across the objects of an array.
bool metadata_matches(const nlohmann::json& metadata, const nlohmann::json& filter);

// True when `filter` constrains nothing (null, {} or []).
bool filter_is_empty(const nlohmann::json& filter);
