#pragma once
#include "time_uuid.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct IndexEntry {
    std::int64_t partition{0};
    TimeUuid::Bytes key{};
    std::vector<float> embedding;
};

struct IndexRef {
    std::int64_t partition{0};
    TimeUuid::Bytes key{};
};

// Approximate candidate generator over stored embeddings. Callers re-rank
// candidates exactly; an index only narrows which rows are looked at.
class AnnIndex {
public:
    virtual ~AnnIndex() = default;

    virtual std::string kind() const = 0;
    virtual void build(const std::vector<IndexEntry>& entries) = 0;
    virtual void insert(const IndexEntry& entry) = 0; // replaces an entry with the same key
    virtual void erase(const TimeUuid::Bytes& key) = 0;
    virtual void clear() = 0;
    virtual std::size_t size() const = 0;

    // Number of probe units; probing `probe_units()` of them is exhaustive.
    virtual std::size_t probe_units() const = 0;
    virtual std::vector<IndexRef> probe(const std::vector<float>& query, std::size_t nprobe) const = 0;
};

struct IvfOptions {
    std::size_t max_lists{1024};
    std::size_t nprobe{8};
    std::size_t train_iterations{10};
};

// Inverted file index: k-means centroids (cosine), one posting list per centroid.
class IvfIndex : public AnnIndex {
public:
    explicit IvfIndex(IvfOptions opts = {});

    std::string kind() const override { return "ivf"; }
    void build(const std::vector<IndexEntry>& entries) override;
    void insert(const IndexEntry& entry) override;
    void erase(const TimeUuid::Bytes& key) override;
    void clear() override;
    std::size_t size() const override { return where_.size(); }
    std::size_t probe_units() const override { return centroids_.size(); }
    std::vector<IndexRef> probe(const std::vector<float>& query, std::size_t nprobe) const override;

    const IvfOptions& options() const { return opts_; }

private:
    std::size_t nearest_list(const std::vector<float>& v) const;

    IvfOptions opts_;
    std::vector<std::vector<float>> centroids_;
    std::vector<std::vector<IndexRef>> lists_;
    std::map<TimeUuid::Bytes, std::size_t> where_;
};

std::unique_ptr<AnnIndex> make_ann_index(const std::string& kind, const IvfOptions& opts);
