#include "../include/ann_index.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>

static std::vector<float> normalized(const std::vector<float>& v) {
    double norm = 0.0;
    for (float x : v) norm += (double)x * x;
    std::vector<float> out(v);
    if (norm > 0.0) {
        float inv = (float)(1.0 / std::sqrt(norm));
        for (auto& x : out) x *= inv;
    }
    return out;
}

IvfIndex::IvfIndex(IvfOptions opts) : opts_(opts) {
    if (opts_.max_lists == 0) opts_.max_lists = 1;
    if (opts_.nprobe == 0) opts_.nprobe = 1;
}

void IvfIndex::clear() {
    centroids_.clear();
    lists_.clear();
    where_.clear();
}

std::size_t IvfIndex::nearest_list(const std::vector<float>& v) const {
    std::size_t best = 0;
    double best_d = std::numeric_limits<double>::max();
    for (std::size_t c = 0; c < centroids_.size(); ++c) {
        double d = cosine_distance(v, centroids_[c]);
        if (d < best_d) {
            best_d = d;
            best = c;
        }
    }
    return best;
}

void IvfIndex::build(const std::vector<IndexEntry>& entries) {
    clear();
    const std::size_t n = entries.size();
    if (n == 0) return;
    const std::size_t dim = entries.front().embedding.size();
    std::size_t nlist = std::max<std::size_t>(1, (std::size_t)std::lround(std::sqrt((double)n)));
    nlist = std::min(nlist, opts_.max_lists);

    std::vector<std::vector<float>> data;
    data.reserve(n);
    for (const auto& e : entries) data.push_back(normalized(e.embedding));

    // Seeded so the same data always yields the same lists.
    std::mt19937 rng(42);
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);
    centroids_.resize(nlist);
    for (std::size_t c = 0; c < nlist; ++c) centroids_[c] = data[order[c % n]];

    std::vector<std::size_t> assign(n, 0);
    for (std::size_t iter = 0; iter < opts_.train_iterations; ++iter) {
        bool moved = false;
        for (std::size_t i = 0; i < n; ++i) {
            auto c = nearest_list(data[i]);
            if (c != assign[i]) moved = true;
            assign[i] = c;
        }
        std::vector<std::vector<double>> sums(nlist, std::vector<double>(dim, 0.0));
        std::vector<std::size_t> counts(nlist, 0);
        for (std::size_t i = 0; i < n; ++i) {
            counts[assign[i]]++;
            for (std::size_t d = 0; d < dim && d < data[i].size(); ++d) sums[assign[i]][d] += data[i][d];
        }
        for (std::size_t c = 0; c < nlist; ++c) {
            if (counts[c] == 0) continue; // empty cell keeps its old centroid
            std::vector<float> mean(dim);
            for (std::size_t d = 0; d < dim; ++d) mean[d] = (float)(sums[c][d] / counts[c]);
            centroids_[c] = normalized(mean);
        }
        if (iter > 0 && !moved) break;
    }

    lists_.assign(nlist, {});
    for (std::size_t i = 0; i < n; ++i) {
        auto c = nearest_list(data[i]);
        lists_[c].push_back(IndexRef{entries[i].partition, entries[i].key});
        where_[entries[i].key] = c;
    }
}

void IvfIndex::insert(const IndexEntry& entry) {
    erase(entry.key);
    if (centroids_.empty()) {
        centroids_.push_back(normalized(entry.embedding));
        lists_.emplace_back();
    }
    auto c = nearest_list(normalized(entry.embedding));
    lists_[c].push_back(IndexRef{entry.partition, entry.key});
    where_[entry.key] = c;
}

void IvfIndex::erase(const TimeUuid::Bytes& key) {
    auto it = where_.find(key);
    if (it == where_.end()) return;
    auto& list = lists_[it->second];
    list.erase(std::remove_if(list.begin(), list.end(), [&](const IndexRef& r){ return r.key == key; }), list.end());
    where_.erase(it);
}

std::vector<IndexRef> IvfIndex::probe(const std::vector<float>& query, std::size_t nprobe) const {
    std::vector<IndexRef> out;
    if (centroids_.empty()) return out;
    auto q = normalized(query);
    std::vector<std::pair<double, std::size_t>> ranked;
    ranked.reserve(centroids_.size());
    for (std::size_t c = 0; c < centroids_.size(); ++c) ranked.emplace_back(cosine_distance(q, centroids_[c]), c);
    std::size_t take = std::min(nprobe, ranked.size());
    std::partial_sort(ranked.begin(), ranked.begin() + take, ranked.end());
    for (std::size_t i = 0; i < take; ++i) {
        const auto& list = lists_[ranked[i].second];
        out.insert(out.end(), list.begin(), list.end());
    }
    return out;
}

std::unique_ptr<AnnIndex> make_ann_index(const std::string& kind, const IvfOptions& opts) {
    if (kind == "ivf") return std::make_unique<IvfIndex>(opts);
    throw SchemaError("unknown index kind in table metadata: '" + kind + "'");
}
