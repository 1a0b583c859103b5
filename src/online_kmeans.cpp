#include "entropix/online_kmeans.hpp"
#include "entropix/errors.hpp"
#include "entropix/log.hpp"

#include <algorithm>
#include <cstring>
#include <numeric>
#include <omp.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace entropix {

OnlineKMeans::OnlineKMeans(KMeansConfig cfg, int dim)
    : cfg_(std::move(cfg)), dim_(dim), rng_(cfg_.seed) {
    if (cfg_.k == 0 || dim_ <= 0)
        throw std::invalid_argument("OnlineKMeans: k and dim must be positive");
    if (cfg_.balancing_strength < 0.0f)
        throw std::invalid_argument("OnlineKMeans: balancing_strength must be >= 0");
    if (cfg_.minibatch_size == 1)
        throw std::invalid_argument("OnlineKMeans: minibatch_size must be 0 or >= 2");
    if (cfg_.distance.num_threads == 0) cfg_.distance.num_threads = cfg_.num_threads;
    metric_ = make_metric(cfg_.distance, dim_);
}

void OnlineKMeans::check_dim(int dim) const {
    if (dim != dim_) throw DimensionMismatchError(dim_, dim);
}

std::shared_ptr<const CentroidSnapshot> OnlineKMeans::current() const {
    std::shared_lock lk(snap_mu_);
    return current_;
}

void OnlineKMeans::publish(std::shared_ptr<const CentroidSnapshot> snap) {
    std::unique_lock lk(snap_mu_);
    current_ = std::move(snap);
}

EstimatorState OnlineKMeans::state() const {
    return current() ? EstimatorState::Ready : EstimatorState::Uninitialized;
}

std::shared_ptr<const CentroidSnapshot> OnlineKMeans::snapshot() const {
    auto snap = current();
    if (!snap) throw UninitializedError("snapshot");
    return snap;
}

std::shared_ptr<CentroidSnapshot> OnlineKMeans::seed_state(const float* data,
                                                           size_t n) {
    auto snap = std::make_shared<CentroidSnapshot>();
    snap->k = cfg_.k;
    snap->dim = dim_;
    snap->centroids = seed_centroids(data, n, dim_, cfg_.k, cfg_.init, *metric_, rng_);
    snap->occupancy = OccupancyStats(cfg_.k);
    snap->metric = metric_;
    return snap;
}

void OnlineKMeans::initialize(const float* data, size_t n, int dim) {
    check_dim(dim);
    std::lock_guard<std::mutex> wl(write_mu_);
    if (current())
        throw std::logic_error("OnlineKMeans::initialize: already initialized");

    auto snap = seed_state(data, n);
    snap->version = 1;
    publish(std::move(snap));

    if (cfg_.verbose)
        ENTROPIX_LOG_INFO("initialized k=%zu dim=%d from %zu points (%s)",
                          cfg_.k, dim_, n, metric_->name().c_str());
}

void OnlineKMeans::reseed(const float* data, size_t n, int dim) {
    check_dim(dim);
    std::lock_guard<std::mutex> wl(write_mu_);
    auto prev = current();
    if (!prev) throw UninitializedError("reseed");

    auto snap = seed_state(data, n);
    snap->version = prev->version + 1;
    publish(std::move(snap));

    if (cfg_.verbose)
        ENTROPIX_LOG_INFO("reseeded k=%zu from %zu points", cfg_.k, n);
}

std::optional<UpdateResult> OnlineKMeans::update(const float* data, size_t n,
                                                 int dim) {
    std::lock_guard<std::mutex> wl(write_mu_);
    auto prev = current();
    if (!prev) throw UninitializedError("update");
    check_dim(dim);
    if (n < 2) return std::nullopt;
    if (!data) throw std::invalid_argument("OnlineKMeans::update: null data");

    // Work on a private copy. Nothing is visible until publish().
    auto next = std::make_shared<CentroidSnapshot>(*prev);
    std::mt19937 rng = rng_;
    UpdateResult res = apply(*next, data, n, rng, ws_);

    rng_ = rng;
    publish(std::move(next));

    if (cfg_.verbose)
        ENTROPIX_LOG_INFO("update v%llu: %zu points, total visits %llu",
                          static_cast<unsigned long long>(res.version), n,
                          static_cast<unsigned long long>(
                              std::accumulate(res.counts.begin(), res.counts.end(),
                                              uint64_t(0))));
    return res;
}

std::optional<UpdateResult> OnlineKMeans::simulate(
    const float* data, size_t n, int dim,
    std::shared_ptr<const CentroidSnapshot>* after) const {
    std::mt19937 rng;
    std::shared_ptr<const CentroidSnapshot> prev;
    {
        std::lock_guard<std::mutex> wl(write_mu_);
        prev = current();
        rng = rng_;
    }
    if (!prev) throw UninitializedError("simulate");
    check_dim(dim);
    if (n < 2) return std::nullopt;
    if (!data) throw std::invalid_argument("OnlineKMeans::simulate: null data");

    auto next = std::make_shared<CentroidSnapshot>(*prev);
    Workspace ws;
    UpdateResult res = apply(*next, data, n, rng, ws);
    if (after) *after = std::move(next);
    return res;
}

UpdateResult OnlineKMeans::apply(CentroidSnapshot& next, const float* data,
                                 size_t n, std::mt19937& rng,
                                 Workspace& ws) const {
    const size_t k = next.k;
    const size_t bs = (cfg_.minibatch_size == 0) ? n : cfg_.minibatch_size;

    // Chunk boundaries. A trailing single row joins the previous chunk.
    std::vector<size_t> bounds;
    for (size_t start = 0; start < n; start += bs) bounds.push_back(start);
    if (bounds.size() > 1 && n - bounds.back() < 2) bounds.pop_back();
    bounds.push_back(n);

    // Shuffling only matters once the batch is split into sequential chunks.
    const float* rows = data;
    ws.order.resize(n);
    std::iota(ws.order.begin(), ws.order.end(), size_t(0));
    if (cfg_.shuffle && bounds.size() > 2) {
        std::shuffle(ws.order.begin(), ws.order.end(), rng);
        ws.shuffled.resize(n * dim_);
        for (size_t i = 0; i < n; ++i)
            std::memcpy(ws.shuffled.data() + i * dim_, data + ws.order[i] * dim_,
                        static_cast<size_t>(dim_) * sizeof(float));
        rows = ws.shuffled.data();
    }

    UpdateResult res;
    res.assignment.assign(n, -1);
    res.batch_counts.assign(k, 0);

    for (size_t b = 0; b + 1 < bounds.size(); ++b) {
        const size_t start = bounds[b];
        const size_t len = bounds[b + 1] - start;
        apply_chunk(next, rows + start * dim_, len, ws);
        for (size_t i = 0; i < len; ++i)
            res.assignment[ws.order[start + i]] = ws.labels[i];
        for (size_t c = 0; c < k; ++c)
            res.batch_counts[c] += ws.chunk_counts[c];
    }

    next.version += 1;
    res.counts = next.occupancy.counts();
    res.version = next.version;
    return res;
}

void OnlineKMeans::apply_chunk(CentroidSnapshot& next, const float* rows,
                               size_t len, Workspace& ws) const {
    const size_t k = next.k;
    const int dim = dim_;
    const int nt = cfg_.num_threads > 0 ? cfg_.num_threads : omp_get_max_threads();

    next.metric->pairwise(rows, len, next.centroids.data(), k, dim,
                          ws.dist, ws.dist_buffer);

    ws.penalty.assign(k, 0.0f);
    if (cfg_.balancing_strength > 0.0f) {
        const float mean = next.occupancy.mean_count();
        for (size_t c = 0; c < k; ++c)
            ws.penalty[c] = cfg_.balancing_strength *
                            (static_cast<float>(next.occupancy.count(c)) - mean);
    }

    // Arg-min per row; strict < keeps the lowest index on ties.
    ws.labels.resize(len);
    #pragma omp parallel for schedule(static) num_threads(nt)
    for (size_t i = 0; i < len; ++i) {
        const float* row = ws.dist_buffer.data() + i * k;
        int best = 0;
        float best_val = row[0] + ws.penalty[0];
        for (size_t c = 1; c < k; ++c) {
            float v = row[c] + ws.penalty[c];
            if (v < best_val) { best_val = v; best = static_cast<int>(c); }
        }
        ws.labels[i] = best;
    }

    // One pass: per-centroid sums and counts for this chunk.
    ws.sums.assign(k * dim, 0.0);
    ws.chunk_counts.assign(k, 0);
    for (size_t i = 0; i < len; ++i) {
        const size_t l = static_cast<size_t>(ws.labels[i]);
        const float* x = rows + i * dim;
        double* s = ws.sums.data() + l * dim;
        for (int j = 0; j < dim; ++j) s[j] += x[j];
        ws.chunk_counts[l]++;
    }

    // Merge into running means. A centroid is touched only when this chunk
    // assigned it at least one row; label 0 alone never implies an update.
    for (size_t c = 0; c < k; ++c) {
        const uint64_t m = ws.chunk_counts[c];
        if (m == 0) continue;
        const double new_count = static_cast<double>(next.occupancy.count(c) + m);
        float* cv = next.centroids.data() + c * dim;
        const double* s = ws.sums.data() + c * dim;
        for (int j = 0; j < dim; ++j) {
            const double old_c = cv[j];
            cv[j] = static_cast<float>(
                old_c + (s[j] - static_cast<double>(m) * old_c) / new_count);
        }
    }
    next.occupancy.merge(ws.chunk_counts);
}

AssignResult OnlineKMeans::assign(const float* data, size_t n, int dim) const {
    auto snap = current();
    if (!snap) throw UninitializedError("assign");
    check_dim(dim);
    return assign_to_snapshot(*snap, data, n, dim);
}

AssignResult assign_to_snapshot(const CentroidSnapshot& snap, const float* data,
                                size_t n, int dim) {
    if (dim != snap.dim) throw DimensionMismatchError(snap.dim, dim);

    AssignResult res;
    res.labels.resize(n);
    res.distances.resize(n);
    if (n == 0) return res;
    if (!data) throw std::invalid_argument("assign_to_snapshot: null data");

    DistanceWorkspace ws;
    std::vector<float> dist;
    snap.metric->pairwise(data, n, snap.centroids.data(), snap.k, dim, ws, dist);

    const size_t k = snap.k;
    for (size_t i = 0; i < n; ++i) {
        const float* row = dist.data() + i * k;
        int best = 0;
        for (size_t c = 1; c < k; ++c)
            if (row[c] < row[best]) best = static_cast<int>(c);
        res.labels[i] = best;
        res.distances[i] = row[best];
    }
    return res;
}

void OnlineKMeans::restore(const CentroidSnapshot& snap) {
    if (snap.k != cfg_.k)
        throw SnapshotFormatError("k is " + std::to_string(snap.k) +
                                  ", estimator expects " + std::to_string(cfg_.k));
    if (snap.dim != dim_) throw DimensionMismatchError(dim_, snap.dim);
    if (snap.centroids.size() != snap.k * static_cast<size_t>(snap.dim))
        throw SnapshotFormatError("centroid buffer has wrong size");
    if (snap.occupancy.k() != snap.k)
        throw SnapshotFormatError("occupancy has wrong size");

    std::lock_guard<std::mutex> wl(write_mu_);
    auto next = std::make_shared<CentroidSnapshot>(snap);
    next->metric = metric_;
    publish(std::move(next));

    if (cfg_.verbose)
        ENTROPIX_LOG_INFO("restored snapshot v%llu (total visits %llu)",
                          static_cast<unsigned long long>(snap.version),
                          static_cast<unsigned long long>(snap.occupancy.total()));
}

void OnlineKMeans::reset() {
    std::lock_guard<std::mutex> wl(write_mu_);
    publish(nullptr);
    rng_.seed(cfg_.seed);
    if (cfg_.verbose) ENTROPIX_LOG_INFO("reset");
}

void OnlineKMeans::set_metric_weights(std::vector<float> weights, size_t rank) {
    std::lock_guard<std::mutex> wl(write_mu_);
    if (metric_->kind() != MetricKind::Learned)
        throw std::logic_error("set_metric_weights: metric is not learned");
    auto prev = current();
    if (!prev) throw UninitializedError("set_metric_weights");

    auto updated = std::make_unique<LinearMetric>(
        static_cast<const LinearMetric&>(*metric_));
    updated->set_weights(std::move(weights), rank);
    metric_ = std::shared_ptr<const DistanceMetric>(std::move(updated));

    auto next = std::make_shared<CentroidSnapshot>(*prev);
    next->metric = metric_;
    next->version = prev->version + 1;
    publish(std::move(next));
}

}  // namespace entropix
