#include "entropix/initializer.hpp"
#include "entropix/errors.hpp"
#include "entropix/log.hpp"

#include <algorithm>
#include <cstring>
#include <numeric>
#include <stdexcept>

namespace entropix {

std::vector<size_t> distinct_rows(const float* data, size_t n, int dim) {
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t(0));

    auto row_less = [&](size_t a, size_t b) {
        const float* ra = data + a * dim;
        const float* rb = data + b * dim;
        return std::lexicographical_compare(ra, ra + dim, rb, rb + dim);
    };
    auto row_equal = [&](size_t a, size_t b) {
        const float* ra = data + a * dim;
        const float* rb = data + b * dim;
        return std::equal(ra, ra + dim, rb);
    };

    // Stable sort keeps the lowest index first within each group of equal rows.
    std::stable_sort(order.begin(), order.end(), row_less);
    order.erase(std::unique(order.begin(), order.end(), row_equal), order.end());
    std::sort(order.begin(), order.end());
    return order;
}

namespace {

void copy_row(const float* data, size_t row, int dim, float* dst) {
    std::memcpy(dst, data + row * dim, static_cast<size_t>(dim) * sizeof(float));
}

std::vector<size_t> pick_random(const std::vector<size_t>& candidates,
                                size_t k, std::mt19937& rng) {
    std::vector<size_t> picks(candidates);
    std::shuffle(picks.begin(), picks.end(), rng);
    picks.resize(k);
    return picks;
}

// k-means++ over distinct candidate rows. Every pick is a different row, so
// no two seeds coincide.
std::vector<size_t> pick_farthest(const float* data, int dim,
                                  const std::vector<size_t>& candidates,
                                  size_t k, bool greedy,
                                  const DistanceMetric& metric,
                                  std::mt19937& rng) {
    const size_t m = candidates.size();
    std::vector<float> pts(m * dim);
    for (size_t i = 0; i < m; ++i)
        copy_row(data, candidates[i], dim, pts.data() + i * dim);

    std::vector<size_t> picks;
    picks.reserve(k);
    std::vector<char> taken(m, 0);

    std::uniform_int_distribution<size_t> uidx(0, m - 1);
    size_t first = uidx(rng);
    picks.push_back(first);
    taken[first] = 1;

    DistanceWorkspace ws;
    std::vector<float> min_dist;
    metric.pairwise(pts.data(), m, pts.data() + first * dim, 1, dim, ws, min_dist);
    min_dist[first] = 0.0f;

    std::vector<float> d_new;
    for (size_t cc = 1; cc < k; ++cc) {
        double total = 0.0;
        for (size_t i = 0; i < m; ++i)
            if (!taken[i]) total += min_dist[i];

        size_t chosen = m;
        if (greedy || total <= 0.0) {
            float best = -1.0f;
            for (size_t i = 0; i < m; ++i) {
                if (taken[i]) continue;
                if (min_dist[i] > best) { best = min_dist[i]; chosen = i; }
            }
        } else {
            std::uniform_real_distribution<double> u(0.0, total);
            double r = u(rng);
            for (size_t i = 0; i < m; ++i) {
                if (taken[i] || min_dist[i] <= 0.0f) continue;
                chosen = i;
                if (r < min_dist[i]) break;
                r -= min_dist[i];
            }
        }
        if (chosen == m)
            throw std::logic_error("seed_centroids: no candidate left");

        picks.push_back(chosen);
        taken[chosen] = 1;

        metric.pairwise(pts.data(), m, pts.data() + chosen * dim, 1, dim, ws, d_new);
        for (size_t i = 0; i < m; ++i)
            if (d_new[i] < min_dist[i]) min_dist[i] = d_new[i];
        min_dist[chosen] = 0.0f;
    }

    for (auto& p : picks) p = candidates[p];
    return picks;
}

}  // namespace

std::vector<float> seed_centroids(const float* data, size_t n, int dim,
                                  size_t k, const InitConfig& cfg,
                                  const DistanceMetric& metric,
                                  std::mt19937& rng) {
    if (k == 0 || dim <= 0)
        throw std::invalid_argument("seed_centroids: k and dim must be positive");
    if (dim != metric.dim()) throw DimensionMismatchError(metric.dim(), dim);
    if (n > 0 && !data)
        throw std::invalid_argument("seed_centroids: null data");

    std::vector<size_t> candidates = distinct_rows(data, n, dim);
    std::vector<float> centroids(k * static_cast<size_t>(dim));

    if (candidates.size() < k) {
        if (cfg.on_insufficient == DuplicatePolicy::Fail || candidates.empty())
            throw InsufficientDataError(candidates.size(), k);

        ENTROPIX_LOG_WARN("seeding %zu centroids from %zu distinct points, "
                          "duplicating in row order", k, candidates.size());
        for (size_t c = 0; c < k; ++c)
            copy_row(data, candidates[c % candidates.size()], dim,
                     centroids.data() + c * dim);
        return centroids;
    }

    std::vector<size_t> picks;
    switch (cfg.strategy) {
        case InitStrategy::Random:
            picks = pick_random(candidates, k, rng);
            break;
        case InitStrategy::FarthestPoint:
            picks = pick_farthest(data, dim, candidates, k, cfg.greedy, metric, rng);
            break;
    }

    for (size_t c = 0; c < k; ++c)
        copy_row(data, picks[c], dim, centroids.data() + c * dim);
    return centroids;
}

}  // namespace entropix
