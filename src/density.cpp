#include "entropix/density.hpp"
#include "entropix/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace entropix {

DensityEstimator::DensityEstimator(DensityConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.bootstrap_density < 0.0f || cfg_.bootstrap_density > 1.0f)
        throw std::invalid_argument("DensityEstimator: bootstrap_density must be in [0, 1]");
    if (cfg_.mode == DensityMode::Smoothed && cfg_.smoothing_neighbors == 0)
        throw std::invalid_argument("DensityEstimator: smoothing_neighbors must be >= 1");
    if (!(cfg_.bandwidth >= 0.0f) || !std::isfinite(cfg_.bandwidth))
        throw std::invalid_argument("DensityEstimator: bandwidth must be >= 0");
}

float DensityEstimator::bootstrap(size_t k) const {
    if (cfg_.bootstrap_density > 0.0f) return cfg_.bootstrap_density;
    return k > 0 ? 1.0f / static_cast<float>(k) : 1.0f;
}

float DensityEstimator::bandwidth(const CentroidSnapshot& snap) const {
    if (cfg_.bandwidth > 0.0f) return cfg_.bandwidth;
    if (snap.k < 2) return 1.0f;

    // Half the mean nearest-neighbour spacing between centroids.
    DistanceWorkspace ws;
    std::vector<float> dist;
    snap.metric->pairwise(snap.centroids.data(), snap.k, snap.centroids.data(),
                          snap.k, snap.dim, ws, dist);
    double sum = 0.0;
    for (size_t a = 0; a < snap.k; ++a) {
        float nn = std::numeric_limits<float>::max();
        for (size_t b = 0; b < snap.k; ++b)
            if (a != b && dist[a * snap.k + b] < nn) nn = dist[a * snap.k + b];
        sum += std::sqrt(static_cast<double>(nn));
    }
    const double h = 0.5 * sum / static_cast<double>(snap.k);
    return h > 0.0 ? static_cast<float>(h) : 1.0f;
}

std::vector<float> DensityEstimator::cluster_masses(const CentroidSnapshot& snap) const {
    const float boot = bootstrap(snap.k);
    std::vector<float> masses(snap.k);
    for (size_t c = 0; c < snap.k; ++c) masses[c] = snap.occupancy.mass(c, boot);
    return masses;
}

void DensityEstimator::density(const CentroidSnapshot& snap, const float* points,
                               size_t n, int dim, DistanceWorkspace& ws,
                               std::vector<float>& out) const {
    if (dim != snap.dim) throw DimensionMismatchError(snap.dim, dim);
    out.resize(n);
    if (n == 0) return;

    // No visits yet: the sentinel, no division by a zero total.
    if (snap.occupancy.total() == 0 || snap.k == 0) {
        std::fill(out.begin(), out.end(), bootstrap(snap.k));
        return;
    }
    if (!points) throw std::invalid_argument("DensityEstimator::density: null points");

    const size_t k = snap.k;
    const std::vector<float> masses = cluster_masses(snap);

    std::vector<float> dist;
    snap.metric->pairwise(points, n, snap.centroids.data(), k, dim, ws, dist);

    if (cfg_.mode == DensityMode::Discrete) {
        for (size_t i = 0; i < n; ++i) {
            const float* row = dist.data() + i * k;
            size_t best = 0;
            for (size_t c = 1; c < k; ++c)
                if (row[c] < row[best]) best = c;
            out[i] = masses[best];
        }
        return;
    }

    const size_t m = std::min(cfg_.smoothing_neighbors, k);
    const double h = bandwidth(snap);
    std::vector<size_t> idx(k);
    for (size_t i = 0; i < n; ++i) {
        const float* row = dist.data() + i * k;
        std::iota(idx.begin(), idx.end(), size_t(0));
        std::partial_sort(idx.begin(), idx.begin() + m, idx.end(),
                          [row](size_t a, size_t b) {
                              return row[a] < row[b] || (row[a] == row[b] && a < b);
                          });

        // Kernel weights are <= 1 and masses sum to <= 1, so acc stays in [0, 1].
        double acc = 0.0;
        for (size_t j = 0; j < m; ++j) {
            const size_t c = idx[j];
            const double d = std::sqrt(static_cast<double>(row[c]));
            acc += masses[c] * (h / (h + d));
        }
        out[i] = static_cast<float>(std::min(acc, 1.0));
    }
}

std::vector<float> DensityEstimator::density(const CentroidSnapshot& snap,
                                             const float* points, size_t n,
                                             int dim) const {
    DistanceWorkspace ws;
    std::vector<float> out;
    density(snap, points, n, dim, ws, out);
    return out;
}

}  // namespace entropix
