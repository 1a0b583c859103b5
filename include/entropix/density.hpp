#ifndef ENTROPIX_DENSITY_HPP
#define ENTROPIX_DENSITY_HPP

#include "entropix/distance.hpp"
#include "entropix/snapshot.hpp"

#include <cstddef>
#include <vector>

namespace entropix {

enum class DensityMode { Discrete, Smoothed };

struct DensityConfig {
    DensityMode mode = DensityMode::Smoothed;
    // Smoothed: number of nearest centroids blended (clamped to k).
    size_t smoothing_neighbors = 3;
    // Returned for every query while no visits are recorded. 0 = 1/k.
    float bootstrap_density = 0.0f;
    // Smoothed: kernel scale h in h / (h + distance). 0 = half the mean
    // distance from each centroid to its nearest neighbour.
    float bandwidth = 0.0f;
};

/**
 * Visitation density from a centroid snapshot.
 *
 * Discrete: mass of the nearest centroid, count / total. Piecewise constant
 * over the Voronoi cells.
 * Smoothed: sum over the m nearest centroids of mass_j * h / (h + d_j), with
 * d_j the metric distance. Decays away from visited centroids, equals the
 * discrete mass plus neighbour contributions at a centroid.
 * Both return values in [0, 1].
 *
 * Stateless apart from its config; safe to share between threads as long as
 * each thread passes its own workspace.
 */
class DensityEstimator {
public:
    explicit DensityEstimator(DensityConfig cfg = {});

    void density(const CentroidSnapshot& snap, const float* points, size_t n,
                 int dim, DistanceWorkspace& ws, std::vector<float>& out) const;

    std::vector<float> density(const CentroidSnapshot& snap,
                               const float* points, size_t n, int dim) const;

    // Probability mass per centroid (bootstrap value when nothing is recorded).
    std::vector<float> cluster_masses(const CentroidSnapshot& snap) const;

    float bootstrap(size_t k) const;
    // Kernel scale actually used for this snapshot.
    float bandwidth(const CentroidSnapshot& snap) const;
    const DensityConfig& config() const { return cfg_; }

private:
    DensityConfig cfg_;
};

}  // namespace entropix

#endif  // ENTROPIX_DENSITY_HPP
