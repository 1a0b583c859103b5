#ifndef ENTROPIX_SNAPSHOT_HPP
#define ENTROPIX_SNAPSHOT_HPP

#include "entropix/distance.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace entropix {

// Lifetime visit counts per centroid.
class OccupancyStats {
public:
    OccupancyStats() = default;
    explicit OccupancyStats(size_t k) : counts_(k, 0) {}
    explicit OccupancyStats(std::vector<uint64_t> counts);

    // Adds one batch worth of per-centroid counts. Sizes must match.
    void merge(const std::vector<uint64_t>& batch_counts);
    void clear();

    size_t k() const { return counts_.size(); }
    uint64_t total() const { return total_; }
    uint64_t count(size_t c) const { return counts_[c]; }
    const std::vector<uint64_t>& counts() const { return counts_; }

    // count(c) / total(); bootstrap when total() == 0.
    float mass(size_t c, float bootstrap) const;
    float mean_count() const;

private:
    std::vector<uint64_t> counts_;
    uint64_t total_ = 0;
};

/**
 * Immutable published state of an estimator: k x dim centroids, their
 * occupancy and the metric they were assigned with. A new snapshot is
 * created for every committed update; holders of an older shared_ptr keep a
 * consistent view.
 */
struct CentroidSnapshot {
    size_t k = 0;
    int dim = 0;
    std::vector<float> centroids;  // k * dim, row-major
    OccupancyStats occupancy;
    uint64_t version = 0;          // bumped on every commit
    std::shared_ptr<const DistanceMetric> metric;

    const float* centroid(size_t c) const { return centroids.data() + c * dim; }
};

}  // namespace entropix

#endif  // ENTROPIX_SNAPSHOT_HPP
