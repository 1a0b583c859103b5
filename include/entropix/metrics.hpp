#ifndef ENTROPIX_METRICS_HPP
#define ENTROPIX_METRICS_HPP

#include "entropix/online_kmeans.hpp"
#include "entropix/snapshot.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace entropix {

// One centroid's lifetime visits plus the spread of a sample batch around it.
struct ClusterStats {
    uint64_t visits = 0;       // lifetime count from the snapshot
    size_t batch_count = 0;    // sample rows assigned here
    float min_dist = 0.0f;     // Euclidean, over the sample rows
    float max_dist = 0.0f;
    float mean_dist = 0.0f;
    float radius_ratio = 0.0f; // max_dist / mean_dist, flags outlier-heavy clusters
};

struct ClusterReport {
    std::vector<ClusterStats> clusters;
    uint64_t total_visits = 0;
    int unvisited = 0;
    float visit_stddev = 0.0f;
    float imbalance_ratio = 0.0f;
    double occupancy_entropy = 0.0;
    double batch_inertia = 0.0;  // sum of squared distances of the sample rows
};

/**
 * Health of a published snapshot. `sample` must be an assignment of some
 * batch against this same snapshot (its labels index snap's centroids and its
 * distances are squared). Throws std::invalid_argument otherwise.
 */
ClusterReport cluster_report(const CentroidSnapshot& snap, const AssignResult& sample);

// max / min over the counts; 0 when any count is 0.
float compute_imbalance_ratio(const std::vector<uint64_t>& counts);

float compute_cluster_size_stddev(const std::vector<uint64_t>& counts);

int count_empty_clusters(const std::vector<uint64_t>& counts);

}  // namespace entropix

#endif  // ENTROPIX_METRICS_HPP
