#include "entropix/metrics.hpp"
#include "entropix/reward.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace entropix {

ClusterReport cluster_report(const CentroidSnapshot& snap, const AssignResult& sample) {
    if (sample.labels.size() != sample.distances.size())
        throw std::invalid_argument("cluster_report: labels and distances differ in size");

    const auto& counts = snap.occupancy.counts();
    ClusterReport report;
    report.clusters.resize(snap.k);
    for (size_t c = 0; c < snap.k; ++c) {
        report.clusters[c].visits = counts[c];
        report.clusters[c].min_dist = std::numeric_limits<float>::max();
    }

    for (size_t i = 0; i < sample.labels.size(); ++i) {
        const int l = sample.labels[i];
        if (l < 0 || static_cast<size_t>(l) >= snap.k)
            throw std::invalid_argument("cluster_report: label out of range");
        const float d2 = std::max(sample.distances[i], 0.0f);
        report.batch_inertia += d2;

        const float dist = std::sqrt(d2);
        auto& s = report.clusters[static_cast<size_t>(l)];
        s.min_dist = std::min(s.min_dist, dist);
        s.max_dist = std::max(s.max_dist, dist);
        s.mean_dist += dist;
        s.batch_count++;
    }

    for (auto& s : report.clusters) {
        if (s.batch_count == 0) {
            s.min_dist = 0.0f;
            continue;
        }
        s.mean_dist /= static_cast<float>(s.batch_count);
        s.radius_ratio = s.mean_dist > 0.0f ? s.max_dist / s.mean_dist : 0.0f;
    }

    report.total_visits = snap.occupancy.total();
    report.unvisited = count_empty_clusters(counts);
    report.visit_stddev = compute_cluster_size_stddev(counts);
    report.imbalance_ratio = compute_imbalance_ratio(counts);
    report.occupancy_entropy = entropy(counts);
    return report;
}

float compute_imbalance_ratio(const std::vector<uint64_t>& counts) {
    if (counts.empty()) return 0.0f;
    const auto mm = std::minmax_element(counts.begin(), counts.end());
    if (*mm.first == 0) return 0.0f;
    return static_cast<float>(*mm.second) / static_cast<float>(*mm.first);
}

float compute_cluster_size_stddev(const std::vector<uint64_t>& counts) {
    if (counts.empty()) return 0.0f;
    double sum = 0.0;
    for (uint64_t c : counts) sum += static_cast<double>(c);
    const double mean = sum / counts.size();
    double var = 0.0;
    for (uint64_t c : counts) {
        const double d = static_cast<double>(c) - mean;
        var += d * d;
    }
    return static_cast<float>(std::sqrt(var / counts.size()));
}

int count_empty_clusters(const std::vector<uint64_t>& counts) {
    return static_cast<int>(std::count(counts.begin(), counts.end(), uint64_t(0)));
}

}  // namespace entropix
