#ifndef ENTROPIX_ESTIMATOR_HPP
#define ENTROPIX_ESTIMATOR_HPP

#include "entropix/config.hpp"
#include "entropix/density.hpp"
#include "entropix/metrics.hpp"
#include "entropix/online_kmeans.hpp"
#include "entropix/reward.hpp"
#include "entropix/snapshot.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace entropix {

struct SimulatedUpdate {
    UpdateResult result;
    std::shared_ptr<const CentroidSnapshot> after;
    double entropy_gain = 0.0;
};

/**
 * Exploration-bonus estimator handed to the RL loop.
 *
 * Owns one OnlineKMeans plus the density and reward stages. Writers
 * (initialize/update/reseed/restore/reset) are serialized; density, reward
 * and entropy queries read a published snapshot and may run concurrently
 * with each other and with an in-flight update.
 */
class Estimator {
public:
    Estimator(const EstimatorConfig& cfg, int dim);

    Estimator(const Estimator&) = delete;
    Estimator& operator=(const Estimator&) = delete;

    // Builds and seeds an estimator in one step.
    static std::unique_ptr<Estimator> initialize(const float* first_batch, size_t n,
                                                 int dim, const EstimatorConfig& cfg);

    void initialize(const float* first_batch, size_t n, int dim);
    void reseed(const float* batch, size_t n, int dim);

    // nullopt for batches of fewer than two points.
    std::optional<UpdateResult> update(const float* batch, size_t n, int dim);

    // Scores a candidate batch without committing it.
    std::optional<SimulatedUpdate> simulate_update(const float* batch, size_t n,
                                                   int dim) const;

    std::vector<float> density(const float* points, size_t n, int dim) const;
    std::vector<float> reward(const float* points, size_t n, int dim) const;
    AssignResult assign(const float* points, size_t n, int dim) const;

    // Occupancy entropy of the current snapshot.
    double entropy() const;
    // Entropy of the cluster histogram of `points` under the current centroids.
    double batch_entropy(const float* points, size_t n, int dim) const;

    // Health of the current snapshot, scored against `points`. Both the
    // occupancy figures and the sample distances come from one snapshot.
    ClusterReport cluster_report(const float* points, size_t n, int dim) const;

    std::shared_ptr<const CentroidSnapshot> snapshot() const;
    void restore(const CentroidSnapshot& snap);
    void reset();

    void set_metric_weights(std::vector<float> weights, size_t rank);

    bool is_ready() const { return kmeans_.is_ready(); }
    EstimatorState state() const { return kmeans_.state(); }
    size_t k() const { return kmeans_.k(); }
    int dim() const { return kmeans_.dim(); }
    const EstimatorConfig& config() const { return cfg_; }

private:
    EstimatorConfig cfg_;
    OnlineKMeans kmeans_;
    DensityEstimator density_;
    RewardEstimator reward_;
};

}  // namespace entropix

#endif  // ENTROPIX_ESTIMATOR_HPP
