#ifndef ENTROPIX_ONLINE_KMEANS_HPP
#define ENTROPIX_ONLINE_KMEANS_HPP

#include "entropix/distance.hpp"
#include "entropix/initializer.hpp"
#include "entropix/snapshot.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <vector>

namespace entropix {

struct KMeansConfig {
    size_t k = 16;
    DistanceConfig distance;
    InitConfig init;
    bool shuffle = true;
    // Rows per sequential mini-batch inside one update. 0 = whole batch;
    // 1 is rejected.
    size_t minibatch_size = 0;
    // Homeostasis: adds kappa * (count[c] - mean count) to the assignment
    // objective. 0 disables it.
    float balancing_strength = 0.0f;
    unsigned seed = 42;
    int num_threads = 0;
    bool verbose = false;
};

enum class EstimatorState { Uninitialized, Ready };

struct UpdateResult {
    std::vector<int> assignment;         // per batch row, caller's row order
    std::vector<uint64_t> batch_counts;  // rows assigned per centroid
    std::vector<uint64_t> counts;        // lifetime counts after the update
    uint64_t version = 0;
};

struct AssignResult {
    std::vector<int> labels;
    std::vector<float> distances;  // squared distance to the assigned centroid
};

/**
 * Online k-means over a stream of batches.
 *
 * Centroid i moves to the exact running mean of every point ever assigned to
 * it: per batch the assigned rows are summed once, then merged as
 *   c += (sum - m * c) / (count + m).
 *
 * One writer at a time (initialize/update/reseed/restore/reset serialize on
 * an internal mutex). Each commit publishes a fresh CentroidSnapshot through
 * a single pointer swap, so readers never observe a half-applied batch.
 */
class OnlineKMeans {
public:
    OnlineKMeans(KMeansConfig cfg, int dim);

    OnlineKMeans(const OnlineKMeans&) = delete;
    OnlineKMeans& operator=(const OnlineKMeans&) = delete;

    // Uninitialized -> Ready. Throws InsufficientDataError,
    // DimensionMismatchError, or std::logic_error if already Ready.
    void initialize(const float* data, size_t n, int dim);

    // Re-runs seeding on a Ready estimator and clears occupancy.
    void reseed(const float* data, size_t n, int dim);

    // nullopt when n < 2; nothing changes in that case.
    std::optional<UpdateResult> update(const float* data, size_t n, int dim);

    // Same as update() on a private copy of the current state. Nothing is
    // published. `after`, if given, receives the would-be snapshot.
    std::optional<UpdateResult> simulate(
        const float* data, size_t n, int dim,
        std::shared_ptr<const CentroidSnapshot>* after = nullptr) const;

    // Nearest centroid per row (pure distance, no homeostasis term).
    AssignResult assign(const float* data, size_t n, int dim) const;

    std::shared_ptr<const CentroidSnapshot> snapshot() const;

    // Loads centroids and counts (e.g. from a saved snapshot) and becomes
    // Ready. Throws SnapshotFormatError on shape mismatch.
    void restore(const CentroidSnapshot& snap);

    // Back to Uninitialized; the generator is re-seeded from the config.
    void reset();

    // Learned metric only. Republishes the current state with new weights.
    // Throws std::logic_error for a Euclidean metric and UninitializedError
    // before initialization; initial weights come from DistanceConfig.
    void set_metric_weights(std::vector<float> weights, size_t rank);

    EstimatorState state() const;
    bool is_ready() const { return state() == EstimatorState::Ready; }
    size_t k() const { return cfg_.k; }
    int dim() const { return dim_; }
    const KMeansConfig& config() const { return cfg_; }

private:
    struct Workspace {
        DistanceWorkspace dist;
        std::vector<float> dist_buffer;   // rows x k
        std::vector<float> shuffled;      // n x dim
        std::vector<size_t> order;        // shuffled row -> caller row
        std::vector<int> labels;
        std::vector<double> sums;         // k x dim
        std::vector<uint64_t> chunk_counts;
        std::vector<float> penalty;       // homeostasis, k
    };

    void check_dim(int dim) const;
    std::shared_ptr<const CentroidSnapshot> current() const;
    void publish(std::shared_ptr<const CentroidSnapshot> snap);
    std::shared_ptr<CentroidSnapshot> seed_state(const float* data, size_t n);

    UpdateResult apply(CentroidSnapshot& next, const float* data, size_t n,
                       std::mt19937& rng, Workspace& ws) const;
    void apply_chunk(CentroidSnapshot& next, const float* rows, size_t len,
                     Workspace& ws) const;

    KMeansConfig cfg_;
    int dim_;

    mutable std::mutex write_mu_;     // serializes writers
    std::mt19937 rng_;                // guarded by write_mu_
    Workspace ws_;                    // guarded by write_mu_
    std::shared_ptr<const DistanceMetric> metric_;  // guarded by write_mu_

    mutable std::shared_mutex snap_mu_;  // protects current_ (pointer swap)
    std::shared_ptr<const CentroidSnapshot> current_;
};

// Nearest centroid per row against one fixed snapshot, with its metric.
AssignResult assign_to_snapshot(const CentroidSnapshot& snap, const float* data,
                                size_t n, int dim);

}  // namespace entropix

#endif  // ENTROPIX_ONLINE_KMEANS_HPP
