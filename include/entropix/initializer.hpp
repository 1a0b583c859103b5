#ifndef ENTROPIX_INITIALIZER_HPP
#define ENTROPIX_INITIALIZER_HPP

#include "entropix/distance.hpp"

#include <cstddef>
#include <random>
#include <vector>

namespace entropix {

enum class InitStrategy { Random, FarthestPoint };

// What to do when the first batch has fewer than k distinct rows.
enum class DuplicatePolicy { Fail, Duplicate };

struct InitConfig {
    InitStrategy strategy = InitStrategy::FarthestPoint;
    // FarthestPoint only: pick the farthest row instead of sampling by D^2.
    bool greedy = false;
    DuplicatePolicy on_insufficient = DuplicatePolicy::Fail;
};

// Indices of the first occurrence of every distinct row, in row order.
std::vector<size_t> distinct_rows(const float* data, size_t n, int dim);

/**
 * Seeds k centroids from a batch. Returns k * dim row-major floats.
 *
 * Random: k distinct rows chosen uniformly.
 * FarthestPoint: first row uniform, then k-means++ D^2 sampling (or argmax
 * with cfg.greedy) using metric for the distances.
 *
 * Throws InsufficientDataError when the batch has fewer than k distinct rows
 * and cfg.on_insufficient is Fail. With Duplicate, every distinct row is used
 * once and the remaining slots cycle through them in row order.
 */
std::vector<float> seed_centroids(const float* data, size_t n, int dim,
                                  size_t k, const InitConfig& cfg,
                                  const DistanceMetric& metric,
                                  std::mt19937& rng);

}  // namespace entropix

#endif  // ENTROPIX_INITIALIZER_HPP
