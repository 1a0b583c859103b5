#ifndef ENTROPIX_CONFIG_HPP
#define ENTROPIX_CONFIG_HPP

#include "entropix/density.hpp"
#include "entropix/distance.hpp"
#include "entropix/initializer.hpp"
#include "entropix/online_kmeans.hpp"

#include <string>

namespace entropix {

struct EstimatorConfig {
    KMeansConfig kmeans;
    DensityConfig density;
    float epsilon = 1e-6f;  // reward floor

    // Throws std::invalid_argument describing the first bad field.
    void validate() const;
};

MetricKind parse_metric_kind(const std::string& s);        // euclidean | learned
InitStrategy parse_init_strategy(const std::string& s);    // random | farthest-point
DensityMode parse_density_mode(const std::string& s);      // discrete | smoothed
DuplicatePolicy parse_duplicate_policy(const std::string& s);  // fail | duplicate

const char* to_string(MetricKind v);
const char* to_string(InitStrategy v);
const char* to_string(DensityMode v);
const char* to_string(DuplicatePolicy v);

/**
 * Overrides fields from ENTROPIX_* environment variables when set:
 *   ENTROPIX_K, ENTROPIX_SEED, ENTROPIX_EPSILON, ENTROPIX_METRIC,
 *   ENTROPIX_INIT, ENTROPIX_ON_INSUFFICIENT, ENTROPIX_DENSITY_MODE,
 *   ENTROPIX_NEIGHBORS, ENTROPIX_MINIBATCH, ENTROPIX_BALANCING,
 *   ENTROPIX_THREADS, ENTROPIX_VERBOSE.
 * Throws std::invalid_argument on unparsable values.
 */
void apply_env_overrides(EstimatorConfig& cfg);

// One-line summary for logs.
std::string describe(const EstimatorConfig& cfg);

}  // namespace entropix

#endif  // ENTROPIX_CONFIG_HPP
