#include "entropix/reward.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>

namespace entropix {

RewardEstimator::RewardEstimator(float epsilon) : epsilon_(epsilon) {
    if (!(epsilon > 0.0f) || !std::isfinite(epsilon))
        throw std::invalid_argument("RewardEstimator: epsilon must be a finite positive value");
}

float RewardEstimator::reward(float density) const {
    // Clamp into [0, 1] so out-of-range inputs stay finite and non-negative.
    double p = density;
    if (!(p > 0.0)) p = 0.0;
    if (p > 1.0) p = 1.0;
    const double eps = epsilon_;
    return static_cast<float>(-std::log((p + eps) / (1.0 + eps)));
}

std::vector<float> RewardEstimator::rewards(const std::vector<float>& densities) const {
    std::vector<float> out(densities.size());
    for (size_t i = 0; i < densities.size(); ++i) out[i] = reward(densities[i]);
    return out;
}

double entropy(const std::vector<float>& masses) {
    double h = 0.0;
    for (float p : masses)
        if (p > 0.0f) h -= static_cast<double>(p) * std::log(static_cast<double>(p));
    return h;
}

double entropy(const std::vector<uint64_t>& counts) {
    const uint64_t total = std::accumulate(counts.begin(), counts.end(), uint64_t(0));
    if (total == 0) return 0.0;
    double h = 0.0;
    for (uint64_t c : counts) {
        if (c == 0) continue;
        const double p = static_cast<double>(c) / static_cast<double>(total);
        h -= p * std::log(p);
    }
    return h;
}

double batch_entropy(const std::vector<int>& assignment, size_t k) {
    std::vector<uint64_t> counts(k, 0);
    for (int l : assignment) {
        if (l < 0 || static_cast<size_t>(l) >= k)
            throw std::out_of_range("batch_entropy: label out of range");
        counts[static_cast<size_t>(l)]++;
    }
    return entropy(counts);
}

double entropy_gain(const std::vector<uint64_t>& before,
                    const std::vector<uint64_t>& after) {
    return entropy(after) - entropy(before);
}

}  // namespace entropix
