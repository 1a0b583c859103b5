#ifndef ENTROPIX_REWARD_HPP
#define ENTROPIX_REWARD_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace entropix {

/**
 * Exploration bonus from visitation density.
 *
 *   reward(p) = -log((p + eps) / (1 + eps))
 *
 * Strictly decreasing in p, 0 at p = 1, log(1 + 1/eps) at p = 0, so finite
 * and non-negative for every density in [0, 1].
 */
class RewardEstimator {
public:
    explicit RewardEstimator(float epsilon = 1e-6f);

    float reward(float density) const;
    std::vector<float> rewards(const std::vector<float>& densities) const;

    // Largest possible bonus, reached at density 0.
    float max_reward() const { return reward(0.0f); }
    float epsilon() const { return epsilon_; }

private:
    float epsilon_;
};

// -sum p log p over the non-zero entries of a mass vector.
double entropy(const std::vector<float>& masses);

// Entropy of a count histogram (0 when the histogram is empty).
double entropy(const std::vector<uint64_t>& counts);

// Entropy of a batch's empirical cluster distribution.
double batch_entropy(const std::vector<int>& assignment, size_t k);

// Occupancy entropy after minus before.
double entropy_gain(const std::vector<uint64_t>& before,
                    const std::vector<uint64_t>& after);

}  // namespace entropix

#endif  // ENTROPIX_REWARD_HPP
