#ifndef ENTROPIX_DATA_GENERATOR_HPP
#define ENTROPIX_DATA_GENERATOR_HPP

#include <cstddef>
#include <random>
#include <vector>

namespace entropix {

// Synthetic state streams for tests and benchmarks. All outputs are
// row-major n x dim float32.

/**
 * A fixed mixture of isotropic Gaussians standing in for the states an agent
 * visits. Centres are uniform in [-spread, spread]^dim with a per-component
 * scale in [0.5, 2]; each call to next() draws a fresh batch from the same
 * mixture, so successive batches look like one ongoing trajectory.
 */
class MixtureStream {
public:
    MixtureStream(int dim, int components, unsigned seed, float spread = 10.0f);

    std::vector<float> next(size_t n);

    // Relative visit frequency per component. Zero entries are allowed, a
    // zero or negative total is not.
    void set_weights(const std::vector<double>& weights);

    // True mixture density at x, the ground truth visited-state density.
    double pdf(const float* x) const;

    int dim() const { return dim_; }
    int components() const { return static_cast<int>(scales_.size()); }
    const float* centre(int g) const { return centres_.data() + static_cast<size_t>(g) * dim_; }
    float scale(int g) const { return scales_[static_cast<size_t>(g)]; }

private:
    int dim_;
    std::vector<float> centres_;   // components x dim
    std::vector<float> scales_;
    std::vector<double> weights_;  // normalized
    std::mt19937 rng_;
    std::discrete_distribution<int> pick_;
    std::normal_distribution<float> noise_;
};

// Uniform samples in the box [low, high]^dim.
std::vector<float> sample_uniform_box(size_t n, int dim, float low, float high,
                                      unsigned seed);

// Isotropic Gaussian samples around `mean` (dim entries) with stddev `std`.
std::vector<float> sample_gaussian(size_t n, const std::vector<float>& mean,
                                   float std, unsigned seed);

// True densities of the two samplers above, for checking estimated density
// ordering against ground truth.
double uniform_box_pdf(const float* x, int dim, float low, float high);
double gaussian_pdf(const float* x, const std::vector<float>& mean, float std);

}  // namespace entropix

#endif  // ENTROPIX_DATA_GENERATOR_HPP
