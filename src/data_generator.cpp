#include "entropix/data_generator.hpp"

#include <cmath>
#include <random>
#include <stdexcept>

namespace entropix {

namespace {

double isotropic_pdf(const float* x, const float* mean, size_t dim, float std) {
    const double s2 = static_cast<double>(std) * std;
    double d2 = 0.0;
    for (size_t d = 0; d < dim; ++d) {
        const double t = static_cast<double>(x[d]) - mean[d];
        d2 += t * t;
    }
    const double two_pi = 2.0 * 3.14159265358979323846;
    const double norm = std::pow(two_pi * s2, static_cast<double>(dim) / 2.0);
    return std::exp(-d2 / (2.0 * s2)) / norm;
}

}  // namespace

MixtureStream::MixtureStream(int dim, int components, unsigned seed, float spread)
    : dim_(dim), rng_(seed), noise_(0.0f, 1.0f) {
    if (dim <= 0 || components <= 0 || !(spread > 0.0f))
        throw std::invalid_argument("MixtureStream: invalid parameters");

    std::uniform_real_distribution<float> centre_dist(-spread, spread);
    std::uniform_real_distribution<float> scale_dist(0.5f, 2.0f);
    centres_.resize(static_cast<size_t>(components) * dim);
    scales_.resize(static_cast<size_t>(components));
    for (int g = 0; g < components; ++g) {
        scales_[g] = scale_dist(rng_);
        for (int d = 0; d < dim; ++d)
            centres_[static_cast<size_t>(g) * dim + d] = centre_dist(rng_);
    }
    set_weights(std::vector<double>(static_cast<size_t>(components), 1.0));
}

void MixtureStream::set_weights(const std::vector<double>& weights) {
    if (weights.size() != scales_.size())
        throw std::invalid_argument("MixtureStream::set_weights: one weight per component");
    double total = 0.0;
    for (double w : weights) {
        if (!(w >= 0.0)) throw std::invalid_argument("MixtureStream::set_weights: negative weight");
        total += w;
    }
    if (!(total > 0.0))
        throw std::invalid_argument("MixtureStream::set_weights: weights sum to zero");

    weights_.resize(weights.size());
    for (size_t g = 0; g < weights.size(); ++g) weights_[g] = weights[g] / total;
    pick_ = std::discrete_distribution<int>(weights_.begin(), weights_.end());
}

std::vector<float> MixtureStream::next(size_t n) {
    std::vector<float> data(n * dim_);
    for (size_t i = 0; i < n; ++i) {
        const int g = pick_(rng_);
        const float* c = centre(g);
        const float s = scales_[static_cast<size_t>(g)];
        float* row = data.data() + i * dim_;
        for (int d = 0; d < dim_; ++d) row[d] = c[d] + s * noise_(rng_);
    }
    return data;
}

double MixtureStream::pdf(const float* x) const {
    double p = 0.0;
    for (size_t g = 0; g < weights_.size(); ++g) {
        if (weights_[g] == 0.0) continue;
        p += weights_[g] * isotropic_pdf(x, centre(static_cast<int>(g)),
                                         static_cast<size_t>(dim_), scales_[g]);
    }
    return p;
}

std::vector<float> sample_uniform_box(size_t n, int dim, float low, float high,
                                      unsigned seed) {
    if (dim <= 0 || !(low < high))
        throw std::invalid_argument("sample_uniform_box: invalid parameters");
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> u(low, high);
    std::vector<float> data(n * dim);
    for (auto& v : data) v = u(rng);
    return data;
}

std::vector<float> sample_gaussian(size_t n, const std::vector<float>& mean,
                                   float std, unsigned seed) {
    if (mean.empty() || !(std > 0.0f))
        throw std::invalid_argument("sample_gaussian: invalid parameters");
    const size_t dim = mean.size();
    std::mt19937 rng(seed);
    std::normal_distribution<float> noise(0.0f, std);
    std::vector<float> data(n * dim);
    for (size_t i = 0; i < n; ++i)
        for (size_t d = 0; d < dim; ++d)
            data[i * dim + d] = mean[d] + noise(rng);
    return data;
}

double uniform_box_pdf(const float* x, int dim, float low, float high) {
    for (int d = 0; d < dim; ++d)
        if (x[d] < low || x[d] > high) return 0.0;
    return 1.0 / std::pow(static_cast<double>(high - low), dim);
}

double gaussian_pdf(const float* x, const std::vector<float>& mean, float std) {
    return isotropic_pdf(x, mean.data(), mean.size(), std);
}

}  // namespace entropix
