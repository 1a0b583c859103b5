#include "entropix/distance.hpp"
#include "entropix/errors.hpp"

#include <algorithm>
#include <cblas.h>
#include <cfloat>
#include <limits>
#include <omp.h>
#include <stdexcept>
#include <string>
#include <utility>

// OpenBLAS names the BLAS index type blasint.
#ifndef CBLAS_INT
#define CBLAS_INT blasint
#endif

namespace entropix {

namespace {

inline int resolve_threads(int requested) {
    return requested > 0 ? requested : omp_get_max_threads();
}

inline CBLAS_INT blas_size(size_t v, const char* what) {
    if (v > static_cast<size_t>(std::numeric_limits<CBLAS_INT>::max()))
        throw std::invalid_argument(std::string("distance: ") + what +
                                    " exceeds the BLAS index range");
    return static_cast<CBLAS_INT>(v);
}

// ||x - c||^2 from coordinate differences. squared_l2_naive uses the same
// loop, so refined entries match it bit for bit.
inline float diff_sqnorm(const float* x, const float* c, int dim) {
    float d2 = 0.0f;
    for (int j = 0; j < dim; ++j) {
        float d = x[j] - c[j];
        d2 += d * d;
    }
    return d2;
}

// dst = src - mean row by row; returns each row's squared norm (double sum).
inline float center_row(const float* src, const double* mean, int dim, float* dst) {
    double s = 0.0;
    for (int j = 0; j < dim; ++j) {
        const float v = static_cast<float>(static_cast<double>(src[j]) - mean[j]);
        dst[j] = v;
        s += static_cast<double>(v) * v;
    }
    return static_cast<float>(s);
}

// Y = X * W^T, X is n x dim, W is rank x dim, Y is n x rank.
void project(const float* x, size_t n, int dim, const float* w, size_t rank,
             std::vector<float>& y) {
    y.resize(n * rank);
    cblas_sgemm(CblasRowMajor, CblasNoTrans, CblasTrans,
                blas_size(n, "rows"),
                blas_size(rank, "rank"),
                static_cast<CBLAS_INT>(dim),
                1.0f,
                x, static_cast<CBLAS_INT>(dim),
                w, static_cast<CBLAS_INT>(dim),
                0.0f,
                y.data(), blas_size(rank, "rank"));
}

}  // namespace

void squared_l2_expanded(const float* points, size_t n,
                         const float* centroids, size_t k, int dim,
                         DistanceWorkspace& ws, std::vector<float>& out,
                         int num_threads) {
    out.resize(n * k);
    if (n == 0 || k == 0) return;

    const int nt = resolve_threads(num_threads);
    const size_t d = static_cast<size_t>(dim);

    // Shift both sides by the centroid mean m. Distances are unchanged and
    // the norms below stay on the scale of the data spread.
    std::vector<double> mean(d, 0.0);
    for (size_t c = 0; c < k; ++c)
        for (size_t j = 0; j < d; ++j) mean[j] += centroids[c * d + j];
    for (size_t j = 0; j < d; ++j) mean[j] /= static_cast<double>(k);

    ws.centered_centroids.resize(k * d);
    ws.centroid_norms.resize(k);
    float max_centroid_norm = 0.0f;
    for (size_t c = 0; c < k; ++c) {
        ws.centroid_norms[c] = center_row(centroids + c * d, mean.data(), dim,
                                          ws.centered_centroids.data() + c * d);
        max_centroid_norm = std::max(max_centroid_norm, ws.centroid_norms[c]);
    }

    ws.centered_points.resize(n * d);
    ws.point_norms.resize(n);
    #pragma omp parallel for schedule(static) num_threads(nt)
    for (size_t i = 0; i < n; ++i)
        ws.point_norms[i] = center_row(points + i * d, mean.data(), dim,
                                       ws.centered_points.data() + i * d);

    // out[i,c] = -2 * (x_i - m) . (c_c - m)
    cblas_sgemm(CblasRowMajor, CblasNoTrans, CblasTrans,
                blas_size(n, "rows"),
                blas_size(k, "centroids"),
                static_cast<CBLAS_INT>(dim),
                -2.0f,
                ws.centered_points.data(), static_cast<CBLAS_INT>(dim),
                ws.centered_centroids.data(), static_cast<CBLAS_INT>(dim),
                0.0f,
                out.data(), blas_size(k, "centroids"));

    // Rounding in the expansion is bounded by a few ulps of
    // (||x - m||^2 + ||c - m||^2) per term and grows with dim.
    const float rel_tol = 4.0f * static_cast<float>(dim + 2) * FLT_EPSILON;

    #pragma omp parallel for schedule(static) num_threads(nt)
    for (size_t i = 0; i < n; ++i) {
        float* row = out.data() + i * k;
        const double pn = ws.point_norms[i];
        float row_min = std::numeric_limits<float>::max();
        for (size_t c = 0; c < k; ++c) {
            const double v = static_cast<double>(row[c]) + pn + ws.centroid_norms[c];
            row[c] = v > 0.0 ? static_cast<float>(v) : 0.0f;
            row_min = std::min(row_min, row[c]);
        }

        // Anything that could still be the nearest centroid is recomputed
        // exactly, so the row arg-min never depends on cancellation.
        const float limit = row_min + rel_tol * (static_cast<float>(pn) + max_centroid_norm);
        const float* x = points + i * d;
        for (size_t c = 0; c < k; ++c)
            if (row[c] <= limit) row[c] = diff_sqnorm(x, centroids + c * d, dim);
    }
}

void squared_l2_naive(const float* points, size_t n,
                      const float* centroids, size_t k, int dim,
                      std::vector<float>& out) {
    out.resize(n * k);
    for (size_t i = 0; i < n; ++i) {
        const float* x = points + i * dim;
        for (size_t c = 0; c < k; ++c)
            out[i * k + c] = diff_sqnorm(x, centroids + c * dim, dim);
    }
}

// ============== EuclideanMetric ==============

EuclideanMetric::EuclideanMetric(int dim, int num_threads)
    : dim_(dim), num_threads_(num_threads) {
    if (dim <= 0)
        throw std::invalid_argument("EuclideanMetric: dim must be positive");
}

void EuclideanMetric::pairwise(const float* points, size_t n,
                               const float* centroids, size_t k, int dim,
                               DistanceWorkspace& ws,
                               std::vector<float>& out) const {
    if (dim != dim_) throw DimensionMismatchError(dim_, dim);
    squared_l2_expanded(points, n, centroids, k, dim, ws, out, num_threads_);
}

std::unique_ptr<DistanceMetric> EuclideanMetric::clone() const {
    return std::make_unique<EuclideanMetric>(*this);
}

// ============== LinearMetric ==============

LinearMetric::LinearMetric(int dim, int num_threads)
    : dim_(dim), num_threads_(num_threads), rank_(0) {
    if (dim <= 0)
        throw std::invalid_argument("LinearMetric: dim must be positive");
    std::vector<float> eye(static_cast<size_t>(dim) * dim, 0.0f);
    for (int j = 0; j < dim; ++j) eye[static_cast<size_t>(j) * dim + j] = 1.0f;
    set_weights(std::move(eye), static_cast<size_t>(dim));
}

LinearMetric::LinearMetric(int dim, std::vector<float> weights, size_t rank,
                           int num_threads)
    : dim_(dim), num_threads_(num_threads), rank_(0) {
    if (dim <= 0)
        throw std::invalid_argument("LinearMetric: dim must be positive");
    set_weights(std::move(weights), rank);
}

void LinearMetric::set_weights(std::vector<float> weights, size_t rank) {
    if (rank == 0 || weights.size() != rank * static_cast<size_t>(dim_))
        throw std::invalid_argument(
            "LinearMetric::set_weights: expected rank * dim weights");
    weights_ = std::move(weights);
    rank_ = rank;
}

void LinearMetric::pairwise(const float* points, size_t n,
                            const float* centroids, size_t k, int dim,
                            DistanceWorkspace& ws,
                            std::vector<float>& out) const {
    if (dim != dim_) throw DimensionMismatchError(dim_, dim);
    if (n == 0 || k == 0) {
        out.resize(n * k);
        return;
    }
    project(points, n, dim, weights_.data(), rank_, ws.projected_points);
    project(centroids, k, dim, weights_.data(), rank_, ws.projected_centroids);
    squared_l2_expanded(ws.projected_points.data(), n,
                        ws.projected_centroids.data(), k,
                        static_cast<int>(rank_), ws, out, num_threads_);
}

std::unique_ptr<DistanceMetric> LinearMetric::clone() const {
    return std::make_unique<LinearMetric>(*this);
}

std::unique_ptr<DistanceMetric> make_metric(const DistanceConfig& cfg, int dim) {
    switch (cfg.metric) {
        case MetricKind::Euclidean:
            return std::make_unique<EuclideanMetric>(dim, cfg.num_threads);
        case MetricKind::Learned:
            if (cfg.weights.empty())
                return std::make_unique<LinearMetric>(dim, cfg.num_threads);
            return std::make_unique<LinearMetric>(dim, cfg.weights, cfg.rank,
                                                  cfg.num_threads);
    }
    throw std::invalid_argument("make_metric: unknown metric kind");
}

}  // namespace entropix
