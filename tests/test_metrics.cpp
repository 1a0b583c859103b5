#include <gtest/gtest.h>
#include "entropix/data_generator.hpp"
#include "entropix/estimator.hpp"
#include "entropix/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace entropix;

namespace {

// Streams n points through a fresh estimator in fixed batches.
std::unique_ptr<Estimator> stream_points(const std::vector<float>& data, size_t n,
                                         int dim, size_t k, size_t batch) {
    EstimatorConfig cfg;
    cfg.kmeans.k = k;
    cfg.kmeans.seed = 42;
    auto est = Estimator::initialize(data.data(), batch, dim, cfg);
    for (size_t start = 0; start < n; start += batch) {
        const size_t len = std::min(batch, n - start);
        est->update(data.data() + start * dim, len, dim);
    }
    return est;
}

CentroidSnapshot two_centroids() {
    CentroidSnapshot snap;
    snap.k = 2;
    snap.dim = 2;
    snap.centroids = {1.0f, 0.0f, 10.0f, 11.0f};
    snap.occupancy = OccupancyStats(std::vector<uint64_t>{3, 1});
    snap.version = 4;
    snap.metric = std::make_shared<EuclideanMetric>(2);
    return snap;
}

}  // namespace

// 1. Health helpers on known counts.
TEST(ClusterMetrics, CountHelpers) {
    std::vector<uint64_t> counts = {10, 0, 30, 20};
    EXPECT_EQ(count_empty_clusters(counts), 1);
    EXPECT_FLOAT_EQ(compute_imbalance_ratio(counts), 0.0f);  // an empty cluster
    EXPECT_FLOAT_EQ(compute_imbalance_ratio({10, 30, 20}), 3.0f);
    EXPECT_NEAR(compute_cluster_size_stddev({10, 30, 20}), std::sqrt(200.0 / 3.0), 1e-4);
    EXPECT_FLOAT_EQ(compute_cluster_size_stddev({}), 0.0f);
}

// 2. Report on a hand-built snapshot: every sample row sits at distance 1.
TEST(ClusterMetrics, ReportOnKnownSnapshot) {
    const auto snap = two_centroids();
    std::vector<float> sample = {0, 0, 2, 0, 10, 10, 10, 12};
    auto assigned = assign_to_snapshot(snap, sample.data(), 4, 2);
    EXPECT_EQ(assigned.labels, (std::vector<int>{0, 0, 1, 1}));

    auto report = cluster_report(snap, assigned);
    ASSERT_EQ(report.clusters.size(), 2u);
    EXPECT_DOUBLE_EQ(report.batch_inertia, 4.0);
    EXPECT_EQ(report.total_visits, 4u);
    EXPECT_EQ(report.unvisited, 0);
    EXPECT_FLOAT_EQ(report.imbalance_ratio, 3.0f);
    EXPECT_NEAR(report.occupancy_entropy,
                -(0.75 * std::log(0.75) + 0.25 * std::log(0.25)), 1e-9);

    EXPECT_EQ(report.clusters[0].visits, 3u);
    EXPECT_EQ(report.clusters[0].batch_count, 2u);
    EXPECT_FLOAT_EQ(report.clusters[0].mean_dist, 1.0f);
    EXPECT_FLOAT_EQ(report.clusters[1].radius_ratio, 1.0f);
}

TEST(ClusterMetrics, ReportRejectsForeignAssignment) {
    const auto snap = two_centroids();
    AssignResult bad;
    bad.labels = {0, 2};
    bad.distances = {0.0f, 0.0f};
    EXPECT_THROW(cluster_report(snap, bad), std::invalid_argument);

    bad.labels = {0};
    EXPECT_THROW(cluster_report(snap, bad), std::invalid_argument);

    // An empty sample still reports occupancy.
    auto empty = cluster_report(snap, AssignResult{});
    EXPECT_EQ(empty.total_visits, 4u);
    EXPECT_EQ(empty.clusters[0].batch_count, 0u);
    EXPECT_FLOAT_EQ(empty.clusters[0].min_dist, 0.0f);
}

// 3. Radius sanity: max_dist >= min_dist for every sampled cluster.
TEST(ClusterMetrics, RadiusSanity) {
    const int dim = 16;
    const size_t n = 5000, k = 10;
    auto data = MixtureStream(dim, 5, 222).next(n);
    auto est = stream_points(data, n, dim, k, 500);

    auto report = est->cluster_report(data.data(), n, dim);
    ASSERT_EQ(report.clusters.size(), k);
    size_t sampled = 0;
    for (size_t c = 0; c < k; ++c) {
        sampled += report.clusters[c].batch_count;
        if (report.clusters[c].batch_count == 0) continue;
        EXPECT_GE(report.clusters[c].max_dist, report.clusters[c].min_dist)
            << "max_dist must be >= min_dist for cluster " << c;
    }
    EXPECT_EQ(sampled, n);
    EXPECT_EQ(report.total_visits, n);
}

// 4. Points far from everything visited earn more than any visited point.
TEST(ClusterMetrics, OutliersEarnLargerReward) {
    const int dim = 16;
    const size_t n = 5000, k = 10;
    const int n_outliers = 10;
    auto data = MixtureStream(dim, 10, 444).next(n);
    auto est = stream_points(data, n, dim, k, 500);

    auto normal = est->reward(data.data(), n, dim);
    float max_normal = 0.0f;
    for (float r : normal) max_normal = std::max(max_normal, r);

    std::vector<float> outliers(static_cast<size_t>(n_outliers) * dim);
    for (int o = 0; o < n_outliers; ++o) {
        float* row = outliers.data() + static_cast<size_t>(o) * dim;
        for (int j = 0; j < dim; ++j)
            row[j] = 500.0f + static_cast<float>(o * 200 + j);
    }
    auto far = est->reward(outliers.data(), n_outliers, dim);
    for (int o = 0; o < n_outliers; ++o)
        EXPECT_GT(far[o], max_normal)
            << "Outlier " << o << " should out-earn every visited point";
}

// 5. Streaming keeps most centroids in use on well-spread data.
TEST(ClusterMetrics, FewUnvisitedCentroids) {
    const int dim = 8;
    const size_t n = 10000, k = 20;
    auto data = MixtureStream(dim, 20, 111).next(n);
    auto est = stream_points(data, n, dim, k, 1000);

    auto report = est->cluster_report(data.data(), 1000, dim);
    EXPECT_LE(report.unvisited, 2);
    EXPECT_EQ(report.total_visits, n);
    EXPECT_GT(report.occupancy_entropy, 0.0);
}

// ============== Samplers ==============

TEST(DataGenerator, MixtureStreamDeterministic) {
    MixtureStream a(4, 3, 7), b(4, 3, 7);
    auto first = a.next(100);
    EXPECT_EQ(first.size(), 400u);
    EXPECT_EQ(first, b.next(100));
    EXPECT_NE(a.next(100), first) << "successive batches must differ";

    EXPECT_THROW(MixtureStream(0, 3, 7), std::invalid_argument);
    EXPECT_THROW(MixtureStream(4, 0, 7), std::invalid_argument);
    EXPECT_THROW(a.set_weights({1.0, 1.0}), std::invalid_argument);
    EXPECT_THROW(a.set_weights({0.0, 0.0, 0.0}), std::invalid_argument);
    EXPECT_THROW(a.set_weights({1.0, -1.0, 1.0}), std::invalid_argument);
}

// Weighting a single component confines the stream to it, and the mixture
// pdf reduces to that component's Gaussian.
TEST(DataGenerator, MixtureWeightsAndPdf) {
    const int dim = 3;
    MixtureStream stream(dim, 4, 11);
    stream.set_weights({0.0, 0.0, 1.0, 0.0});

    const size_t n = 4000;
    auto rows = stream.next(n);
    std::vector<double> mean(dim, 0.0);
    for (size_t i = 0; i < n; ++i)
        for (int d = 0; d < dim; ++d) mean[d] += rows[i * dim + d];
    for (int d = 0; d < dim; ++d)
        EXPECT_NEAR(mean[d] / n, stream.centre(2)[d], 0.15) << "coordinate " << d;

    const std::vector<float> centre(stream.centre(2), stream.centre(2) + dim);
    EXPECT_NEAR(stream.pdf(centre.data()), gaussian_pdf(centre.data(), centre, stream.scale(2)),
                1e-12);

    std::vector<float> far = {1000.0f, 1000.0f, 1000.0f};
    EXPECT_LT(stream.pdf(far.data()), stream.pdf(centre.data()));
}

TEST(DataGenerator, BoxAndGaussianSamplers) {
    auto box = sample_uniform_box(200, 3, -1.0f, 2.0f, 5);
    for (float v : box) {
        EXPECT_GE(v, -1.0f);
        EXPECT_LE(v, 2.0f);
    }
    EXPECT_THROW(sample_uniform_box(10, 2, 1.0f, 1.0f, 5), std::invalid_argument);
    EXPECT_THROW(sample_gaussian(10, {}, 1.0f, 5), std::invalid_argument);
}

TEST(DataGenerator, ReferenceDensities) {
    std::vector<float> inside = {0.5f, 0.5f}, outside = {1.5f, 0.5f};
    EXPECT_DOUBLE_EQ(uniform_box_pdf(inside.data(), 2, 0.0f, 1.0f), 1.0);
    EXPECT_DOUBLE_EQ(uniform_box_pdf(outside.data(), 2, 0.0f, 1.0f), 0.0);
    EXPECT_NEAR(uniform_box_pdf(inside.data(), 2, 0.0f, 2.0f), 0.25, 1e-12);

    const double pi = 3.14159265358979323846;
    std::vector<float> origin = {0.0f}, one = {1.0f};
    const std::vector<float> mean = {0.0f};
    EXPECT_NEAR(gaussian_pdf(origin.data(), mean, 1.0f), 1.0 / std::sqrt(2.0 * pi), 1e-9);
    EXPECT_NEAR(gaussian_pdf(one.data(), mean, 1.0f),
                std::exp(-0.5) / std::sqrt(2.0 * pi), 1e-9);
}
