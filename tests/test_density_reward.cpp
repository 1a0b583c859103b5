#include <gtest/gtest.h>
#include "entropix/data_generator.hpp"
#include "entropix/density.hpp"
#include "entropix/errors.hpp"
#include "entropix/reward.hpp"

#include <cmath>
#include <limits>
#include <memory>
#include <vector>

using namespace entropix;

namespace {

CentroidSnapshot two_centroids(uint64_t c0, uint64_t c1) {
    CentroidSnapshot snap;
    snap.k = 2;
    snap.dim = 2;
    snap.centroids = {0.0f, 0.0f, 10.0f, 10.0f};
    snap.occupancy = OccupancyStats(std::vector<uint64_t>{c0, c1});
    snap.version = 1;
    snap.metric = std::make_shared<EuclideanMetric>(2);
    return snap;
}

}  // namespace

// ============== Density ==============

TEST(Density, BootstrapBeforeAnyVisit) {
    auto snap = two_centroids(0, 0);
    std::vector<float> q = {0.0f, 0.0f, 3.0f, 4.0f, 50.0f, -50.0f};

    DensityEstimator by_k;
    auto d = by_k.density(snap, q.data(), 3, 2);
    ASSERT_EQ(d.size(), 3u);
    for (float v : d) EXPECT_FLOAT_EQ(v, 0.5f);

    DensityConfig cfg;
    cfg.bootstrap_density = 0.2f;
    DensityEstimator fixed(cfg);
    for (float v : fixed.density(snap, q.data(), 3, 2)) EXPECT_FLOAT_EQ(v, 0.2f);
}

TEST(Density, DiscreteIsNearestMass) {
    auto snap = two_centroids(3, 1);
    DensityConfig cfg;
    cfg.mode = DensityMode::Discrete;
    DensityEstimator est(cfg);

    std::vector<float> q = {1.0f, 1.0f, 9.0f, 9.0f};
    auto d = est.density(snap, q.data(), 2, 2);
    EXPECT_FLOAT_EQ(d[0], 0.75f);
    EXPECT_FLOAT_EQ(d[1], 0.25f);

    auto masses = est.cluster_masses(snap);
    EXPECT_FLOAT_EQ(masses[0], 0.75f);
    EXPECT_FLOAT_EQ(masses[1], 0.25f);
}

// Smoothed: sum of mass_j * h / (h + d_j) over the nearest centroids.
TEST(Density, SmoothedKernelValue) {
    auto snap = two_centroids(3, 1);
    DensityConfig cfg;
    cfg.bandwidth = 1.0f;
    DensityEstimator est(cfg);

    std::vector<float> q = {0.0f, 0.0f};
    auto d = est.density(snap, q.data(), 1, 2);
    const double far = std::sqrt(200.0);
    EXPECT_NEAR(d[0], 0.75 + 0.25 / (1.0 + far), 1e-5);
}

TEST(Density, SmoothedDecaysAwayFromCentroids) {
    auto snap = two_centroids(5, 5);
    DensityEstimator est;  // smoothed, automatic bandwidth

    std::vector<float> q = {0.0f, 0.0f, 2.0f, 2.0f, 5.0f, 5.0f, 40.0f, 40.0f};
    auto d = est.density(snap, q.data(), 4, 2);
    EXPECT_GT(d[0], d[1]);
    EXPECT_GT(d[1], d[2]);
    EXPECT_GT(d[2], d[3]);
}

TEST(Density, NeighboursClampedToK) {
    auto snap = two_centroids(3, 1);
    DensityConfig one;
    one.smoothing_neighbors = 1;
    one.bandwidth = 1.0f;
    DensityConfig many = one;
    many.smoothing_neighbors = 50;

    std::vector<float> q = {0.0f, 0.0f};
    EXPECT_FLOAT_EQ(DensityEstimator(one).density(snap, q.data(), 1, 2)[0], 0.75f);
    const float all = DensityEstimator(many).density(snap, q.data(), 1, 2)[0];
    EXPECT_NEAR(all, 0.75 + 0.25 / (1.0 + std::sqrt(200.0)), 1e-5);
}

TEST(Density, AutomaticBandwidth) {
    auto snap = two_centroids(1, 1);
    DensityEstimator est;
    EXPECT_NEAR(est.bandwidth(snap), 0.5 * std::sqrt(200.0), 1e-4);

    auto single = snap;
    single.k = 1;
    single.centroids.resize(2);
    single.occupancy = OccupancyStats(std::vector<uint64_t>{1});
    EXPECT_FLOAT_EQ(est.bandwidth(single), 1.0f);

    auto stacked = snap;
    stacked.centroids = {3.0f, 3.0f, 3.0f, 3.0f};
    EXPECT_FLOAT_EQ(est.bandwidth(stacked), 1.0f);

    DensityConfig cfg;
    cfg.bandwidth = 2.5f;
    EXPECT_FLOAT_EQ(DensityEstimator(cfg).bandwidth(snap), 2.5f);
}

TEST(Density, ValuesStayInUnitInterval) {
    const int dim = 3;
    const size_t k = 12;
    CentroidSnapshot snap;
    snap.k = k;
    snap.dim = dim;
    snap.centroids = sample_uniform_box(k, dim, -1.0f, 1.0f, 3);
    std::vector<uint64_t> counts(k);
    for (size_t c = 0; c < k; ++c) counts[c] = c * c + 1;
    snap.occupancy = OccupancyStats(counts);
    snap.metric = std::make_shared<EuclideanMetric>(dim);

    auto q = sample_uniform_box(500, dim, -3.0f, 3.0f, 4);
    for (auto mode : {DensityMode::Discrete, DensityMode::Smoothed}) {
        DensityConfig cfg;
        cfg.mode = mode;
        cfg.smoothing_neighbors = k;
        DensityEstimator est(cfg);
        for (float v : est.density(snap, q.data(), 500, dim)) {
            EXPECT_GE(v, 0.0f);
            EXPECT_LE(v, 1.0f);
        }
    }
}

TEST(Density, RejectsBadInput) {
    DensityConfig cfg;
    cfg.bandwidth = -1.0f;
    EXPECT_THROW(DensityEstimator{cfg}, std::invalid_argument);
    cfg.bandwidth = std::numeric_limits<float>::quiet_NaN();
    EXPECT_THROW(DensityEstimator{cfg}, std::invalid_argument);
    cfg = DensityConfig{};
    cfg.smoothing_neighbors = 0;
    EXPECT_THROW(DensityEstimator{cfg}, std::invalid_argument);
    cfg = DensityConfig{};
    cfg.bootstrap_density = 1.5f;
    EXPECT_THROW(DensityEstimator{cfg}, std::invalid_argument);

    auto snap = two_centroids(1, 1);
    std::vector<float> q(3, 0.0f);
    EXPECT_THROW(DensityEstimator().density(snap, q.data(), 1, 3),
                 DimensionMismatchError);
}

// ============== Reward ==============

TEST(Reward, FiniteNonNegativeAndDecreasing) {
    RewardEstimator r(1e-6f);
    EXPECT_TRUE(std::isfinite(r.reward(0.0f)));
    EXPECT_NEAR(r.reward(1.0f), 0.0f, 1e-6f);
    EXPECT_NEAR(r.max_reward(), std::log(1.0 + 1e6), 1e-3);

    float prev = r.reward(0.0f);
    for (int i = 1; i <= 100; ++i) {
        const float cur = r.reward(static_cast<float>(i) / 100.0f);
        EXPECT_LT(cur, prev) << "at density " << i / 100.0;
        EXPECT_GE(cur, 0.0f);
        prev = cur;
    }
}

TEST(Reward, ClampsOutOfRangeDensity) {
    RewardEstimator r;
    EXPECT_FLOAT_EQ(r.reward(-0.5f), r.reward(0.0f));
    EXPECT_FLOAT_EQ(r.reward(3.0f), r.reward(1.0f));
    EXPECT_FLOAT_EQ(r.reward(std::numeric_limits<float>::quiet_NaN()), r.max_reward());

    auto v = r.rewards({0.0f, 0.5f, 1.0f});
    ASSERT_EQ(v.size(), 3u);
    EXPECT_GT(v[0], v[1]);
    EXPECT_GT(v[1], v[2]);
}

TEST(Reward, RejectsBadEpsilon) {
    EXPECT_THROW(RewardEstimator(0.0f), std::invalid_argument);
    EXPECT_THROW(RewardEstimator(-1e-3f), std::invalid_argument);
    EXPECT_THROW(RewardEstimator(std::numeric_limits<float>::infinity()),
                 std::invalid_argument);
}

// ============== Entropy ==============

TEST(Entropy, KnownValues) {
    EXPECT_NEAR(entropy(std::vector<float>{0.5f, 0.5f}), std::log(2.0), 1e-6);
    EXPECT_NEAR(entropy(std::vector<float>{1.0f, 0.0f}), 0.0, 1e-9);
    EXPECT_NEAR(entropy(std::vector<uint64_t>{1, 1, 1, 1}), std::log(4.0), 1e-9);
    EXPECT_EQ(entropy(std::vector<uint64_t>{0, 0}), 0.0);
    EXPECT_EQ(entropy(std::vector<uint64_t>{}), 0.0);
}

TEST(Entropy, BatchAndGain) {
    EXPECT_NEAR(batch_entropy({0, 0, 1, 1}, 3), std::log(2.0), 1e-9);
    EXPECT_THROW(batch_entropy({0, 3}, 3), std::out_of_range);
    EXPECT_THROW(batch_entropy({-1}, 3), std::out_of_range);

    EXPECT_NEAR(entropy_gain({4, 0}, {4, 4}), std::log(2.0), 1e-9);
    EXPECT_LT(entropy_gain({4, 4}, {8, 4}), 0.0);
}
