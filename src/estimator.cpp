#include "entropix/estimator.hpp"
#include "entropix/log.hpp"

#include <utility>

namespace entropix {

namespace {

const EstimatorConfig& validated(const EstimatorConfig& cfg) {
    cfg.validate();
    return cfg;
}

}  // namespace

Estimator::Estimator(const EstimatorConfig& cfg, int dim)
    : cfg_(validated(cfg)),
      kmeans_(cfg.kmeans, dim),
      density_(cfg.density),
      reward_(cfg.epsilon) {
    if (cfg_.kmeans.verbose)
        ENTROPIX_LOG_INFO("estimator dim=%d %s", dim, describe(cfg_).c_str());
}

std::unique_ptr<Estimator> Estimator::initialize(const float* first_batch, size_t n,
                                                 int dim, const EstimatorConfig& cfg) {
    auto est = std::make_unique<Estimator>(cfg, dim);
    est->initialize(first_batch, n, dim);
    return est;
}

void Estimator::initialize(const float* first_batch, size_t n, int dim) {
    kmeans_.initialize(first_batch, n, dim);
}

void Estimator::reseed(const float* batch, size_t n, int dim) {
    kmeans_.reseed(batch, n, dim);
}

std::optional<UpdateResult> Estimator::update(const float* batch, size_t n, int dim) {
    return kmeans_.update(batch, n, dim);
}

std::optional<SimulatedUpdate> Estimator::simulate_update(const float* batch, size_t n,
                                                          int dim) const {
    std::shared_ptr<const CentroidSnapshot> after;
    auto res = kmeans_.simulate(batch, n, dim, &after);
    if (!res) return std::nullopt;

    // Pre-update counts of the exact state the simulation started from.
    std::vector<uint64_t> before(res->counts.size());
    for (size_t c = 0; c < before.size(); ++c)
        before[c] = res->counts[c] - res->batch_counts[c];

    SimulatedUpdate sim;
    sim.entropy_gain = entropy_gain(before, res->counts);
    sim.result = std::move(*res);
    sim.after = std::move(after);
    return sim;
}

std::vector<float> Estimator::density(const float* points, size_t n, int dim) const {
    auto snap = kmeans_.snapshot();
    return density_.density(*snap, points, n, dim);
}

std::vector<float> Estimator::reward(const float* points, size_t n, int dim) const {
    return reward_.rewards(density(points, n, dim));
}

AssignResult Estimator::assign(const float* points, size_t n, int dim) const {
    return kmeans_.assign(points, n, dim);
}

double Estimator::entropy() const {
    auto snap = kmeans_.snapshot();
    return entropix::entropy(snap->occupancy.counts());
}

double Estimator::batch_entropy(const float* points, size_t n, int dim) const {
    auto res = kmeans_.assign(points, n, dim);
    return entropix::batch_entropy(res.labels, k());
}

ClusterReport Estimator::cluster_report(const float* points, size_t n, int dim) const {
    auto snap = kmeans_.snapshot();
    return entropix::cluster_report(*snap, assign_to_snapshot(*snap, points, n, dim));
}

std::shared_ptr<const CentroidSnapshot> Estimator::snapshot() const {
    return kmeans_.snapshot();
}

void Estimator::restore(const CentroidSnapshot& snap) {
    kmeans_.restore(snap);
}

void Estimator::reset() {
    kmeans_.reset();
}

void Estimator::set_metric_weights(std::vector<float> weights, size_t rank) {
    kmeans_.set_metric_weights(std::move(weights), rank);
}

}  // namespace entropix
