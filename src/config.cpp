#include "entropix/config.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace entropix {

void EstimatorConfig::validate() const {
    if (kmeans.k == 0)
        throw std::invalid_argument("config: k must be >= 1");
    if (!(epsilon > 0.0f) || !std::isfinite(epsilon))
        throw std::invalid_argument("config: epsilon must be a finite positive value");
    if (kmeans.balancing_strength < 0.0f)
        throw std::invalid_argument("config: balancing_strength must be >= 0");
    if (kmeans.minibatch_size == 1)
        throw std::invalid_argument("config: minibatch_size must be 0 or >= 2");
    if (kmeans.num_threads < 0)
        throw std::invalid_argument("config: num_threads must be >= 0");
    if (density.mode == DensityMode::Smoothed && density.smoothing_neighbors == 0)
        throw std::invalid_argument("config: smoothing_neighbors must be >= 1");
    if (density.bootstrap_density < 0.0f || density.bootstrap_density > 1.0f)
        throw std::invalid_argument("config: bootstrap_density must be in [0, 1]");
    if (!(density.bandwidth >= 0.0f) || !std::isfinite(density.bandwidth))
        throw std::invalid_argument("config: bandwidth must be >= 0");
    const auto& d = kmeans.distance;
    if (d.metric == MetricKind::Learned && !d.weights.empty() && d.rank == 0)
        throw std::invalid_argument("config: learned metric weights need a rank");
    if (d.metric == MetricKind::Euclidean && !d.weights.empty())
        throw std::invalid_argument("config: weights given for euclidean metric");
}

MetricKind parse_metric_kind(const std::string& s) {
    if (s == "euclidean") return MetricKind::Euclidean;
    if (s == "learned") return MetricKind::Learned;
    throw std::invalid_argument("unknown distance metric '" + s + "'");
}

InitStrategy parse_init_strategy(const std::string& s) {
    if (s == "random") return InitStrategy::Random;
    if (s == "farthest-point" || s == "kmeans++") return InitStrategy::FarthestPoint;
    throw std::invalid_argument("unknown init strategy '" + s + "'");
}

DensityMode parse_density_mode(const std::string& s) {
    if (s == "discrete") return DensityMode::Discrete;
    if (s == "smoothed") return DensityMode::Smoothed;
    throw std::invalid_argument("unknown density mode '" + s + "'");
}

DuplicatePolicy parse_duplicate_policy(const std::string& s) {
    if (s == "fail") return DuplicatePolicy::Fail;
    if (s == "duplicate") return DuplicatePolicy::Duplicate;
    throw std::invalid_argument("unknown duplicate policy '" + s + "'");
}

const char* to_string(MetricKind v) {
    return v == MetricKind::Euclidean ? "euclidean" : "learned";
}

const char* to_string(InitStrategy v) {
    return v == InitStrategy::Random ? "random" : "farthest-point";
}

const char* to_string(DensityMode v) {
    return v == DensityMode::Discrete ? "discrete" : "smoothed";
}

const char* to_string(DuplicatePolicy v) {
    return v == DuplicatePolicy::Fail ? "fail" : "duplicate";
}

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

unsigned long env_ulong(const char* name, const char* v) {
    try {
        size_t pos = 0;
        unsigned long out = std::stoul(v, &pos);
        if (v[pos] != '\0') throw std::invalid_argument(v);
        return out;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + ": expected an unsigned integer, got '" + v + "'");
    }
}

float env_float(const char* name, const char* v) {
    try {
        size_t pos = 0;
        float out = std::stof(v, &pos);
        if (v[pos] != '\0') throw std::invalid_argument(v);
        return out;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + ": expected a number, got '" + v + "'");
    }
}

}  // namespace

void apply_env_overrides(EstimatorConfig& cfg) {
    if (const char* v = env("ENTROPIX_K"))
        cfg.kmeans.k = env_ulong("ENTROPIX_K", v);
    if (const char* v = env("ENTROPIX_SEED"))
        cfg.kmeans.seed = static_cast<unsigned>(env_ulong("ENTROPIX_SEED", v));
    if (const char* v = env("ENTROPIX_EPSILON"))
        cfg.epsilon = env_float("ENTROPIX_EPSILON", v);
    if (const char* v = env("ENTROPIX_METRIC"))
        cfg.kmeans.distance.metric = parse_metric_kind(v);
    if (const char* v = env("ENTROPIX_INIT"))
        cfg.kmeans.init.strategy = parse_init_strategy(v);
    if (const char* v = env("ENTROPIX_ON_INSUFFICIENT"))
        cfg.kmeans.init.on_insufficient = parse_duplicate_policy(v);
    if (const char* v = env("ENTROPIX_DENSITY_MODE"))
        cfg.density.mode = parse_density_mode(v);
    if (const char* v = env("ENTROPIX_NEIGHBORS"))
        cfg.density.smoothing_neighbors = env_ulong("ENTROPIX_NEIGHBORS", v);
    if (const char* v = env("ENTROPIX_MINIBATCH"))
        cfg.kmeans.minibatch_size = env_ulong("ENTROPIX_MINIBATCH", v);
    if (const char* v = env("ENTROPIX_BALANCING"))
        cfg.kmeans.balancing_strength = env_float("ENTROPIX_BALANCING", v);
    if (const char* v = env("ENTROPIX_THREADS"))
        cfg.kmeans.num_threads = static_cast<int>(env_ulong("ENTROPIX_THREADS", v));
    if (const char* v = env("ENTROPIX_VERBOSE"))
        cfg.kmeans.verbose = std::string(v) != "0";
}

std::string describe(const EstimatorConfig& cfg) {
    char buf[256];
    std::snprintf(buf, sizeof(buf),
                  "k=%zu metric=%s init=%s%s density=%s m=%zu eps=%g "
                  "minibatch=%zu kappa=%g seed=%u threads=%d",
                  cfg.kmeans.k, to_string(cfg.kmeans.distance.metric),
                  to_string(cfg.kmeans.init.strategy),
                  cfg.kmeans.init.greedy ? "(greedy)" : "",
                  to_string(cfg.density.mode), cfg.density.smoothing_neighbors,
                  static_cast<double>(cfg.epsilon), cfg.kmeans.minibatch_size,
                  static_cast<double>(cfg.kmeans.balancing_strength),
                  cfg.kmeans.seed, cfg.kmeans.num_threads);
    return buf;
}

}  // namespace entropix
