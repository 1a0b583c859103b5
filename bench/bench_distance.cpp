#include "bench_utils.hpp"
#include "entropix/distance.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <omp.h>
#include <random>
#include <thread>
#include <vector>

using namespace entropix;
using namespace entropix::bench;

namespace {

void generate_synthetic(std::vector<float>& data, size_t n, int dim, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    data.resize(n * static_cast<size_t>(dim));
    for (auto& v : data) v = dist(rng);
}

float max_abs_diff(const std::vector<float>& a, const std::vector<float>& b) {
    float worst = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        float d = std::fabs(a[i] - b[i]);
        if (d > worst) worst = d;
    }
    return worst;
}

}  // namespace

// Usage: entropix_bench_distance [n] [dim] [k] [reps]
int main(int argc, char** argv) {
    size_t n = 20000;
    int dim = 64;
    size_t k = 256;
    int reps = 5;
    if (argc >= 2) n = static_cast<size_t>(std::atoi(argv[1]));
    if (argc >= 3) dim = std::atoi(argv[2]);
    if (argc >= 4) k = static_cast<size_t>(std::atoi(argv[3]));
    if (argc >= 5) reps = std::atoi(argv[4]);
    if (n == 0 || dim <= 0 || k == 0 || reps <= 0) {
        std::fprintf(stderr, "usage: %s [n] [dim] [k] [reps]\n", argv[0]);
        return 1;
    }

    int nthreads = static_cast<int>(std::thread::hardware_concurrency());
    if (nthreads <= 0) nthreads = 1;
    omp_set_num_threads(nthreads);
    std::printf("Threads: %d, N=%zu, D=%d, K=%zu\n\n", nthreads, n, dim, k);

    std::vector<float> points, centroids;
    generate_synthetic(points, n, dim, 12345u);
    generate_synthetic(centroids, k, dim, 54321u);

    // ---- Expanded-norm SGEMM kernel ----
    std::printf("==== Expanded (SGEMM) ====\n");
    DistanceWorkspace ws;
    std::vector<float> fast;
    squared_l2_expanded(points.data(), n, centroids.data(), k, dim, ws, fast);  // warm buffers
    StageTimer expanded;
    for (int r = 0; r < reps; ++r) {
        expanded.start();
        squared_l2_expanded(points.data(), n, centroids.data(), k, dim, ws, fast);
        expanded.stop();
    }
    const double fast_ms = expanded.mean_ms();
    std::printf("Time per call: %.2f ms\n", fast_ms);

    // ---- Learned metric (projection + expanded) ----
    const size_t rank = static_cast<size_t>(dim / 2 > 0 ? dim / 2 : 1);
    std::printf("\n==== Learned (rank %zu) ====\n", rank);
    std::vector<float> w;
    generate_synthetic(w, rank, dim, 7u);
    LinearMetric learned(dim, w, rank);
    std::vector<float> proj;
    StageTimer projected;
    for (int r = 0; r < reps; ++r) {
        projected.start();
        learned.pairwise(points.data(), n, centroids.data(), k, dim, ws, proj);
        projected.stop();
    }
    const double learned_ms = projected.mean_ms();
    std::printf("Time per call: %.2f ms\n", learned_ms);

    // ---- Naive reference ----
    std::printf("\n==== Naive ====\n");
    std::vector<float> ref;
    StageTimer naive;
    naive.start();
    squared_l2_naive(points.data(), n, centroids.data(), k, dim, ref);
    const double naive_ms = naive.stop();
    std::printf("Time per call: %.2f ms\n", naive_ms);

    std::printf("\nSpeedup (naive / expanded): %.1fx\n", naive_ms / fast_ms);
    std::printf("Max abs difference: %.3e\n", static_cast<double>(max_abs_diff(fast, ref)));
    std::printf("Peak RSS: %.1f MB\n", get_peak_rss_mb());
    return 0;
}
