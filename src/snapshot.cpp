#include "entropix/snapshot.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace entropix {

OccupancyStats::OccupancyStats(std::vector<uint64_t> counts)
    : counts_(std::move(counts)),
      total_(std::accumulate(counts_.begin(), counts_.end(), uint64_t(0))) {}

void OccupancyStats::merge(const std::vector<uint64_t>& batch_counts) {
    if (batch_counts.size() != counts_.size())
        throw std::invalid_argument("OccupancyStats::merge: size mismatch");
    for (size_t c = 0; c < counts_.size(); ++c) {
        counts_[c] += batch_counts[c];
        total_ += batch_counts[c];
    }
}

void OccupancyStats::clear() {
    std::fill(counts_.begin(), counts_.end(), uint64_t(0));
    total_ = 0;
}

float OccupancyStats::mass(size_t c, float bootstrap) const {
    if (total_ == 0) return bootstrap;
    return static_cast<float>(static_cast<double>(counts_[c]) /
                              static_cast<double>(total_));
}

float OccupancyStats::mean_count() const {
    if (counts_.empty()) return 0.0f;
    return static_cast<float>(static_cast<double>(total_) /
                              static_cast<double>(counts_.size()));
}

}  // namespace entropix
