#ifndef ENTROPIX_BENCH_UTILS_HPP
#define ENTROPIX_BENCH_UTILS_HPP

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <sys/resource.h>
#include <utility>
#include <vector>

namespace entropix {
namespace bench {

// Wall time of one pipeline stage summed over many laps (one lap per batch).
class StageTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }

    // Ends the current lap and returns its length in ms.
    double stop() {
        const double ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
        total_ms_ += ms;
        ++laps_;
        return ms;
    }

    double total_ms() const { return total_ms_; }
    size_t laps() const { return laps_; }
    double mean_ms() const { return laps_ ? total_ms_ / static_cast<double>(laps_) : 0.0; }

private:
    std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();
    double total_ms_ = 0.0;
    size_t laps_ = 0;
};

// Peak resident set size in MB (ru_maxrss is in KB on Linux).
inline double get_peak_rss_mb() {
    struct rusage ru;
    if (getrusage(RUSAGE_SELF, &ru) != 0) return 0.0;
    return static_cast<double>(ru.ru_maxrss) / 1024.0;
}

inline size_t env_size(const char* name, size_t fallback) {
    const char* v = std::getenv(name);
    return v ? static_cast<size_t>(std::stoul(v)) : fallback;
}

// Comma-separated list of sizes, e.g. "256,4096".
inline std::vector<size_t> env_size_list(const char* name,
                                         std::vector<size_t> fallback) {
    const char* v = std::getenv(name);
    if (!v) return fallback;
    std::vector<size_t> out;
    std::string s(v);
    size_t pos = 0;
    while (pos < s.size()) {
        size_t end = s.find(',', pos);
        if (end == std::string::npos) end = s.size();
        out.push_back(static_cast<size_t>(std::stoul(s.substr(pos, end - pos))));
        pos = end + 1;
    }
    return out.empty() ? fallback : out;
}

/**
 * Fixed-column result table. Every row is echoed to stdout as an aligned
 * line and, when the CSV file opened, appended to it.
 */
class ResultTable {
public:
    ResultTable(std::vector<std::string> columns, const std::string& csv_path)
        : columns_(std::move(columns)), csv_(csv_path) {
        for (const auto& c : columns_)
            widths_.push_back(static_cast<int>(std::max<size_t>(c.size(), 10)));
        if (csv_.is_open()) write_csv_line(columns_);
    }

    bool csv_open() const { return csv_.is_open(); }

    void print_header() const {
        std::string rule;
        for (size_t i = 0; i < columns_.size(); ++i) {
            std::printf("%s%*s", i ? " | " : "", widths_[i], columns_[i].c_str());
            rule += std::string(static_cast<size_t>(widths_[i]) + (i ? 3 : 0), '-');
        }
        std::printf("\n%s\n", rule.c_str());
        std::fflush(stdout);
    }

    void add_row(const std::vector<double>& values) {
        if (values.size() != columns_.size())
            throw std::invalid_argument("ResultTable: row has " + std::to_string(values.size()) +
                                        " values for " + std::to_string(columns_.size()) +
                                        " columns");
        std::vector<std::string> cells;
        for (size_t i = 0; i < values.size(); ++i) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.6g", values[i]);
            cells.emplace_back(buf);
            std::printf("%s%*s", i ? " | " : "", widths_[i], buf);
        }
        std::printf("\n");
        std::fflush(stdout);
        if (csv_.is_open()) write_csv_line(cells);
    }

    void flush() { csv_.flush(); }

private:
    void write_csv_line(const std::vector<std::string>& cells) {
        for (size_t i = 0; i < cells.size(); ++i) csv_ << (i ? "," : "") << cells[i];
        csv_ << '\n';
    }

    std::vector<std::string> columns_;
    std::vector<int> widths_;
    std::ofstream csv_;
};

}  // namespace bench
}  // namespace entropix

#endif  // ENTROPIX_BENCH_UTILS_HPP
