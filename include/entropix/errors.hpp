#ifndef ENTROPIX_ERRORS_HPP
#define ENTROPIX_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace entropix {

// Base class for every error raised by the estimator stack.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Initialization needs at least k distinct points.
class InsufficientDataError : public Error {
public:
    InsufficientDataError(size_t distinct, size_t k)
        : Error("insufficient data: " + std::to_string(distinct) +
                " distinct points for k=" + std::to_string(k)),
          distinct_(distinct), k_(k) {}

    size_t distinct() const { return distinct_; }
    size_t k() const { return k_; }

private:
    size_t distinct_;
    size_t k_;
};

class UninitializedError : public Error {
public:
    explicit UninitializedError(const std::string& op)
        : Error(op + ": estimator is not initialized") {}
};

class DimensionMismatchError : public Error {
public:
    DimensionMismatchError(int expected, int got)
        : Error("dimension mismatch: expected " + std::to_string(expected) +
                ", got " + std::to_string(got)),
          expected_(expected), got_(got) {}

    int expected() const { return expected_; }
    int got() const { return got_; }

private:
    int expected_;
    int got_;
};

class SnapshotFormatError : public Error {
public:
    explicit SnapshotFormatError(const std::string& what)
        : Error("snapshot: " + what) {}
};

}  // namespace entropix

#endif  // ENTROPIX_ERRORS_HPP
