#include "entropix/snapshot_io.hpp"
#include "entropix/errors.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <utility>
#include <vector>

namespace entropix {

namespace {

std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    std::istringstream ss(line);
    while (std::getline(ss, cell, ',')) cells.push_back(cell);
    if (!line.empty() && line.back() == ',') cells.emplace_back();
    return cells;
}

// Upper bound on k * dim, checked before the centroid buffer is sized.
constexpr size_t kMaxSnapshotFloats = size_t(1) << 28;

template <typename T>
T parse_cell(const std::string& cell, const char* what) {
    // Stream extraction wraps "-5" into a huge unsigned value.
    if (std::is_unsigned<T>::value && cell.find('-') != std::string::npos)
        throw SnapshotFormatError(std::string("bad ") + what + " '" + cell + "'");
    std::istringstream ss(cell);
    T v{};
    ss >> v;
    if (ss.fail() || !ss.eof())
        throw SnapshotFormatError(std::string("bad ") + what + " '" + cell + "'");
    return v;
}

bool next_line(std::istream& in, std::string& line) {
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) return true;
    }
    return false;
}

}  // namespace

void write_snapshot_csv(std::ostream& out, const CentroidSnapshot& snap) {
    out << "k,dim,version\n";
    out << snap.k << ',' << snap.dim << ',' << snap.version << '\n';
    out << "count";
    for (int j = 0; j < snap.dim; ++j) out << ",c" << j;
    out << '\n';
    out << std::setprecision(9);
    for (size_t c = 0; c < snap.k; ++c) {
        out << snap.occupancy.count(c);
        const float* cv = snap.centroid(c);
        for (int j = 0; j < snap.dim; ++j) out << ',' << cv[j];
        out << '\n';
    }
}

void write_snapshot_csv(const std::string& path, const CentroidSnapshot& snap) {
    std::ofstream out(path);
    if (!out.is_open())
        throw SnapshotFormatError("cannot open '" + path + "' for writing");
    write_snapshot_csv(out, snap);
    out.flush();
    if (!out)
        throw SnapshotFormatError("write to '" + path + "' failed");
}

CentroidSnapshot read_snapshot_csv(std::istream& in) {
    std::string line;
    if (!next_line(in, line) || line != "k,dim,version")
        throw SnapshotFormatError("missing header");
    if (!next_line(in, line)) throw SnapshotFormatError("missing shape row");

    auto shape = split_csv(line);
    if (shape.size() != 3) throw SnapshotFormatError("shape row needs 3 cells");

    CentroidSnapshot snap;
    snap.k = parse_cell<size_t>(shape[0], "k");
    snap.dim = parse_cell<int>(shape[1], "dim");
    snap.version = parse_cell<uint64_t>(shape[2], "version");
    if (snap.k == 0 || snap.dim <= 0)
        throw SnapshotFormatError("k and dim must be positive");
    if (snap.k > kMaxSnapshotFloats / static_cast<size_t>(snap.dim))
        throw SnapshotFormatError("k * dim too large: k=" + std::to_string(snap.k) +
                                  ", dim=" + std::to_string(snap.dim));

    if (!next_line(in, line) || line.rfind("count", 0) != 0)
        throw SnapshotFormatError("missing column header");

    const size_t dim = static_cast<size_t>(snap.dim);
    std::vector<uint64_t> counts(snap.k);
    snap.centroids.resize(snap.k * dim);
    for (size_t c = 0; c < snap.k; ++c) {
        if (!next_line(in, line))
            throw SnapshotFormatError("expected " + std::to_string(snap.k) +
                                      " centroid rows, got " + std::to_string(c));
        auto cells = split_csv(line);
        if (cells.size() != dim + 1)
            throw SnapshotFormatError("row " + std::to_string(c) + " has " +
                                      std::to_string(cells.size()) + " cells");
        counts[c] = parse_cell<uint64_t>(cells[0], "count");
        for (size_t j = 0; j < dim; ++j)
            snap.centroids[c * dim + j] = parse_cell<float>(cells[j + 1], "coordinate");
    }
    if (next_line(in, line)) throw SnapshotFormatError("trailing rows");

    snap.occupancy = OccupancyStats(std::move(counts));
    return snap;
}

CentroidSnapshot read_snapshot_csv(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open())
        throw SnapshotFormatError("cannot open '" + path + "'");
    return read_snapshot_csv(in);
}

}  // namespace entropix
