#ifndef ENTROPIX_SNAPSHOT_IO_HPP
#define ENTROPIX_SNAPSHOT_IO_HPP

#include "entropix/snapshot.hpp"

#include <iosfwd>
#include <string>

namespace entropix {

// CSV layout:
//   k,dim,version
//   <k>,<dim>,<version>
//   count,c0,...,c{dim-1}      (one row per centroid)
// Floats are written with 9 significant digits so they round-trip exactly.
void write_snapshot_csv(std::ostream& out, const CentroidSnapshot& snap);
void write_snapshot_csv(const std::string& path, const CentroidSnapshot& snap);

// The returned snapshot has no metric; Estimator::restore attaches its own.
// Throws SnapshotFormatError on malformed input.
CentroidSnapshot read_snapshot_csv(std::istream& in);
CentroidSnapshot read_snapshot_csv(const std::string& path);

}  // namespace entropix

#endif  // ENTROPIX_SNAPSHOT_IO_HPP
