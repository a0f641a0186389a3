#pragma once

#include "haul/nav/Location.h"

#include <cstddef>
#include <string>
#include <vector>

namespace haul::core {
class JsonWriter;
}

namespace haul::nav {

// Dense pairwise distances between named locations.
// Row/column i corresponds to names[i]; the matrix is stored row-major.
struct DistanceIndex {
  std::vector<std::string> names;
  std::vector<double> matrix;

  std::size_t size() const { return names.size(); }
  double at(std::size_t i, std::size_t j) const { return matrix[i * names.size() + j]; }
};

// Euclidean distances between catalog positions, names in catalog order.
// matrix[i][i] is exactly 0.
DistanceIndex buildDistanceIndex(const std::vector<Location>& locations);

// Checks shape (n*n entries), unique non-empty names, zero diagonal and finite
// non-negative entries. Symmetry is not required.
bool validateDistanceIndex(const DistanceIndex& index, std::string* outError = nullptr);

// {"locations": [...], "distances": [[...], ...]}
void writeDistanceIndexJson(core::JsonWriter& w, const DistanceIndex& index);

} // namespace haul::nav
