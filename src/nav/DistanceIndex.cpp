#include "haul/nav/DistanceIndex.h"

#include "haul/core/JsonWriter.h"

#include <cmath>
#include <set>

namespace haul::nav {

DistanceIndex buildDistanceIndex(const std::vector<Location>& locations) {
  DistanceIndex idx;
  const std::size_t n = locations.size();
  idx.names.reserve(n);
  for (const auto& loc : locations) idx.names.push_back(loc.name);

  idx.matrix.assign(n * n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = 0; j < n; ++j) {
      if (i == j) continue;
      idx.matrix[i * n + j] = math::distance(locations[i].posKm, locations[j].posKm);
    }
  }
  return idx;
}

bool validateDistanceIndex(const DistanceIndex& index, std::string* outError) {
  const std::size_t n = index.names.size();
  if (index.matrix.size() != n * n) {
    if (outError) {
      *outError = "Distance matrix has " + std::to_string(index.matrix.size()) + " entries, expected " +
                  std::to_string(n * n);
    }
    return false;
  }

  std::set<std::string, std::less<>> seen;
  for (const auto& name : index.names) {
    if (name.empty()) {
      if (outError) *outError = "Distance index contains an empty location name";
      return false;
    }
    if (!seen.insert(name).second) {
      if (outError) *outError = "Distance index contains duplicate location " + name;
      return false;
    }
  }

  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = 0; j < n; ++j) {
      const double d = index.at(i, j);
      if (!std::isfinite(d) || d < 0.0) {
        if (outError) *outError = "Invalid distance " + index.names[i] + " -> " + index.names[j];
        return false;
      }
      if (i == j && d != 0.0) {
        if (outError) *outError = "Non-zero self distance for " + index.names[i];
        return false;
      }
    }
  }
  return true;
}

void writeDistanceIndexJson(core::JsonWriter& w, const DistanceIndex& index) {
  w.beginObject();
  w.key("locations");
  w.beginArray();
  for (const auto& name : index.names) w.value(name);
  w.endArray();

  w.key("distances");
  w.beginArray();
  for (std::size_t i = 0; i < index.size(); ++i) {
    w.beginArray();
    for (std::size_t j = 0; j < index.size(); ++j) w.value(index.at(i, j));
    w.endArray();
  }
  w.endArray();
  w.endObject();
}

} // namespace haul::nav
