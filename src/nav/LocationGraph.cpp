#include "haul/nav/LocationGraph.h"

#include <utility>

namespace haul::nav {

LocationGraph::LocationGraph(DistanceIndex index) : index_(std::move(index)) {
  for (std::size_t i = 0; i < index_.names.size(); ++i) {
    lookup_.emplace(index_.names[i], i);
  }
}

std::optional<LocationGraph> LocationGraph::fromIndex(DistanceIndex index, std::string* outError) {
  if (!validateDistanceIndex(index, outError)) return std::nullopt;
  return LocationGraph(std::move(index));
}

LocationGraph LocationGraph::fromLocations(const std::vector<Location>& locations) {
  return LocationGraph(buildDistanceIndex(locations));
}

std::optional<std::size_t> LocationGraph::indexOf(std::string_view name) const {
  const auto it = lookup_.find(name);
  if (it == lookup_.end()) return std::nullopt;
  return it->second;
}

std::optional<double> LocationGraph::distance(std::string_view a, std::string_view b) const {
  if (a == b) return 0.0;

  const auto ia = indexOf(a);
  const auto ib = indexOf(b);
  if (!ia || !ib) return std::nullopt;
  return index_.at(*ia, *ib);
}

} // namespace haul::nav
