#pragma once

#include "haul/nav/DistanceIndex.h"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace haul::nav {

// Read-only name -> distance lookup over a DistanceIndex.
//
// Immutable after construction, so one graph can serve any number of concurrent
// route computations.
class LocationGraph {
public:
  // Empty graph: no location data.
  LocationGraph() = default;

  // Rejects indices that fail validateDistanceIndex().
  static std::optional<LocationGraph> fromIndex(DistanceIndex index, std::string* outError = nullptr);
  static LocationGraph fromLocations(const std::vector<Location>& locations);

  bool empty() const { return index_.names.empty(); }
  std::size_t size() const { return index_.names.size(); }

  bool contains(std::string_view name) const { return lookup_.find(name) != lookup_.end(); }
  std::optional<std::size_t> indexOf(std::string_view name) const;

  // 0 when a == b (by name). std::nullopt when either name is not in the index.
  std::optional<double> distance(std::string_view a, std::string_view b) const;

  // Names in index order.
  const std::vector<std::string>& names() const { return index_.names; }
  const DistanceIndex& index() const { return index_; }

private:
  explicit LocationGraph(DistanceIndex index);

  DistanceIndex index_;
  std::map<std::string, std::size_t, std::less<>> lookup_;
};

} // namespace haul::nav
