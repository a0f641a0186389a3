#include "haul/nav/LocationProvider.h"

#include "haul/core/Log.h"

#include <utility>

namespace haul::nav {

std::shared_ptr<const LocationSnapshot> makeLocationSnapshot(std::vector<Location> locations) {
  auto snap = std::make_shared<LocationSnapshot>();
  snap->graph = LocationGraph::fromLocations(locations);
  snap->locations = std::move(locations);
  return snap;
}

CatalogFileProvider::CatalogFileProvider(std::string path, bool loadNow) : path_(std::move(path)) {
  if (!loadNow) return;
  std::string err;
  if (!regenerate(&err)) {
    HAUL_LOG_WARN("Location data not available yet: " + err);
  }
}

std::shared_ptr<const LocationSnapshot> CatalogFileProvider::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

bool CatalogFileProvider::regenerate(std::string* outError) {
  std::vector<Location> locations;
  if (!loadLocationCatalog(path_, locations, outError)) return false;
  if (locations.empty()) {
    if (outError) *outError = "Location catalog is empty: " + path_;
    return false;
  }

  const std::size_t count = locations.size();
  auto snap = makeLocationSnapshot(std::move(locations));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(snap);
  }
  HAUL_LOG_INFO("Loaded " + std::to_string(count) + " locations with distance index from " + path_);
  return true;
}

StaticLocationProvider::StaticLocationProvider(std::vector<Location> locations) {
  if (!locations.empty()) current_ = makeLocationSnapshot(std::move(locations));
}

bool StaticLocationProvider::regenerate(std::string* outError) {
  if (current_) return true;
  if (outError) *outError = "Static location set is empty";
  return false;
}

} // namespace haul::nav
