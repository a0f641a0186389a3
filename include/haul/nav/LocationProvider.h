#pragma once

#include "haul/nav/Location.h"
#include "haul/nav/LocationGraph.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace haul::nav {

// Location data shared read-only by every route computation that uses it.
struct LocationSnapshot {
  std::vector<Location> locations;
  LocationGraph graph;
};

// Source of location data for the request layer.
//
// snapshot() never blocks on I/O; it returns nullptr until data has been produced.
// regenerate() (re)builds the snapshot; callers retry it once before reporting the
// data as unavailable.
class LocationProvider {
public:
  virtual ~LocationProvider() = default;

  virtual std::shared_ptr<const LocationSnapshot> snapshot() const = 0;
  virtual bool regenerate(std::string* outError = nullptr) = 0;

  // Short human-readable origin, used in log lines.
  virtual std::string describe() const = 0;
};

// Reads a location catalog file (see parseLocationCatalog) and derives the distance index.
class CatalogFileProvider final : public LocationProvider {
public:
  // With loadNow == false the first snapshot() is empty until regenerate() runs.
  explicit CatalogFileProvider(std::string path, bool loadNow = true);

  std::shared_ptr<const LocationSnapshot> snapshot() const override;
  bool regenerate(std::string* outError = nullptr) override;
  std::string describe() const override { return "catalog " + path_; }

  const std::string& path() const { return path_; }

private:
  std::string path_;
  mutable std::mutex mutex_;
  std::shared_ptr<const LocationSnapshot> current_;
};

// Fixed in-memory location set (embedding, tools, tests).
class StaticLocationProvider final : public LocationProvider {
public:
  explicit StaticLocationProvider(std::vector<Location> locations);

  std::shared_ptr<const LocationSnapshot> snapshot() const override { return current_; }
  bool regenerate(std::string* outError = nullptr) override;
  std::string describe() const override { return "static location set"; }

private:
  std::shared_ptr<const LocationSnapshot> current_;
};

std::shared_ptr<const LocationSnapshot> makeLocationSnapshot(std::vector<Location> locations);

} // namespace haul::nav
