#pragma once

#include "haul/core/JobSystem.h"
#include "haul/nav/LocationProvider.h"
#include "haul/route/OptionScorer.h"
#include "haul/route/RouteResult.h"
#include "haul/service/MissionRequest.h"
#include "haul/service/VehicleCatalog.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace haul::core {
class ConfigRegistry;
}

namespace haul::service {

struct PlannerOptions {
  std::string defaultShipId{kDefaultVehicleId};
  double defaultCapacityScu{kDefaultVehicleCapacityScu};
  route::OptionScoreWeights weights{};
};

// Reads vehicle.default and vehicle.defaultCapacity.
PlannerOptions plannerOptionsFromConfig(const core::ConfigRegistry& cfg);

// Request layer in front of RouteBuilder.
//
// plan() checks, in order: missions present, start location present, mission shape
// (normalizeMission), location data (one regenerate() and retry when missing), then
// resolves the capacity and runs the builder. Every failure comes back as a
// RouteOutcome; nothing throws.
class RoutePlanner {
public:
  explicit RoutePlanner(nav::LocationProvider& provider, PlannerOptions options = {});

  const PlannerOptions& options() const { return options_; }

  route::RouteOutcome plan(const RouteRequest& request) const;

  // Independent requests over one shared snapshot; outcomes are in request order and
  // identical to planning each request alone.
  std::vector<route::RouteOutcome> planBatch(const std::vector<RouteRequest>& requests,
                                             core::JobSystem& jobs) const;

  // Explicit capacity, else the request's ship id, else options().defaultShipId.
  double resolveCapacity(const RouteRequest& request) const;

  // Current snapshot, regenerating once when the provider has none.
  std::shared_ptr<const nav::LocationSnapshot> acquireSnapshot(std::string* outError = nullptr) const;

private:
  // Request-only checks (no location data needed); fills `descs` on success.
  std::optional<route::RouteOutcome> checkRequest(const RouteRequest& request,
                                                  std::vector<route::MissionDescriptor>& descs) const;

  route::RouteOutcome planWith(const RouteRequest& request,
                               const std::vector<route::MissionDescriptor>& descs,
                               const std::shared_ptr<const nav::LocationSnapshot>& snapshot,
                               const std::string& dataError) const;

  nav::LocationProvider& provider_;
  PlannerOptions options_;
};

} // namespace haul::service
