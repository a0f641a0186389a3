#pragma once

#include "haul/core/Types.h"
#include "haul/route/MissionLedger.h"

#include <string>
#include <vector>

namespace haul::route {

enum class RouteActionKind : core::u8 {
  Pickup = 0,
  Dropoff,
};

const char* routeActionKindName(RouteActionKind k);

// One executed step. `local` actions happened at the location the vehicle was
// already at (legDistance == 0); `score` is only meaningful for travel actions.
struct RouteAction {
  RouteActionKind kind{RouteActionKind::Pickup};
  std::string missionId;
  std::string location;
  std::string cargoType;
  double amountScu{0.0};
  double legDistance{0.0};
  bool local{false};
  double score{0.0};
};

// Traces are parallel: route, cargoAtEachStep and cargoTypesAtSteps start with the
// initial state (start location, 0, {}) and gain one entry per action, so they are
// one longer than missionOrder and actions.
struct RouteResult {
  std::vector<std::string> route;
  std::vector<std::string> missionOrder; // "Pickup M1 - General", "Dropoff M1 at Area18 - General"
  std::vector<double> cargoAtEachStep;
  std::vector<CargoManifest> cargoTypesAtSteps;
  double totalDistance{0.0};
  double totalPayout{0.0};
  std::vector<std::string> completedMissions; // completion order

  std::vector<RouteAction> actions;

  double maxCargo() const {
    double m = 0.0;
    for (double c : cargoAtEachStep) m = (c > m) ? c : m;
    return m;
  }
};

enum class RouteErrorKind : core::u8 {
  None = 0,
  NoMissions,
  InvalidRequest,
  LocationDataUnavailable,
  InvalidLocations,
  Infeasible,
};

const char* routeErrorName(RouteErrorKind k);

struct RouteError {
  RouteErrorKind kind{RouteErrorKind::None};
  std::string message;

  // InvalidLocations
  std::vector<std::string> invalidLocations; // first-appearance order, no duplicates
  std::vector<std::string> validLocations;

  // Infeasible
  std::vector<std::string> routeSoFar;
  std::vector<std::string> completedMissions;
  std::vector<std::string> remainingMissions; // pending (input order), then in-progress (pickup order)
};

// Either a full route (success) or an error. On Infeasible, `result` also carries
// the partial traces up to the point the route got stuck.
struct RouteOutcome {
  bool success{false};
  RouteResult result;
  RouteError error;
};

RouteOutcome makeRouteFailure(RouteErrorKind kind, std::string message);

} // namespace haul::route
