#include "haul/route/RouteResult.h"

#include <utility>

namespace haul::route {

const char* routeActionKindName(RouteActionKind k) {
  switch (k) {
    case RouteActionKind::Pickup: return "pickup";
    case RouteActionKind::Dropoff: return "dropoff";
  }
  return "?";
}

const char* routeErrorName(RouteErrorKind k) {
  switch (k) {
    case RouteErrorKind::None: return "None";
    case RouteErrorKind::NoMissions: return "NoMissions";
    case RouteErrorKind::InvalidRequest: return "InvalidRequest";
    case RouteErrorKind::LocationDataUnavailable: return "LocationDataUnavailable";
    case RouteErrorKind::InvalidLocations: return "InvalidLocations";
    case RouteErrorKind::Infeasible: return "Infeasible";
  }
  return "?";
}

RouteOutcome makeRouteFailure(RouteErrorKind kind, std::string message) {
  RouteOutcome out;
  out.success = false;
  out.error.kind = kind;
  out.error.message = std::move(message);
  return out;
}

} // namespace haul::route
