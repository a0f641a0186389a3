#include "haul/service/RoutePlanner.h"

#include "haul/core/Config.h"
#include "haul/core/Log.h"
#include "haul/route/RouteBuilder.h"

#include <optional>
#include <utility>

namespace haul::service {

PlannerOptions plannerOptionsFromConfig(const core::ConfigRegistry& cfg) {
  PlannerOptions opt;
  opt.defaultShipId = cfg.getString("vehicle.default", kDefaultVehicleId);
  opt.defaultCapacityScu = cfg.getFloat("vehicle.defaultCapacity", kDefaultVehicleCapacityScu);
  if (!(opt.defaultCapacityScu > 0.0)) {
    HAUL_LOG_WARN("vehicle.defaultCapacity must be positive, using " +
                  std::to_string(static_cast<long long>(kDefaultVehicleCapacityScu)));
    opt.defaultCapacityScu = kDefaultVehicleCapacityScu;
  }
  return opt;
}

RoutePlanner::RoutePlanner(nav::LocationProvider& provider, PlannerOptions options)
  : provider_(provider), options_(std::move(options)) {}

double RoutePlanner::resolveCapacity(const RouteRequest& request) const {
  if (request.shipCapacity) return *request.shipCapacity;
  const std::string& id = request.shipId.empty() ? options_.defaultShipId : request.shipId;
  return capacityFor(id, options_.defaultCapacityScu);
}

std::shared_ptr<const nav::LocationSnapshot> RoutePlanner::acquireSnapshot(std::string* outError) const {
  auto snap = provider_.snapshot();
  if (snap && !snap->graph.empty()) return snap;

  HAUL_LOG_WARN("Location data not loaded, regenerating from " + provider_.describe());
  std::string err;
  if (!provider_.regenerate(&err)) {
    HAUL_LOG_ERROR("Location data regeneration failed: " + err);
    if (outError) *outError = err;
    return nullptr;
  }

  snap = provider_.snapshot();
  if (!snap || snap->graph.empty()) {
    if (outError) *outError = "provider produced no locations";
    return nullptr;
  }
  return snap;
}

std::optional<route::RouteOutcome> RoutePlanner::checkRequest(const RouteRequest& request,
                                                             std::vector<route::MissionDescriptor>& descs) const {
  using route::RouteErrorKind;

  if (request.missions.empty()) {
    return route::makeRouteFailure(RouteErrorKind::NoMissions, "No missions provided");
  }
  if (request.startLocation.empty()) {
    return route::makeRouteFailure(RouteErrorKind::InvalidRequest, "No start location provided");
  }

  std::string err;
  if (!normalizeMissions(request.missions, descs, &err)) {
    core::logTagged(core::LogLevel::Warn, request.label, "Rejected request: " + err);
    return route::makeRouteFailure(RouteErrorKind::InvalidRequest, err);
  }
  return std::nullopt;
}

route::RouteOutcome RoutePlanner::planWith(const RouteRequest& request,
                                           const std::vector<route::MissionDescriptor>& descs,
                                           const std::shared_ptr<const nav::LocationSnapshot>& snapshot,
                                           const std::string& dataError) const {
  if (!snapshot) {
    std::string msg = "Location data not loaded";
    if (!dataError.empty()) msg += ": " + dataError;
    return route::makeRouteFailure(route::RouteErrorKind::LocationDataUnavailable, msg);
  }

  route::RouteBuildParams params;
  params.weights = options_.weights;
  params.logTag = request.label;

  const double capacity = resolveCapacity(request);
  route::RouteBuilder builder(snapshot->graph, capacity, params);
  return builder.compute(route::makeCargoMissions(descs), request.startLocation);
}

route::RouteOutcome RoutePlanner::plan(const RouteRequest& request) const {
  std::vector<route::MissionDescriptor> descs;
  if (auto rejected = checkRequest(request, descs)) return std::move(*rejected);

  std::string dataError;
  const auto snap = acquireSnapshot(&dataError);
  return planWith(request, descs, snap, dataError);
}

std::vector<route::RouteOutcome> RoutePlanner::planBatch(const std::vector<RouteRequest>& requests,
                                                         core::JobSystem& jobs) const {
  if (requests.empty()) return {};

  // Shape checks first; data is only loaded when some request needs it.
  std::vector<std::vector<route::MissionDescriptor>> descs(requests.size());
  std::vector<std::optional<route::RouteOutcome>> rejected(requests.size());
  bool anyAccepted = false;
  for (std::size_t i = 0; i < requests.size(); ++i) {
    rejected[i] = checkRequest(requests[i], descs[i]);
    if (!rejected[i]) anyAccepted = true;
  }

  std::string dataError;
  std::shared_ptr<const nav::LocationSnapshot> snap;
  if (anyAccepted) snap = acquireSnapshot(&dataError);

  HAUL_LOG_INFO("Planning " + std::to_string(requests.size()) + " requests on " +
                std::to_string(jobs.threadCount()) + " threads");

  std::vector<route::RouteOutcome> out(requests.size());
  jobs.parallelFor(requests.size(), [&](std::size_t i) {
    out[i] = rejected[i] ? std::move(*rejected[i]) : planWith(requests[i], descs[i], snap, dataError);
  });
  return out;
}

} // namespace haul::service
