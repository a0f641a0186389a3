#include "haul/route/RouteJson.h"

#include "haul/core/JsonWriter.h"

#include <sstream>

namespace haul::route {

static void writeStringArray(core::JsonWriter& w, const std::vector<std::string>& items) {
  w.beginArray();
  for (const auto& s : items) w.value(s);
  w.endArray();
}

static void writeManifest(core::JsonWriter& w, const CargoManifest& cargo) {
  w.beginObject();
  for (const auto& kv : cargo) {
    w.key(kv.first);
    w.value(kv.second);
  }
  w.endObject();
}

void writeRouteResultJson(core::JsonWriter& w, const RouteResult& r, bool includeActions) {
  w.beginObject();

  w.key("route");
  writeStringArray(w, r.route);

  w.key("mission_order");
  writeStringArray(w, r.missionOrder);

  w.key("cargo_at_each_step");
  w.beginArray();
  for (double c : r.cargoAtEachStep) w.value(c);
  w.endArray();

  w.key("cargo_types_at_steps");
  w.beginArray();
  for (const auto& m : r.cargoTypesAtSteps) writeManifest(w, m);
  w.endArray();

  w.key("total_distance");
  w.value(r.totalDistance);
  w.key("total_payout");
  w.value(r.totalPayout);

  w.key("completed_missions");
  writeStringArray(w, r.completedMissions);

  if (includeActions) {
    w.key("actions");
    w.beginArray();
    for (const auto& a : r.actions) {
      w.beginObject();
      w.key("kind");
      w.value(routeActionKindName(a.kind));
      w.key("mission");
      w.value(a.missionId);
      w.key("location");
      w.value(a.location);
      w.key("cargo_type");
      w.value(a.cargoType);
      w.key("scu");
      w.value(a.amountScu);
      w.key("distance");
      w.value(a.legDistance);
      w.key("local");
      w.value(a.local);
      w.endObject();
    }
    w.endArray();
  }

  w.endObject();
}

void writeRouteOutcomeJson(core::JsonWriter& w, const RouteOutcome& outcome, bool includeActions) {
  if (outcome.success) {
    writeRouteResultJson(w, outcome.result, includeActions);
    return;
  }

  const RouteError& e = outcome.error;
  w.beginObject();
  w.key("error");
  w.value(e.message);
  w.key("error_kind");
  w.value(routeErrorName(e.kind));

  if (e.kind == RouteErrorKind::InvalidLocations) {
    w.key("invalid_locations");
    writeStringArray(w, e.invalidLocations);
    w.key("valid_locations");
    writeStringArray(w, e.validLocations);
  } else if (e.kind == RouteErrorKind::Infeasible) {
    w.key("route_so_far");
    writeStringArray(w, e.routeSoFar);
    w.key("completed_missions");
    writeStringArray(w, e.completedMissions);
    w.key("remaining_missions");
    writeStringArray(w, e.remainingMissions);
  }

  w.endObject();
}

std::string routeOutcomeToJson(const RouteOutcome& outcome, bool pretty, bool includeActions) {
  std::ostringstream oss;
  core::JsonWriter w(oss, pretty);
  writeRouteOutcomeJson(w, outcome, includeActions);
  return oss.str();
}

} // namespace haul::route
