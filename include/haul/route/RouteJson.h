#pragma once

#include "haul/route/RouteResult.h"

#include <string>

namespace haul::core {
class JsonWriter;
}

namespace haul::route {

// Result object with the planner's public field names:
//   route, mission_order, cargo_at_each_step, cargo_types_at_steps,
//   total_distance, total_payout, completed_missions
// plus "actions" (structured steps) when includeActions is set.
void writeRouteResultJson(core::JsonWriter& w, const RouteResult& r, bool includeActions = true);

// Success: the result object. Failure:
//   {"error": message, "error_kind": "...", <variant fields>}
// where the variant fields are invalid_locations + valid_locations (InvalidLocations) or
// route_so_far + completed_missions + remaining_missions (Infeasible).
void writeRouteOutcomeJson(core::JsonWriter& w, const RouteOutcome& outcome, bool includeActions = true);

std::string routeOutcomeToJson(const RouteOutcome& outcome, bool pretty = true, bool includeActions = true);

} // namespace haul::route
