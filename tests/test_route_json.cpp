#include "haul/core/Log.h"
#include "haul/route/RouteBuilder.h"
#include "haul/route/RouteJson.h"

#include "test_harness.h"

#include <string>
#include <vector>

using namespace haul;

int test_route_json() {
  int failures = 0;

  core::ScopedLogLevel quiet(core::LogLevel::Error);

  const nav::LocationGraph graph = nav::LocationGraph::fromLocations({
    {"O", "station", "", {0.0, 0.0, 0.0}},
    {"P", "station", "", {3.0, 4.0, 0.0}},
  });

  route::MissionDescriptor m;
  m.id = "M1";
  m.pickup = "O";
  m.dropoffs = {"P"};
  m.cargoScu = 10.0;
  m.payout = 100.0;

  // ---- Success ----
  {
    const auto out = route::computeRoute(graph, {m}, "O", 20.0);
    CHECK(out.success);

    CHECK(route::routeOutcomeToJson(out, false, false) ==
          "{\"route\":[\"O\",\"O\",\"P\"],"
          "\"mission_order\":[\"Pickup M1 - General\",\"Dropoff M1 at P - General\"],"
          "\"cargo_at_each_step\":[0,10,0],"
          "\"cargo_types_at_steps\":[{},{\"General\":10},{}],"
          "\"total_distance\":5,"
          "\"total_payout\":100,"
          "\"completed_missions\":[\"M1\"]}");

    const std::string withActions = route::routeOutcomeToJson(out, false, true);
    CHECK(withActions.find("\"actions\":["
                           "{\"kind\":\"pickup\",\"mission\":\"M1\",\"location\":\"O\",\"cargo_type\":\"General\","
                           "\"scu\":10,\"distance\":0,\"local\":true},"
                           "{\"kind\":\"dropoff\",\"mission\":\"M1\",\"location\":\"P\",\"cargo_type\":\"General\","
                           "\"scu\":10,\"distance\":5,\"local\":false}]") != std::string::npos);

    const std::string pretty = route::routeOutcomeToJson(out);
    CHECK(pretty.find("\"total_payout\": 100") != std::string::npos);
    CHECK(!pretty.empty() && pretty.back() == '\n');
  }

  // ---- Failures ----
  {
    const auto none = route::computeRoute(graph, {}, "O", 20.0);
    CHECK(route::routeOutcomeToJson(none, false) ==
          "{\"error\":\"No missions provided\",\"error_kind\":\"NoMissions\"}");

    auto unknown = m;
    unknown.pickup = "X";
    const auto invalid = route::computeRoute(graph, {unknown}, "O", 20.0);
    CHECK(route::routeOutcomeToJson(invalid, false) ==
          "{\"error\":\"Invalid locations in request: X\",\"error_kind\":\"InvalidLocations\","
          "\"invalid_locations\":[\"X\"],\"valid_locations\":[\"O\",\"P\"]}");

    const auto stuck = route::computeRoute(graph, {m}, "O", 5.0);
    CHECK(route::routeOutcomeToJson(stuck, false) ==
          "{\"error\":\"Cannot complete all missions with the given ship capacity\",\"error_kind\":\"Infeasible\","
          "\"route_so_far\":[\"O\"],\"completed_missions\":[],\"remaining_missions\":[\"M1\"]}");
  }

  CHECK(std::string(route::routeErrorName(route::RouteErrorKind::LocationDataUnavailable)) ==
        "LocationDataUnavailable");
  CHECK(std::string(route::routeActionKindName(route::RouteActionKind::Dropoff)) == "dropoff");

  return failures;
}
