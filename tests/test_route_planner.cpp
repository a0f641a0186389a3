#include "haul/core/Config.h"
#include "haul/core/JobSystem.h"
#include "haul/core/JsonWriter.h"
#include "haul/core/Log.h"
#include "haul/route/RouteSignature.h"
#include "haul/service/RoutePlanner.h"

#include "test_harness.h"

#include <atomic>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace haul;

namespace {

// Starts without data; regenerate() counts calls and either loads the fixed
// location set or fails.
class CountingProvider final : public nav::LocationProvider {
public:
  CountingProvider(std::vector<nav::Location> locations, bool canLoad)
    : locations_(std::move(locations)), canLoad_(canLoad) {}

  std::shared_ptr<const nav::LocationSnapshot> snapshot() const override { return current_; }

  bool regenerate(std::string* outError) override {
    ++regenerations;
    if (!canLoad_) {
      if (outError) *outError = "catalog offline";
      return false;
    }
    current_ = nav::makeLocationSnapshot(locations_);
    return true;
  }

  std::string describe() const override { return "counting provider"; }

  std::atomic<int> regenerations{0};

private:
  std::vector<nav::Location> locations_;
  bool canLoad_{false};
  std::shared_ptr<const nav::LocationSnapshot> current_;
};

std::vector<nav::Location> stanton() {
  return {
    {"Area18", "landing_zone", "ArcCorp", {18361812.0, 10000.0, 2662349.0}},
    {"Port Olisar", "station", "Crusader", {0.0, 80000.0, 80000.0}},
    {"Lorville", "landing_zone", "Hurston", {-16540615.0, 5000.0, -1642349.0}},
  };
}

service::MissionFields fields(const std::string& id,
                              const std::string& pickup,
                              std::vector<std::string> dropoffs,
                              double scu,
                              double payout) {
  route::MissionDescriptor d;
  d.id = id;
  d.pickup = pickup;
  d.dropoffs = std::move(dropoffs);
  d.cargoScu = scu;
  d.payout = payout;
  return service::missionFieldsFrom(d);
}

service::RouteRequest scenarioA() {
  service::RouteRequest r;
  r.startLocation = "Port Olisar";
  r.label = "scenario-a";
  r.missions = {
    fields("M1", "Port Olisar", {"Area18", "Lorville"}, 50.0, 15000.0),
    fields("M2", "Area18", {"Lorville"}, 70.0, 22000.0),
    fields("M3", "Lorville", {"Port Olisar"}, 60.0, 18000.0),
  };
  return r;
}

} // namespace

int test_route_planner() {
  int failures = 0;

  core::ScopedLogLevel quiet(core::LogLevel::Error);

  // ---- Vehicle catalog ----
  {
    const auto* taurus = service::findVehicle(" Taurus ");
    CHECK(taurus != nullptr);
    if (taurus) CHECK(taurus->capacityScu == 168.0);
    CHECK(service::findVehicle("hull_e") == nullptr);
    CHECK(service::capacityFor("caterpillar") == 576.0);
    CHECK(service::capacityFor("hull_e", 99.0) == 99.0);
    CHECK(service::capacityFor("") == service::kDefaultVehicleCapacityScu);

    std::ostringstream oss;
    core::JsonWriter w(oss, false);
    service::writeVehicleCatalogJson(w);
    CHECK(oss.str().find("{\"id\":\"taurus\",\"name\":\"Constellation Taurus\",\"capacity\":168}") !=
          std::string::npos);
  }

  // ---- Capacity resolution ----
  {
    CountingProvider provider(stanton(), true);
    service::PlannerOptions opt;
    opt.defaultShipId = "freelancer";
    opt.defaultCapacityScu = 100.0;
    const service::RoutePlanner planner(provider, opt);

    service::RouteRequest r;
    CHECK(planner.resolveCapacity(r) == 66.0);
    r.shipId = "c2_hercules";
    CHECK(planner.resolveCapacity(r) == 696.0);
    r.shipId = "unknown_ship";
    CHECK(planner.resolveCapacity(r) == 100.0);
    r.shipCapacity = 12.5;
    CHECK(planner.resolveCapacity(r) == 12.5);
  }

  // ---- Options from config ----
  {
    core::ConfigRegistry cfg;
    core::installDefaultConfig(cfg);
    auto opt = service::plannerOptionsFromConfig(cfg);
    CHECK(opt.defaultShipId == "taurus");
    CHECK(opt.defaultCapacityScu == 168.0);

    CHECK(cfg.setString("vehicle.default", "caterpillar"));
    CHECK(cfg.setFloat("vehicle.defaultCapacity", -3.0));
    opt = service::plannerOptionsFromConfig(cfg);
    CHECK(opt.defaultShipId == "caterpillar");
    CHECK(opt.defaultCapacityScu == 168.0);
  }

  // ---- Missing data is regenerated once, then reused ----
  {
    CountingProvider provider(stanton(), true);
    const service::RoutePlanner planner(provider);

    const auto first = planner.plan(scenarioA());
    CHECK(first.success);
    CHECK(provider.regenerations == 1);
    CHECK(first.result.totalPayout == 55000.0);

    const auto second = planner.plan(scenarioA());
    CHECK(second.success);
    CHECK(provider.regenerations == 1);
    CHECK(route::signatureRouteResult(first.result) == route::signatureRouteResult(second.result));
  }

  // ---- Regeneration failure ----
  {
    CountingProvider provider(stanton(), false);
    const service::RoutePlanner planner(provider);

    const auto out = planner.plan(scenarioA());
    CHECK(!out.success);
    CHECK(out.error.kind == route::RouteErrorKind::LocationDataUnavailable);
    CHECK(out.error.message == "Location data not loaded: catalog offline");
    CHECK(provider.regenerations == 1);

    CHECK(!planner.acquireSnapshot());
    CHECK(provider.regenerations == 2);
  }

  // ---- Request-only failures never touch the data ----
  {
    CountingProvider provider(stanton(), false);
    const service::RoutePlanner planner(provider);

    service::RouteRequest empty;
    empty.startLocation = "Port Olisar";
    const auto none = planner.plan(empty);
    CHECK(none.error.kind == route::RouteErrorKind::NoMissions);
    CHECK(none.error.message == "No missions provided");

    auto noStart = scenarioA();
    noStart.startLocation.clear();
    const auto ns = planner.plan(noStart);
    CHECK(ns.error.kind == route::RouteErrorKind::InvalidRequest);
    CHECK(ns.error.message == "No start location provided");

    auto shape = scenarioA();
    shape.missions[1].values.erase("pickup");
    const auto bad = planner.plan(shape);
    CHECK(bad.error.kind == route::RouteErrorKind::InvalidRequest);
    CHECK(bad.error.message == "Invalid mission format: missing pickup location (M2)");

    core::JobSystem jobs(2);
    const auto batch = planner.planBatch({empty, noStart, shape}, jobs);
    CHECK(batch.size() == 3);
    if (batch.size() == 3) {
      CHECK(batch[0].error.kind == route::RouteErrorKind::NoMissions);
      CHECK(batch[1].error.message == "No start location provided");
      CHECK(batch[2].error.message == "Invalid mission format: missing pickup location (M2)");
    }

    CHECK(provider.regenerations == 0);
  }

  // ---- Ship selection flows into the route ----
  {
    CountingProvider provider(stanton(), true);
    const service::RoutePlanner planner(provider);

    auto small = scenarioA();
    small.shipId = "cutlass_black";
    const auto out = planner.plan(small);
    CHECK(!out.success);
    CHECK(out.error.kind == route::RouteErrorKind::Infeasible);

    small.shipCapacity = 168.0;
    CHECK(planner.plan(small).success);
  }

  // ---- Batch planning matches one-at-a-time planning ----
  {
    CountingProvider provider(stanton(), true);
    const service::RoutePlanner planner(provider);

    std::vector<service::RouteRequest> requests;
    requests.push_back(scenarioA());

    auto tight = scenarioA();
    tight.shipCapacity = 55.0;
    requests.push_back(tight);

    auto unknown = scenarioA();
    unknown.startLocation = "Grim HEX";
    requests.push_back(unknown);

    service::RouteRequest none;
    none.startLocation = "Area18";
    requests.push_back(none);

    auto reordered = scenarioA();
    std::swap(reordered.missions[0], reordered.missions[2]);
    requests.push_back(reordered);

    core::JobSystem jobs(3);
    const auto batch = planner.planBatch(requests, jobs);
    CHECK(batch.size() == requests.size());
    CHECK(provider.regenerations == 1);

    for (std::size_t i = 0; i < requests.size() && i < batch.size(); ++i) {
      const auto alone = planner.plan(requests[i]);
      CHECK(batch[i].success == alone.success);
      CHECK(batch[i].error.kind == alone.error.kind);
      CHECK(batch[i].error.message == alone.error.message);
      CHECK(route::signatureRouteResult(batch[i].result) == route::signatureRouteResult(alone.result));
    }

    if (batch.size() == 5) {
      CHECK(batch[0].success);
      CHECK(batch[1].error.kind == route::RouteErrorKind::Infeasible);
      CHECK(batch[2].error.kind == route::RouteErrorKind::InvalidLocations);
      CHECK(batch[2].error.invalidLocations == std::vector<std::string>{"Grim HEX"});
      CHECK(batch[3].error.kind == route::RouteErrorKind::NoMissions);
      CHECK(batch[4].success);
    }

    CHECK(planner.planBatch({}, jobs).empty());
  }

  return failures;
}
