#include "haul/route/CargoMission.h"

#include "test_harness.h"

#include <string>

using namespace haul;

static route::MissionDescriptor threeStop() {
  route::MissionDescriptor d;
  d.id = "M7";
  d.pickup = "Port Olisar";
  d.dropoffs = {"Area18", "Lorville", "New Babbage"};
  d.cargoScu = 90.0;
  d.cargoType = "Titanium";
  d.payout = 30000.0;
  return d;
}

int test_cargo_mission() {
  int failures = 0;

  // Even split when no amounts are given.
  {
    const auto m = route::makeCargoMission(threeStop());
    CHECK(m.dropoffCount() == 3);
    CHECK(m.dropoffCargoAmounts.size() == 3);
    for (double a : m.dropoffCargoAmounts) CHECK_NEAR(a, 30.0, 1e-12);
    CHECK(m.dropoffCargoTypes.size() == 3);
    for (const auto& t : m.dropoffCargoTypes) CHECK(t == "Titanium");
  }

  // Given amounts are kept; the remainder is split over the rest.
  {
    auto d = threeStop();
    d.dropoffCargoAmounts = {50.0};
    const auto m = route::makeCargoMission(d);
    CHECK(m.dropoffCargoAmounts.size() == 3);
    if (m.dropoffCargoAmounts.size() == 3) {
      CHECK(m.dropoffCargoAmounts[0] == 50.0);
      CHECK_NEAR(m.dropoffCargoAmounts[1], 20.0, 1e-12);
      CHECK_NEAR(m.dropoffCargoAmounts[2], 20.0, 1e-12);
    }
  }

  // Over-specified amounts leave nothing for the rest.
  {
    auto d = threeStop();
    d.dropoffCargoAmounts = {60.0, 45.0};
    const auto m = route::makeCargoMission(d);
    CHECK(m.dropoffCargoAmounts.size() == 3);
    if (m.dropoffCargoAmounts.size() == 3) CHECK(m.dropoffCargoAmounts[2] == 0.0);
  }

  // Extra amounts and types are dropped; short type lists are filled.
  {
    auto d = threeStop();
    d.dropoffCargoAmounts = {10.0, 20.0, 30.0, 40.0};
    d.dropoffCargoTypes = {"Medical Supplies", ""};
    const auto m = route::makeCargoMission(d);
    CHECK(m.dropoffCargoAmounts.size() == 3);
    CHECK(m.dropoffCargoTypes.size() == 3);
    if (m.dropoffCargoTypes.size() == 3) {
      CHECK(m.dropoffCargoTypes[0] == "Medical Supplies");
      CHECK(m.dropoffCargoTypes[1] == "Titanium");
      CHECK(m.dropoffCargoTypes[2] == "Titanium");
    }

    d.dropoffCargoTypes = {"A", "B", "C", "D"};
    const auto m2 = route::makeCargoMission(d);
    CHECK(m2.dropoffCargoTypes.size() == 3);
  }

  // Empty cargo type falls back to the default.
  {
    auto d = threeStop();
    d.cargoType.clear();
    const auto m = route::makeCargoMission(d);
    CHECK(m.cargoType == route::kDefaultCargoType);
    if (!m.dropoffCargoTypes.empty()) CHECK(m.dropoffCargoTypes[0] == route::kDefaultCargoType);
  }

  // Batch conversion keeps input order.
  {
    auto a = threeStop();
    auto b = threeStop();
    b.id = "M8";
    const auto ms = route::makeCargoMissions({a, b});
    CHECK(ms.size() == 2);
    if (ms.size() == 2) CHECK(ms[1].id == "M8");
  }

  {
    route::MissionDescriptor d;
    d.id = "M1";
    d.pickup = "Port Olisar";
    d.dropoffs = {"Area18", "Lorville"};
    d.cargoScu = 50.0;
    d.payout = 15000.0;
    CHECK(route::describeMission(route::makeCargoMission(d)) ==
          "M1: Port Olisar -> [Area18 (General, 25 SCU) -> Lorville (General, 25 SCU)], 50 SCU total, 15000 aUEC");
  }

  return failures;
}
