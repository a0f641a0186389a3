#include "haul/route/OptionScorer.h"

#include "test_harness.h"

#include <string>
#include <vector>

using namespace haul;

int test_option_scorer() {
  int failures = 0;

  const nav::LocationGraph graph = nav::LocationGraph::fromLocations({
    {"O", "station", "", {0.0, 0.0, 0.0}},
    {"P", "station", "", {3.0, 4.0, 0.0}},
    {"D", "station", "", {6.0, 8.0, 0.0}},
  });

  route::MissionDescriptor desc;
  desc.id = "M1";
  desc.pickup = "P";
  desc.dropoffs = {"D"};
  desc.cargoScu = 40.0;
  desc.payout = 100.0;

  // ---- Efficiency ----
  {
    const auto m = route::makeCargoMission(desc);
    CHECK(route::missionEfficiency(graph, m).value_or(-1.0) == 20.0);

    auto same = desc;
    same.dropoffs = {"P"};
    CHECK(route::missionEfficiency(graph, route::makeCargoMission(same)).value_or(-1.0) == 100.0);

    auto unknown = desc;
    unknown.dropoffs = {"Nowhere"};
    CHECK(!route::missionEfficiency(graph, route::makeCargoMission(unknown)).has_value());
  }

  CHECK(route::pickupFits(60.0, 40.0, 100.0));
  CHECK(route::pickupFits(60.0 + 1e-12, 40.0, 100.0));
  CHECK(!route::pickupFits(60.5, 40.0, 100.0));

  // ---- Pickup score ----
  {
    route::MissionLedger ledger({route::makeCargoMission(desc)});
    route::OptionScorer scorer(graph, ledger);
    CHECK(scorer.efficiency(0) == 20.0);

    const auto s = scorer.scorePickup(0, {"O", 0.0, 100.0});
    CHECK(s.has_value());
    if (s) {
      CHECK(s->distance == 5.0);
      CHECK(s->distanceScore == -5.0);
      CHECK(s->efficiencyScore == 200000.0);
      CHECK(s->cargoScore == 2000.0);
      CHECK(s->bonusScore == 0.0);
      CHECK(s->capacityScore == 3000.0);
      CHECK_NEAR(s->total, 204995.0, 1e-9);
    }

    // Already at the pickup: no distance penalty.
    const auto here = scorer.scorePickup(0, {"P", 0.0, 100.0});
    CHECK(here.has_value());
    if (here) CHECK(here->distanceScore == 0.0);

    // Does not fit.
    CHECK(!scorer.scorePickup(0, {"O", 61.0, 100.0}).has_value());
    // Zero capacity.
    CHECK(!scorer.scorePickup(0, {"O", 0.0, 0.0}).has_value());
    // Not in progress yet.
    CHECK(!scorer.scoreDropoff(0, {"O", 0.0, 100.0}).has_value());
  }

  // ---- Dropoff score ----
  {
    route::MissionLedger ledger({route::makeCargoMission(desc)});
    route::CargoManifest cargo;
    CHECK(ledger.pickup(0, cargo));
    route::OptionScorer scorer(graph, ledger);

    const auto s = scorer.scoreDropoff(0, {"P", 40.0, 100.0});
    CHECK(s.has_value());
    if (s) {
      CHECK(s->distance == 5.0);
      CHECK_NEAR(s->cargoScore, 1200.0, 1e-9);
      CHECK_NEAR(s->urgencyScore, 1600.0, 1e-9);
      CHECK(s->bonusScore == 0.0);
      CHECK_NEAR(s->total, 202795.0, 1e-9);
    }
    CHECK(!scorer.scorePickup(0, {"P", 40.0, 100.0}).has_value());
  }

  // ---- Co-location bonuses ----
  {
    auto second = desc;
    second.id = "M2";
    second.pickup = "D";
    second.dropoffs = {"O"};
    route::MissionLedger ledger({route::makeCargoMission(desc), route::makeCargoMission(second)});
    route::CargoManifest cargo;
    CHECK(ledger.pickup(0, cargo));
    route::OptionScorer scorer(graph, ledger);

    // M2 is picked up where M1 is delivered.
    const auto pick = scorer.scorePickup(1, {"P", 40.0, 100.0});
    CHECK(pick.has_value());
    if (pick) CHECK(pick->bonusScore == 5000.0);

    const auto drop = scorer.scoreDropoff(0, {"P", 40.0, 100.0});
    CHECK(drop.has_value());
    if (drop) CHECK(drop->bonusScore == 3000.0);
  }

  // ---- Custom weights ----
  {
    route::OptionScoreWeights w;
    w.efficiency = 0.0;
    w.pickupFits = 0.0;
    w.pickupCargoRoom = 0.0;
    route::MissionLedger ledger({route::makeCargoMission(desc)});
    route::OptionScorer scorer(graph, ledger, w);
    const auto s = scorer.scorePickup(0, {"O", 0.0, 100.0});
    CHECK(s.has_value());
    if (s) CHECK(s->total == -5.0);
  }

  return failures;
}
