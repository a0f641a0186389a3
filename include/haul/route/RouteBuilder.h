#pragma once

#include "haul/nav/LocationGraph.h"
#include "haul/route/CargoMission.h"
#include "haul/route/OptionScorer.h"
#include "haul/route/RouteResult.h"

#include <string>
#include <vector>

namespace haul::route {

struct RouteBuildParams {
  OptionScoreWeights weights{};

  // Prefix for the builder's log lines; empty for none.
  std::string logTag;
};

// Greedy single-vehicle route construction.
//
// Each iteration executes exactly one action:
//  1. Local: the first in-progress mission (pickup order) whose next dropoff is the
//     current location is dropped off. Otherwise the first pending mission (input
//     order) picked up here that fits is picked up. No distance is added.
//  2. Travel: every fitting pickup and every next dropoff is scored; the strictly
//     greatest score wins. Candidates are enumerated pending missions first (input
//     order), then in-progress missions (pickup order), so ties keep the first one.
//  3. No candidate left: Infeasible, with the partial route.
//
// compute() only reads the graph and allocates its own ledger and state, so one
// builder (or one graph) can serve concurrent computations.
class RouteBuilder {
public:
  RouteBuilder(const nav::LocationGraph& graph, double capacityScu, RouteBuildParams params = {});

  double capacity() const { return capacityScu_; }
  const RouteBuildParams& params() const { return params_; }

  // Validation order: NoMissions, empty graph (LocationDataUnavailable), capacity or
  // mission shape (InvalidRequest), unknown names (InvalidLocations).
  RouteOutcome compute(const std::vector<CargoMission>& missions, const std::string& startLocation) const;

private:
  const nav::LocationGraph& graph_;
  double capacityScu_{0.0};
  RouteBuildParams params_;
};

// Entry point over loosely specified descriptors: normalizes with makeCargoMission()
// and runs a RouteBuilder with default weights.
RouteOutcome computeRoute(const nav::LocationGraph& graph,
                          const std::vector<MissionDescriptor>& missions,
                          const std::string& startLocation,
                          double capacityScu);

} // namespace haul::route
