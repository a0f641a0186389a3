#pragma once

#include "haul/nav/LocationGraph.h"
#include "haul/route/MissionLedger.h"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace haul::route {

// Hand-tuned additive weights. Changing any of them changes every route the
// planner produces, so the defaults are part of the output contract.
struct OptionScoreWeights {
  double efficiency{10000.0};

  // Pickup terms.
  double pickupCargoRoom{2000.0};    // x (1 - cargo / capacity)
  double pickupDropoffBonus{5000.0}; // target is some in-progress mission's next dropoff
  double pickupFits{3000.0};         // always earned: non-fitting pickups are never scored

  // Dropoff terms.
  double dropoffCargoLoad{3000.0};   // x (cargo / capacity)
  double dropoffUrgency{4000.0};     // x (dropoff quantity / capacity)
  double dropoffPickupBonus{3000.0}; // target is some pending mission's pickup
};

// The part of the route state a score depends on.
struct RouteSnapshot {
  std::string_view location;
  double cargoScu{0.0};
  double capacityScu{0.0};
};

// Score breakdown. `total` is the sum of the other score terms; `distance` is the
// leg length to the target and is not itself a term.
struct OptionScore {
  double total{0.0};
  double distance{0.0};

  double distanceScore{0.0};   // -distance, never positive
  double efficiencyScore{0.0};
  double cargoScore{0.0};      // pickup: room factor, dropoff: load factor
  double urgencyScore{0.0};    // dropoff only
  double bonusScore{0.0};      // co-located dropoff (pickup) or pickup (dropoff)
  double capacityScore{0.0};   // pickup only
};

// payout / max(1, sum of distance(pickup, dropoff_k)). std::nullopt when a
// location is unknown to the graph.
std::optional<double> missionEfficiency(const nav::LocationGraph& graph, const CargoMission& m);

// True when the mission's full quantity fits on top of `cargoScu`.
bool pickupFits(double cargoScu, double missionScu, double capacityScu);

// Scores candidate next actions for one route computation.
//
// Mission efficiencies are computed once at construction. The scorer reads the
// ledger but never changes it.
class OptionScorer {
public:
  OptionScorer(const nav::LocationGraph& graph,
               const MissionLedger& ledger,
               OptionScoreWeights weights = {});

  double efficiency(std::size_t mission) const { return efficiency_[mission]; }
  const OptionScoreWeights& weights() const { return weights_; }

  // std::nullopt unless the mission is pending, fits and both locations are known.
  std::optional<OptionScore> scorePickup(std::size_t mission, const RouteSnapshot& state) const;

  // std::nullopt unless the mission is in progress and both locations are known.
  std::optional<OptionScore> scoreDropoff(std::size_t mission, const RouteSnapshot& state) const;

private:
  std::optional<double> travel(std::string_view from, std::string_view to) const;

  const nav::LocationGraph& graph_;
  const MissionLedger& ledger_;
  OptionScoreWeights weights_;
  std::vector<double> efficiency_;
};

} // namespace haul::route
