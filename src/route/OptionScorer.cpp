#include "haul/route/OptionScorer.h"

#include <algorithm>

namespace haul::route {

std::optional<double> missionEfficiency(const nav::LocationGraph& graph, const CargoMission& m) {
  double sum = 0.0;
  for (const auto& d : m.dropoffs) {
    const auto dist = graph.distance(m.pickup, d);
    if (!dist) return std::nullopt;
    sum += *dist;
  }
  return m.payout / std::max(1.0, sum);
}

bool pickupFits(double cargoScu, double missionScu, double capacityScu) {
  return cargoScu + missionScu <= capacityScu + kCargoEpsilonScu;
}

OptionScorer::OptionScorer(const nav::LocationGraph& graph,
                           const MissionLedger& ledger,
                           OptionScoreWeights weights)
  : graph_(graph), ledger_(ledger), weights_(weights) {
  efficiency_.reserve(ledger_.size());
  for (const auto& m : ledger_.missions()) {
    // Unknown locations are rejected before routing.
    efficiency_.push_back(missionEfficiency(graph_, m).value_or(0.0));
  }
}

std::optional<double> OptionScorer::travel(std::string_view from, std::string_view to) const {
  return graph_.distance(from, to);
}

std::optional<OptionScore> OptionScorer::scorePickup(std::size_t mission, const RouteSnapshot& state) const {
  if (mission >= ledger_.size() || ledger_.state(mission) != MissionState::Pending) return std::nullopt;
  if (state.capacityScu <= 0.0) return std::nullopt;

  const CargoMission& m = ledger_.mission(mission);
  if (!pickupFits(state.cargoScu, m.cargoScu, state.capacityScu)) return std::nullopt;

  const auto d = travel(state.location, m.pickup);
  if (!d) return std::nullopt;

  OptionScore s;
  s.distance = *d;
  s.distanceScore = (*d > 0.0) ? -*d : 0.0;
  s.efficiencyScore = efficiency_[mission] * weights_.efficiency;
  s.cargoScore = (1.0 - state.cargoScu / state.capacityScu) * weights_.pickupCargoRoom;
  s.bonusScore = ledger_.anyNextDropoffAt(m.pickup) ? weights_.pickupDropoffBonus : 0.0;
  s.capacityScore = weights_.pickupFits;
  s.total = s.distanceScore + s.efficiencyScore + s.cargoScore + s.bonusScore + s.capacityScore;
  return s;
}

std::optional<OptionScore> OptionScorer::scoreDropoff(std::size_t mission, const RouteSnapshot& state) const {
  if (mission >= ledger_.size()) return std::nullopt;
  if (state.capacityScu <= 0.0) return std::nullopt;

  const std::string* target = ledger_.nextDropoff(mission);
  if (!target) return std::nullopt;

  const auto d = travel(state.location, *target);
  if (!d) return std::nullopt;

  const double qty = ledger_.nextDropoffAmount(mission);

  OptionScore s;
  s.distance = *d;
  s.distanceScore = (*d > 0.0) ? -*d : 0.0;
  s.efficiencyScore = efficiency_[mission] * weights_.efficiency;
  s.cargoScore = (state.cargoScu / state.capacityScu) * weights_.dropoffCargoLoad;
  s.urgencyScore = (qty / state.capacityScu) * weights_.dropoffUrgency;
  s.bonusScore = ledger_.anyPickupAt(*target) ? weights_.dropoffPickupBonus : 0.0;
  s.total = s.distanceScore + s.efficiencyScore + s.cargoScore + s.urgencyScore + s.bonusScore;
  return s;
}

} // namespace haul::route
