#include "haul/route/RouteBuilder.h"

#include "haul/core/Log.h"

#include <cmath>
#include <cstdio>
#include <optional>
#include <set>
#include <string_view>
#include <utility>

namespace haul::route {

namespace {

struct RouteState {
  std::string location;
  double cargoScu{0.0};
  CargoManifest manifest;
};

struct Candidate {
  RouteActionKind kind{RouteActionKind::Pickup};
  std::size_t mission{0};
  OptionScore score;
};

std::string fmtNum(double v, int decimals = 1) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
  return buf;
}

std::string joinNames(const std::vector<std::string>& names) {
  std::string out;
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i > 0) out += ", ";
    out += names[i];
  }
  return out;
}

// Float error over many dropoffs can leave a residue just around 0; snap it to 0.
double settleCargo(double cargo) {
  if (cargo < 0.0 || std::fabs(cargo) < kCargoEpsilonScu) return 0.0;
  return cargo;
}

class RouteRun {
public:
  RouteRun(const nav::LocationGraph& graph,
           double capacity,
           const RouteBuildParams& params,
           const std::vector<CargoMission>& missions,
           const std::string& start)
    : capacity_(capacity),
      params_(params),
      ledger_(missions),
      scorer_(graph, ledger_, params.weights) {
    state_.location = start;
    result_.route.push_back(start);
    result_.cargoAtEachStep.push_back(0.0);
    result_.cargoTypesAtSteps.emplace_back();
  }

  // scorer_ holds a reference to ledger_.
  RouteRun(const RouteRun&) = delete;
  RouteRun& operator=(const RouteRun&) = delete;

  RouteOutcome run() {
    while (!ledger_.finished()) {
      if (stepLocal()) continue;

      const auto best = bestCandidate();
      if (!best) return infeasible();

      execute(best->kind, best->mission, best->score.distance, false, best->score.total);
      if (core::logEnabled(core::LogLevel::Trace)) {
        const auto& s = best->score;
        core::logTagged(core::LogLevel::Trace, params_.logTag,
                        "  score " + fmtNum(s.total, 3) +
                        " = dist " + fmtNum(s.distanceScore, 3) +
                        " + eff " + fmtNum(s.efficiencyScore, 3) +
                        " + cargo " + fmtNum(s.cargoScore, 3) +
                        " + urgency " + fmtNum(s.urgencyScore, 3) +
                        " + bonus " + fmtNum(s.bonusScore, 3) +
                        " + fits " + fmtNum(s.capacityScore, 3));
      }
    }

    core::logTagged(core::LogLevel::Info, params_.logTag,
                    "Route complete: " + std::to_string(result_.completedMissions.size()) + " missions, " +
                    std::to_string(result_.actions.size()) + " actions, distance " +
                    fmtNum(result_.totalDistance) + " km, payout " + fmtNum(result_.totalPayout, 0) + " aUEC");

    RouteOutcome out;
    out.success = true;
    out.result = std::move(result_);
    return out;
  }

private:
  // Executes one zero-distance action at the current location, dropoffs first.
  bool stepLocal() {
    for (std::size_t i : ledger_.inProgress()) {
      const std::string* next = ledger_.nextDropoff(i);
      if (next && *next == state_.location) {
        execute(RouteActionKind::Dropoff, i, 0.0, true, 0.0);
        return true;
      }
    }
    for (std::size_t i : ledger_.pending()) {
      const CargoMission& m = ledger_.mission(i);
      if (m.pickup == state_.location && pickupFits(state_.cargoScu, m.cargoScu, capacity_)) {
        execute(RouteActionKind::Pickup, i, 0.0, true, 0.0);
        return true;
      }
    }
    return false;
  }

  std::optional<Candidate> bestCandidate() const {
    const RouteSnapshot snap{state_.location, state_.cargoScu, capacity_};

    std::optional<Candidate> best;
    auto offer = [&](RouteActionKind kind, std::size_t i, const std::optional<OptionScore>& s) {
      if (!s) return;
      if (!best || s->total > best->score.total) best = Candidate{kind, i, *s};
    };

    for (std::size_t i : ledger_.pending()) offer(RouteActionKind::Pickup, i, scorer_.scorePickup(i, snap));
    for (std::size_t i : ledger_.inProgress()) offer(RouteActionKind::Dropoff, i, scorer_.scoreDropoff(i, snap));
    return best;
  }

  void execute(RouteActionKind kind, std::size_t i, double leg, bool local, double score) {
    const CargoMission& m = ledger_.mission(i);

    RouteAction action;
    action.kind = kind;
    action.missionId = m.id;
    action.legDistance = leg;
    action.local = local;
    action.score = score;

    std::string text;
    bool completed = false;

    if (kind == RouteActionKind::Pickup) {
      if (!ledger_.pickup(i, state_.manifest)) return;
      state_.cargoScu = settleCargo(state_.cargoScu + m.cargoScu);
      state_.location = m.pickup;

      action.location = m.pickup;
      action.cargoType = m.cargoType;
      action.amountScu = m.cargoScu;
      text = "Pickup " + m.id + " - " + m.cargoType;
    } else {
      const auto step = ledger_.dropoff(i, state_.manifest);
      if (!step) return;
      state_.cargoScu = settleCargo(state_.cargoScu - step->amountScu);
      state_.location = step->location;

      action.location = step->location;
      action.cargoType = step->cargoType;
      action.amountScu = step->amountScu;
      text = "Dropoff " + m.id + " at " + step->location + " - " + step->cargoType;

      if (step->completedMission) {
        completed = true;
        result_.totalPayout += step->payoutCredited;
        result_.completedMissions.push_back(m.id);
      }
    }

    result_.totalDistance += leg;
    result_.route.push_back(state_.location);
    result_.missionOrder.push_back(text);
    result_.cargoAtEachStep.push_back(state_.cargoScu);
    result_.cargoTypesAtSteps.push_back(state_.manifest);
    result_.actions.push_back(std::move(action));

    if (core::logEnabled(core::LogLevel::Debug)) {
      std::string line = text + (local ? " (local)" : " (+" + fmtNum(leg) + " km)") +
                         ", cargo " + fmtNum(state_.cargoScu) + "/" + fmtNum(capacity_);
      if (completed) line += ", completed";
      core::logTagged(core::LogLevel::Debug, params_.logTag, line);
    }
  }

  RouteOutcome infeasible() {
    RouteOutcome out = makeRouteFailure(RouteErrorKind::Infeasible,
                                        "Cannot complete all missions with the given ship capacity");
    out.error.routeSoFar = result_.route;
    out.error.completedMissions = result_.completedMissions;
    for (std::size_t i : ledger_.pending()) out.error.remainingMissions.push_back(ledger_.mission(i).id);
    for (std::size_t i : ledger_.inProgress()) out.error.remainingMissions.push_back(ledger_.mission(i).id);

    core::logTagged(core::LogLevel::Warn, params_.logTag,
                    out.error.message + " (capacity " + fmtNum(capacity_) + " SCU, cargo aboard " +
                    fmtNum(state_.cargoScu) + " SCU, remaining: " + joinNames(out.error.remainingMissions) + ")");

    out.result = std::move(result_);
    return out;
  }

  double capacity_{0.0};
  const RouteBuildParams& params_;

  MissionLedger ledger_;
  OptionScorer scorer_;
  RouteState state_;
  RouteResult result_;
};

} // namespace

RouteBuilder::RouteBuilder(const nav::LocationGraph& graph, double capacityScu, RouteBuildParams params)
  : graph_(graph), capacityScu_(capacityScu), params_(std::move(params)) {}

RouteOutcome RouteBuilder::compute(const std::vector<CargoMission>& missions, const std::string& startLocation) const {
  if (missions.empty()) {
    return makeRouteFailure(RouteErrorKind::NoMissions, "No missions provided");
  }
  if (graph_.empty()) {
    return makeRouteFailure(RouteErrorKind::LocationDataUnavailable, "Location data not loaded");
  }
  if (!std::isfinite(capacityScu_) || capacityScu_ <= 0.0) {
    return makeRouteFailure(RouteErrorKind::InvalidRequest,
                            "Ship capacity must be a positive number, got " + fmtNum(capacityScu_));
  }
  if (startLocation.empty()) {
    return makeRouteFailure(RouteErrorKind::InvalidRequest, "No start location provided");
  }

  for (const auto& m : missions) {
    if (m.pickup.empty()) {
      return makeRouteFailure(RouteErrorKind::InvalidRequest,
                              "Invalid mission format: missing pickup location (" + m.id + ")");
    }
    if (m.dropoffs.empty()) {
      return makeRouteFailure(RouteErrorKind::InvalidRequest,
                              "Invalid mission format: at least one dropoff location is required (" + m.id + ")");
    }
    if (!std::isfinite(m.cargoScu) || m.cargoScu < 0.0 || !std::isfinite(m.payout) || m.payout < 0.0) {
      return makeRouteFailure(RouteErrorKind::InvalidRequest,
                              "Invalid mission format: cargo and payout must be non-negative numbers (" + m.id + ")");
    }
    for (double amount : m.dropoffCargoAmounts) {
      if (!std::isfinite(amount) || amount < 0.0) {
        return makeRouteFailure(RouteErrorKind::InvalidRequest,
                                "Invalid mission format: cargo and payout must be non-negative numbers (" + m.id + ")");
      }
    }
  }

  // Unknown names in first-appearance order: start, then each mission's pickup and dropoffs.
  std::vector<std::string> invalid;
  std::set<std::string, std::less<>> seen;
  auto check = [&](const std::string& name) {
    if (graph_.contains(name)) return;
    if (seen.insert(name).second) invalid.push_back(name);
  };
  check(startLocation);
  for (const auto& m : missions) {
    check(m.pickup);
    for (const auto& d : m.dropoffs) check(d);
  }
  if (!invalid.empty()) {
    RouteOutcome out = makeRouteFailure(RouteErrorKind::InvalidLocations,
                                        "Invalid locations in request: " + joinNames(invalid));
    out.error.invalidLocations = std::move(invalid);
    out.error.validLocations = graph_.names();
    core::logTagged(core::LogLevel::Warn, params_.logTag, out.error.message);
    return out;
  }

  core::logTagged(core::LogLevel::Debug, params_.logTag,
                  "Routing " + std::to_string(missions.size()) + " missions from " + startLocation +
                  ", capacity " + fmtNum(capacityScu_) + " SCU");

  RouteRun run(graph_, capacityScu_, params_, missions, startLocation);
  return run.run();
}

RouteOutcome computeRoute(const nav::LocationGraph& graph,
                          const std::vector<MissionDescriptor>& missions,
                          const std::string& startLocation,
                          double capacityScu) {
  RouteBuilder builder(graph, capacityScu);
  return builder.compute(makeCargoMissions(missions), startLocation);
}

} // namespace haul::route
