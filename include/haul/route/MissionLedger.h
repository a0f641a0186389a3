#pragma once

#include "haul/core/Types.h"
#include "haul/route/CargoMission.h"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace haul::route {

enum class MissionState : core::u8 {
  Pending = 0,  // not picked up
  InProgress,   // picked up, dropoffs remaining
  Completed,    // every dropoff executed
};

const char* missionStateName(MissionState s);

// Cargo aboard by type (SCU). Ordered so snapshots print deterministically.
using CargoManifest = std::map<std::string, double>;

void addCargo(CargoManifest& cargo, const std::string& type, double scu);

// Decreases `type` by `scu`, clamping at 0 and erasing the entry once it reaches 0.
// A type that is not aboard is left untouched.
void removeCargo(CargoManifest& cargo, const std::string& type, double scu);

double manifestTotal(const CargoManifest& cargo);

struct DropoffStep {
  std::size_t dropoffIndex{0};
  std::string location;
  std::string cargoType;
  double amountScu{0.0};
  bool completedMission{false};
  double payoutCredited{0.0}; // non-zero only on the final dropoff
};

// Route-scoped progress over an immutable mission list.
//
// Missions move Pending -> InProgress -> Completed and never back. Every mission is
// in exactly one partition:
//  - pending():    input order
//  - inProgress(): pickup order
//  - completed():  completion order
// The ledger never checks capacity; the caller decides whether a pickup fits.
class MissionLedger {
public:
  explicit MissionLedger(std::vector<CargoMission> missions);

  std::size_t size() const { return missions_.size(); }
  const CargoMission& mission(std::size_t i) const { return missions_[i]; }
  const std::vector<CargoMission>& missions() const { return missions_; }

  MissionState state(std::size_t i) const { return states_[i]; }
  std::size_t cursor(std::size_t i) const { return cursors_[i]; }

  // Next dropoff of an in-progress mission; nullptr for any other state.
  const std::string* nextDropoff(std::size_t i) const;
  double nextDropoffAmount(std::size_t i) const;
  const std::string& nextDropoffCargoType(std::size_t i) const;

  std::vector<std::size_t> pending() const;
  std::vector<std::size_t> inProgress() const;
  const std::vector<std::size_t>& completed() const { return completed_; }

  bool hasPending() const { return !pending_.empty(); }
  bool hasInProgress() const { return !inProgress_.empty(); }
  bool finished() const { return pending_.empty() && inProgress_.empty(); }

  // True when some in-progress mission's next dropoff is `location`.
  bool anyNextDropoffAt(const std::string& location) const;
  // True when some pending mission is picked up at `location`.
  bool anyPickupAt(const std::string& location) const;

  // Pending -> InProgress. Adds the full mission quantity under the mission cargo type.
  // Returns false (no change) when the mission is not pending.
  bool pickup(std::size_t i, CargoManifest& cargo);

  // Executes the next dropoff of an in-progress mission, advancing its cursor and
  // moving it to Completed after the last one. std::nullopt when not in progress.
  std::optional<DropoffStep> dropoff(std::size_t i, CargoManifest& cargo);

private:
  std::vector<CargoMission> missions_;
  std::vector<MissionState> states_;
  std::vector<std::size_t> cursors_;
  std::vector<core::u64> pickupSeq_;

  std::set<std::size_t> pending_;
  std::map<core::u64, std::size_t> inProgress_; // pickup sequence -> mission
  std::vector<std::size_t> completed_;
  core::u64 nextSeq_{0};
};

} // namespace haul::route
