#include "haul/route/MissionLedger.h"

#include <algorithm>
#include <utility>

namespace haul::route {

const char* missionStateName(MissionState s) {
  switch (s) {
    case MissionState::Pending: return "pending";
    case MissionState::InProgress: return "in-progress";
    case MissionState::Completed: return "completed";
  }
  return "?";
}

void addCargo(CargoManifest& cargo, const std::string& type, double scu) {
  if (scu <= 0.0) return;
  cargo[type] += scu;
}

void removeCargo(CargoManifest& cargo, const std::string& type, double scu) {
  auto it = cargo.find(type);
  if (it == cargo.end()) return;
  it->second = std::max(0.0, it->second - scu);
  if (it->second <= kCargoEpsilonScu) cargo.erase(it);
}

double manifestTotal(const CargoManifest& cargo) {
  double total = 0.0;
  for (const auto& kv : cargo) total += kv.second;
  return total;
}

MissionLedger::MissionLedger(std::vector<CargoMission> missions)
  : missions_(std::move(missions)),
    states_(missions_.size(), MissionState::Pending),
    cursors_(missions_.size(), 0),
    pickupSeq_(missions_.size(), 0) {
  for (std::size_t i = 0; i < missions_.size(); ++i) pending_.insert(i);
  completed_.reserve(missions_.size());
}

const std::string* MissionLedger::nextDropoff(std::size_t i) const {
  if (states_[i] != MissionState::InProgress) return nullptr;
  const auto& m = missions_[i];
  if (cursors_[i] >= m.dropoffs.size()) return nullptr;
  return &m.dropoffs[cursors_[i]];
}

double MissionLedger::nextDropoffAmount(std::size_t i) const {
  const auto& m = missions_[i];
  const std::size_t c = cursors_[i];
  if (c < m.dropoffCargoAmounts.size()) return m.dropoffCargoAmounts[c];
  if (m.dropoffs.empty()) return 0.0;
  return m.cargoScu / static_cast<double>(m.dropoffs.size());
}

const std::string& MissionLedger::nextDropoffCargoType(std::size_t i) const {
  const auto& m = missions_[i];
  const std::size_t c = cursors_[i];
  if (c < m.dropoffCargoTypes.size()) return m.dropoffCargoTypes[c];
  return m.cargoType;
}

std::vector<std::size_t> MissionLedger::pending() const {
  return std::vector<std::size_t>(pending_.begin(), pending_.end());
}

std::vector<std::size_t> MissionLedger::inProgress() const {
  std::vector<std::size_t> out;
  out.reserve(inProgress_.size());
  for (const auto& kv : inProgress_) out.push_back(kv.second);
  return out;
}

bool MissionLedger::anyNextDropoffAt(const std::string& location) const {
  for (const auto& kv : inProgress_) {
    const std::string* next = nextDropoff(kv.second);
    if (next && *next == location) return true;
  }
  return false;
}

bool MissionLedger::anyPickupAt(const std::string& location) const {
  for (std::size_t i : pending_) {
    if (missions_[i].pickup == location) return true;
  }
  return false;
}

bool MissionLedger::pickup(std::size_t i, CargoManifest& cargo) {
  if (i >= missions_.size() || states_[i] != MissionState::Pending) return false;

  const auto& m = missions_[i];
  addCargo(cargo, m.cargoType, m.cargoScu);

  pending_.erase(i);
  states_[i] = MissionState::InProgress;
  pickupSeq_[i] = nextSeq_++;
  inProgress_.emplace(pickupSeq_[i], i);
  return true;
}

std::optional<DropoffStep> MissionLedger::dropoff(std::size_t i, CargoManifest& cargo) {
  if (i >= missions_.size() || states_[i] != MissionState::InProgress) return std::nullopt;

  const auto& m = missions_[i];
  const std::size_t c = cursors_[i];
  if (c >= m.dropoffs.size()) return std::nullopt;

  DropoffStep step;
  step.dropoffIndex = c;
  step.location = m.dropoffs[c];
  step.cargoType = nextDropoffCargoType(i);
  step.amountScu = nextDropoffAmount(i);

  removeCargo(cargo, step.cargoType, step.amountScu);
  cursors_[i] = c + 1;

  if (cursors_[i] >= m.dropoffs.size()) {
    inProgress_.erase(pickupSeq_[i]);
    states_[i] = MissionState::Completed;
    completed_.push_back(i);
    step.completedMission = true;
    step.payoutCredited = m.payout;
  }
  return step;
}

} // namespace haul::route
