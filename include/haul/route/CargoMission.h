#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace haul::route {

inline constexpr const char* kDefaultCargoType = "General";

// Quantities closer than this to a bound (0, ship capacity) count as on the bound.
inline constexpr double kCargoEpsilonScu = 1e-9;

// A mission as supplied by the request layer. Per-dropoff lists may be shorter or
// longer than `dropoffs`; makeCargoMission() reconciles them.
struct MissionDescriptor {
  std::string id;
  std::string pickup;
  std::vector<std::string> dropoffs;
  double cargoScu{0.0};
  std::string cargoType{kDefaultCargoType};
  std::vector<std::string> dropoffCargoTypes;
  std::vector<double> dropoffCargoAmounts;
  double payout{0.0};
  std::string description;
};

// Normalized, immutable mission. `dropoffs` is the required delivery order.
// dropoffCargoTypes and dropoffCargoAmounts always hold one entry per dropoff.
struct CargoMission {
  std::string id;
  std::string pickup;
  std::vector<std::string> dropoffs;
  double cargoScu{0.0};
  std::string cargoType{kDefaultCargoType};
  std::vector<std::string> dropoffCargoTypes;
  std::vector<double> dropoffCargoAmounts;
  double payout{0.0};
  std::string description;

  std::size_t dropoffCount() const { return dropoffs.size(); }
};

// Per-dropoff reconciliation:
//  - missing cargo types are filled with the mission cargo type; extras are dropped
//  - no amounts: cargoScu split evenly over all dropoffs
//  - fewer amounts than dropoffs: the given ones are kept and max(0, cargoScu - sum(given))
//    is split evenly over the rest
//  - more amounts than dropoffs: extras are dropped
// An empty cargo type falls back to kDefaultCargoType.
CargoMission makeCargoMission(const MissionDescriptor& desc);

std::vector<CargoMission> makeCargoMissions(const std::vector<MissionDescriptor>& descs);

// "M1: Port Olisar -> [Area18 (General, 25 SCU) -> Lorville (General, 25 SCU)], 50 SCU total, 15000 aUEC"
std::string describeMission(const CargoMission& m);

} // namespace haul::route
