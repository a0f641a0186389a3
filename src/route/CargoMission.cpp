#include "haul/route/CargoMission.h"

#include <algorithm>
#include <sstream>

namespace haul::route {

CargoMission makeCargoMission(const MissionDescriptor& desc) {
  CargoMission m;
  m.id = desc.id;
  m.pickup = desc.pickup;
  m.dropoffs = desc.dropoffs;
  m.cargoScu = desc.cargoScu;
  m.cargoType = desc.cargoType.empty() ? std::string(kDefaultCargoType) : desc.cargoType;
  m.payout = desc.payout;
  m.description = desc.description;

  const std::size_t n = m.dropoffs.size();

  m.dropoffCargoTypes.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (i < desc.dropoffCargoTypes.size() && !desc.dropoffCargoTypes[i].empty()) {
      m.dropoffCargoTypes.push_back(desc.dropoffCargoTypes[i]);
    } else {
      m.dropoffCargoTypes.push_back(m.cargoType);
    }
  }

  m.dropoffCargoAmounts.reserve(n);
  if (n == 0) return m;

  const std::size_t given = std::min(n, desc.dropoffCargoAmounts.size());
  double specified = 0.0;
  for (std::size_t i = 0; i < given; ++i) {
    m.dropoffCargoAmounts.push_back(desc.dropoffCargoAmounts[i]);
    specified += desc.dropoffCargoAmounts[i];
  }

  const std::size_t rest = n - given;
  if (rest > 0) {
    const double remaining = std::max(0.0, m.cargoScu - specified);
    const double each = remaining / static_cast<double>(rest);
    for (std::size_t i = 0; i < rest; ++i) m.dropoffCargoAmounts.push_back(each);
  }
  return m;
}

std::vector<CargoMission> makeCargoMissions(const std::vector<MissionDescriptor>& descs) {
  std::vector<CargoMission> out;
  out.reserve(descs.size());
  for (const auto& d : descs) out.push_back(makeCargoMission(d));
  return out;
}

std::string describeMission(const CargoMission& m) {
  std::ostringstream oss;
  oss << m.id << ": " << m.pickup << " -> [";
  for (std::size_t i = 0; i < m.dropoffs.size(); ++i) {
    if (i > 0) oss << " -> ";
    oss << m.dropoffs[i] << " (" << m.dropoffCargoTypes[i] << ", " << m.dropoffCargoAmounts[i] << " SCU)";
  }
  oss << "], " << m.cargoScu << " SCU total, " << m.payout << " aUEC";
  return oss.str();
}

} // namespace haul::route
