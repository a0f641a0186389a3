#pragma once

#include <string_view>
#include <vector>

namespace haul::core {
class JsonWriter;
}

namespace haul::service {

struct VehicleSpec {
  const char* id;
  const char* name;
  double capacityScu;
};

inline constexpr const char* kDefaultVehicleId = "taurus";
inline constexpr double kDefaultVehicleCapacityScu = 168.0;

// Cargo ships the planner knows by id, in display order.
const std::vector<VehicleSpec>& vehicleCatalog();

const VehicleSpec* findVehicle(std::string_view id);

// Capacity of `id`; unknown or empty ids fall back to `fallbackScu` with a warning.
double capacityFor(std::string_view id, double fallbackScu = kDefaultVehicleCapacityScu);

// [{"id", "name", "capacity"}]
void writeVehicleCatalogJson(core::JsonWriter& w);

} // namespace haul::service
