#include "haul/service/VehicleCatalog.h"

#include "haul/core/JsonWriter.h"
#include "haul/core/Log.h"
#include "haul/core/TextParse.h"

#include <string>

namespace haul::service {

const std::vector<VehicleSpec>& vehicleCatalog() {
  static const std::vector<VehicleSpec> kShips = {
    {"taurus", "Constellation Taurus", 168.0},
    {"freelancer", "Freelancer", 66.0},
    {"caterpillar", "Caterpillar", 576.0},
    {"cutlass_black", "Cutlass Black", 46.0},
    {"c2_hercules", "C2 Hercules", 696.0},
  };
  return kShips;
}

const VehicleSpec* findVehicle(std::string_view id) {
  const std::string key = core::lowerAscii(core::trimView(id));
  for (const auto& v : vehicleCatalog()) {
    if (key == v.id) return &v;
  }
  return nullptr;
}

double capacityFor(std::string_view id, double fallbackScu) {
  if (const VehicleSpec* v = findVehicle(id)) return v->capacityScu;
  HAUL_LOG_WARN("Unknown ship '" + std::string(id) + "', using default capacity " +
                std::to_string(static_cast<long long>(fallbackScu)) + " SCU");
  return fallbackScu;
}

void writeVehicleCatalogJson(core::JsonWriter& w) {
  w.beginArray();
  for (const auto& v : vehicleCatalog()) {
    w.beginObject();
    w.key("id");
    w.value(v.id);
    w.key("name");
    w.value(v.name);
    w.key("capacity");
    w.value(v.capacityScu);
    w.endObject();
  }
  w.endArray();
}

} // namespace haul::service
