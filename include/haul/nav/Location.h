#pragma once

#include "haul/math/Vec.h"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace haul::core {
class JsonWriter;
}

namespace haul::nav {

// A named place cargo can be picked up from or delivered to.
// `type` is a free-form category tag (planet, moon, station, landing_zone, lagrange, ...).
struct Location {
  std::string name;
  std::string type;
  std::string parent; // empty when the location has no parent body
  math::Vec3d posKm{};
};

// Location catalog text format, one location per line:
//
//   # name        | type         | parent  | x y z (km)
//   Area18        | landing_zone | ArcCorp | 18361812 10000 2662349
//   CRU-L1        | lagrange     | -       | 5000000 0 0
//
// Blank lines and '#' comments are ignored. Names must be unique.
bool parseLocationCatalog(std::istream& in,
                          std::vector<Location>& out,
                          std::string* outError = nullptr,
                          std::string_view sourceName = "<catalog>");

bool loadLocationCatalog(const std::string& path,
                         std::vector<Location>& out,
                         std::string* outError = nullptr);

bool saveLocationCatalog(const std::string& path,
                         const std::vector<Location>& locations,
                         std::string* outError = nullptr);

const Location* findLocation(const std::vector<Location>& locations, std::string_view name);

// Flat map position in millions of km: (x, z) / 1e6.
math::Vec2d mapCoordsMkm(const Location& loc);

// [{"name", "type", "parent", "coordinates": [x, y]}] using mapCoordsMkm().
void writeLocationsJson(core::JsonWriter& w, const std::vector<Location>& locations);

} // namespace haul::nav
