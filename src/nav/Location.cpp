#include "haul/nav/Location.h"

#include "haul/core/JsonWriter.h"
#include "haul/core/Log.h"
#include "haul/core/TextParse.h"

#include <fstream>
#include <set>
#include <sstream>

namespace haul::nav {

static bool parseCoords(std::string_view text, math::Vec3d& out) {
  std::istringstream iss{std::string(text)};
  std::string a, b, c, extra;
  if (!(iss >> a >> b >> c)) return false;
  if (iss >> extra) return false;
  return core::parseDouble(a, out.x) && core::parseDouble(b, out.y) && core::parseDouble(c, out.z);
}

bool parseLocationCatalog(std::istream& in,
                          std::vector<Location>& out,
                          std::string* outError,
                          std::string_view sourceName) {
  std::vector<Location> parsed;
  std::set<std::string, std::less<>> seen;

  auto fail = [&](int lineNo, const std::string& msg) {
    if (outError) {
      std::ostringstream oss;
      oss << sourceName << ":" << lineNo << ": " << msg;
      *outError = oss.str();
    }
    return false;
  };

  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    const std::string_view sv = core::stripComment(line);
    if (sv.empty()) continue;

    const auto fields = core::splitQuoted(sv, '|');
    if (fields.size() != 4) {
      return fail(lineNo, "expected 'name | type | parent | x y z', got " + std::to_string(fields.size()) + " field(s)");
    }

    Location loc;
    loc.name = fields[0];
    loc.type = fields[1];
    loc.parent = (fields[2] == "-") ? std::string() : fields[2];

    if (loc.name.empty()) return fail(lineNo, "empty location name");
    if (loc.type.empty()) return fail(lineNo, "empty location type for " + loc.name);
    if (!parseCoords(fields[3], loc.posKm)) {
      return fail(lineNo, "bad coordinates for " + loc.name + ": '" + fields[3] + "'");
    }
    if (!seen.insert(loc.name).second) return fail(lineNo, "duplicate location " + loc.name);

    parsed.push_back(std::move(loc));
  }

  for (const auto& loc : parsed) {
    if (!loc.parent.empty() && seen.find(loc.parent) == seen.end()) {
      HAUL_LOG_WARN(std::string(sourceName) + ": " + loc.name + " names unknown parent " + loc.parent);
    }
  }

  out = std::move(parsed);
  return true;
}

bool loadLocationCatalog(const std::string& path, std::vector<Location>& out, std::string* outError) {
  std::ifstream f(path);
  if (!f) {
    if (outError) *outError = "Location catalog not found: " + path;
    return false;
  }
  if (!parseLocationCatalog(f, out, outError, path)) return false;
  HAUL_LOG_DEBUG("Loaded " + std::to_string(out.size()) + " locations from " + path);
  return true;
}

bool saveLocationCatalog(const std::string& path, const std::vector<Location>& locations, std::string* outError) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    if (outError) *outError = "Failed to open location catalog for writing: " + path;
    return false;
  }

  f.setf(std::ios::fixed);
  f.precision(3);

  f << "# name | type | parent | x y z (km)\n";
  for (const auto& loc : locations) {
    f << core::quoteIfNeeded(loc.name) << " | "
      << core::quoteIfNeeded(loc.type) << " | "
      << (loc.parent.empty() ? std::string("-") : core::quoteIfNeeded(loc.parent)) << " | "
      << loc.posKm.x << " " << loc.posKm.y << " " << loc.posKm.z << "\n";
  }

  if (!f) {
    if (outError) *outError = "Failed while writing location catalog: " + path;
    return false;
  }
  return true;
}

const Location* findLocation(const std::vector<Location>& locations, std::string_view name) {
  for (const auto& loc : locations) {
    if (loc.name == name) return &loc;
  }
  return nullptr;
}

math::Vec2d mapCoordsMkm(const Location& loc) {
  return {loc.posKm.x / 1.0e6, loc.posKm.z / 1.0e6};
}

void writeLocationsJson(core::JsonWriter& w, const std::vector<Location>& locations) {
  w.beginArray();
  for (const auto& loc : locations) {
    const math::Vec2d c = mapCoordsMkm(loc);
    w.beginObject();
    w.key("name"); w.value(loc.name);
    w.key("type"); w.value(loc.type);
    w.key("parent");
    if (loc.parent.empty()) {
      w.nullValue();
    } else {
      w.value(loc.parent);
    }
    w.key("coordinates");
    w.beginArray();
    w.value(c.x);
    w.value(c.y);
    w.endArray();
    w.endObject();
  }
  w.endArray();
}

} // namespace haul::nav
