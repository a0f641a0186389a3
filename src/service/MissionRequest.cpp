#include "haul/service/MissionRequest.h"

#include "haul/core/Log.h"
#include "haul/core/TextParse.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <utility>

namespace haul::service {

namespace {

const char* const kMissionKeys[] = {
  "id", "pickup", "dropoffs", "dropoff", "cargo_scu", "cargo_type",
  "dropoff_cargo_types", "dropoff_cargo_amounts", "payout", "description",
};

bool isMissionKey(std::string_view key) {
  for (const char* k : kMissionKeys) {
    if (key == k) return true;
  }
  return false;
}

std::string where(std::string_view source, std::size_t line) {
  return std::string(source) + ":" + std::to_string(line);
}

std::string fmtNum(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.17g", v);
  return buf;
}

std::string joinList(const std::vector<std::string>& items) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ", ";
    out += core::quoteIfNeeded(items[i]);
  }
  return out;
}

bool fail(std::string* outError, std::string msg) {
  if (outError) *outError = std::move(msg);
  return false;
}

} // namespace

bool parseMissionRequest(std::istream& in, RouteRequest& out, std::string* outError, std::string_view sourceName) {
  out = RouteRequest{};

  std::string line;
  std::size_t lineNo = 0;
  MissionFields* current = nullptr;

  while (std::getline(in, line)) {
    ++lineNo;
    const std::string_view body = core::stripComment(line);
    if (body.empty()) continue;

    if (body.front() == '[') {
      if (body.back() != ']') {
        return fail(outError, where(sourceName, lineNo) + ": unterminated section header");
      }
      const std::string section = core::lowerAscii(core::trimView(body.substr(1, body.size() - 2)));
      if (section != "mission") {
        return fail(outError, where(sourceName, lineNo) + ": unknown section [" + section + "]");
      }
      out.missions.emplace_back();
      current = &out.missions.back();
      current->line = lineNo;
      continue;
    }

    std::string_view name;
    std::string_view value;
    if (!core::splitAssignment(body, name, value)) {
      return fail(outError, where(sourceName, lineNo) + ": expected 'key = value'");
    }
    const std::string key = core::lowerAscii(name);

    if (current) {
      if (!isMissionKey(key)) {
        HAUL_LOG_WARN(where(sourceName, lineNo) + ": unknown mission key '" + key + "'");
      }
      if (current->has(key)) {
        HAUL_LOG_WARN(where(sourceName, lineNo) + ": duplicate key '" + key + "', last value wins");
      }
      current->set(key, std::string(value));
      continue;
    }

    if (key == "start" || key == "start_location") {
      out.startLocation = core::unquote(value);
    } else if (key == "ship" || key == "ship_id") {
      out.shipId = core::unquote(value);
    } else if (key == "capacity" || key == "ship_capacity") {
      double cap = 0.0;
      if (!core::parseDouble(core::unquote(value), cap) || cap <= 0.0) {
        return fail(outError, where(sourceName, lineNo) + ": capacity must be a positive number");
      }
      out.shipCapacity = cap;
    } else if (key == "label") {
      out.label = core::unquote(value);
    } else {
      HAUL_LOG_WARN(where(sourceName, lineNo) + ": ignoring unknown request key '" + key + "'");
    }
  }

  if (out.label.empty()) out.label = std::string(sourceName);
  return true;
}

bool loadMissionRequest(const std::string& path, RouteRequest& out, std::string* outError) {
  std::ifstream f(path);
  if (!f) {
    HAUL_LOG_ERROR("Failed to open mission request: " + path);
    return fail(outError, "Failed to open mission request: " + path);
  }
  return parseMissionRequest(f, out, outError, path);
}

bool saveMissionRequest(const std::string& path, const RouteRequest& request, std::string* outError) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) return fail(outError, "Failed to write mission request: " + path);

  if (!request.label.empty()) f << "label = " << core::quoteIfNeeded(request.label) << "\n";
  f << "start = " << core::quoteIfNeeded(request.startLocation) << "\n";
  if (!request.shipId.empty()) f << "ship = " << core::quoteIfNeeded(request.shipId) << "\n";
  if (request.shipCapacity) f << "capacity = " << fmtNum(*request.shipCapacity) << "\n";

  for (const auto& m : request.missions) {
    f << "\n[mission]\n";
    for (const char* k : kMissionKeys) {
      if (const std::string* v = m.get(k)) f << k << " = " << *v << "\n";
    }
    for (const auto& kv : m.values) {
      if (!isMissionKey(kv.first)) f << kv.first << " = " << kv.second << "\n";
    }
  }

  f.flush();
  if (!f) return fail(outError, "Failed to write mission request: " + path);
  return true;
}

bool normalizeMission(const MissionFields& fields,
                      std::size_t position,
                      route::MissionDescriptor& out,
                      std::string* outError) {
  out = route::MissionDescriptor{};

  const std::string* id = fields.get("id");
  out.id = (id && !core::unquote(*id).empty()) ? core::unquote(*id) : "M" + std::to_string(position + 1);
  const std::string tag = " (" + out.id + ")";

  // pickup
  const std::string* pickup = fields.get("pickup");
  if (!pickup) return fail(outError, "Invalid mission format: missing pickup location" + tag);
  const auto pickups = core::splitQuoted(*pickup, ',');
  if (pickups.empty() || pickups.front().empty()) {
    return fail(outError, "Invalid mission format: missing pickup location" + tag);
  }
  if (pickups.size() > 1) {
    return fail(outError, "Invalid mission format: pickup must be a single location" + tag);
  }
  out.pickup = pickups.front();

  // dropoffs, or the legacy single dropoff
  if (const std::string* list = fields.get("dropoffs")) {
    out.dropoffs = core::splitQuoted(*list, ',');
  } else if (const std::string* single = fields.get("dropoff")) {
    out.dropoffs = core::splitQuoted(*single, ',');
    if (out.dropoffs.size() > 1) {
      return fail(outError, "Invalid mission format: dropoff must be a single location, use dropoffs for a list" + tag);
    }
  } else {
    return fail(outError, "Invalid mission format: missing dropoff location(s)" + tag);
  }
  if (out.dropoffs.empty()) {
    return fail(outError, "Invalid mission format: at least one dropoff location is required" + tag);
  }
  for (const auto& d : out.dropoffs) {
    if (d.empty()) return fail(outError, "Invalid mission format: empty dropoff location" + tag);
  }

  if (const std::string* type = fields.get("cargo_type")) {
    const std::string t = core::unquote(*type);
    if (!t.empty()) out.cargoType = t;
  }

  if (const std::string* types = fields.get("dropoff_cargo_types")) {
    out.dropoffCargoTypes = core::splitQuoted(*types, ',');
  }

  if (const std::string* amounts = fields.get("dropoff_cargo_amounts")) {
    const auto items = core::splitQuoted(*amounts, ',');
    std::vector<double> parsed;
    parsed.reserve(items.size());
    bool ok = true;
    for (const auto& s : items) {
      double v = 0.0;
      if (!core::parseDouble(s, v) || !std::isfinite(v) || v < 0.0) {
        ok = false;
        break;
      }
      parsed.push_back(v);
    }
    if (ok) {
      out.dropoffCargoAmounts = std::move(parsed);
    } else {
      HAUL_LOG_WARN("Could not read dropoff_cargo_amounts [" + *amounts + "]" + tag + ", splitting cargo evenly");
    }
  }

  double cargo = 0.0;
  const std::string* cargoRaw = fields.get("cargo_scu");
  if (cargoRaw && core::parseDouble(core::unquote(*cargoRaw), cargo)) {
    out.cargoScu = cargo;
  } else {
    double sum = 0.0;
    for (double a : out.dropoffCargoAmounts) sum += a;
    out.cargoScu = sum;
    HAUL_LOG_WARN(std::string(cargoRaw ? "Malformed" : "Missing") + " cargo_scu" + tag +
                  ", using sum of dropoff amounts: " + fmtNum(sum));
  }

  if (const std::string* payout = fields.get("payout")) {
    double p = 0.0;
    if (!core::parseDouble(core::unquote(*payout), p)) {
      return fail(outError, "Invalid mission format: payout must be a number" + tag);
    }
    out.payout = p;
  }

  if (const std::string* desc = fields.get("description")) out.description = core::unquote(*desc);
  return true;
}

bool normalizeMissions(const std::vector<MissionFields>& fields,
                       std::vector<route::MissionDescriptor>& out,
                       std::string* outError) {
  out.clear();
  out.reserve(fields.size());
  for (std::size_t i = 0; i < fields.size(); ++i) {
    route::MissionDescriptor d;
    if (!normalizeMission(fields[i], i, d, outError)) {
      out.clear();
      return false;
    }
    out.push_back(std::move(d));
  }
  return true;
}

MissionFields missionFieldsFrom(const route::MissionDescriptor& desc) {
  MissionFields f;
  f.set("id", core::quoteIfNeeded(desc.id));
  f.set("pickup", core::quoteIfNeeded(desc.pickup));
  f.set("dropoffs", joinList(desc.dropoffs));
  f.set("cargo_scu", fmtNum(desc.cargoScu));
  f.set("cargo_type", core::quoteIfNeeded(desc.cargoType));
  if (!desc.dropoffCargoTypes.empty()) f.set("dropoff_cargo_types", joinList(desc.dropoffCargoTypes));
  if (!desc.dropoffCargoAmounts.empty()) {
    std::string amounts;
    for (std::size_t i = 0; i < desc.dropoffCargoAmounts.size(); ++i) {
      if (i > 0) amounts += ", ";
      amounts += fmtNum(desc.dropoffCargoAmounts[i]);
    }
    f.set("dropoff_cargo_amounts", amounts);
  }
  f.set("payout", fmtNum(desc.payout));
  if (!desc.description.empty()) f.set("description", core::quoteIfNeeded(desc.description));
  return f;
}

} // namespace haul::service
