#pragma once

#include "haul/route/CargoMission.h"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace haul::service {

// One mission as it arrived: raw value text per key, typed only by normalizeMission().
struct MissionFields {
  std::map<std::string, std::string, std::less<>> values;
  std::size_t line{0}; // header line in the source file, 0 when built in code

  bool has(std::string_view key) const { return values.find(key) != values.end(); }

  const std::string* get(std::string_view key) const {
    const auto it = values.find(key);
    return it == values.end() ? nullptr : &it->second;
  }

  MissionFields& set(std::string key, std::string raw) {
    values[std::move(key)] = std::move(raw);
    return *this;
  }
};

struct RouteRequest {
  std::vector<MissionFields> missions;
  std::string startLocation;
  std::string shipId;                  // empty: vehicle.default
  std::optional<double> shipCapacity;  // wins over shipId when set
  std::string label;                   // log tag; defaults to the source file name
};

// Mission request text format:
//
//   start = "Port Olisar"
//   ship = taurus            # or: capacity = 168
//
//   [mission]
//   id = M1
//   pickup = "Port Olisar"
//   dropoffs = Area18, Lorville
//   cargo_scu = 50
//   cargo_type = "Medical Supplies"
//   dropoff_cargo_types = Stims, Medpens
//   dropoff_cargo_amounts = 30, 20
//   payout = 15000
//
// Keys before the first [mission] header belong to the request. Unknown keys are
// kept (missions) or ignored (request) with a warning. Only structural problems fail
// the parse; field validation happens in normalizeMission().
bool parseMissionRequest(std::istream& in,
                         RouteRequest& out,
                         std::string* outError = nullptr,
                         std::string_view sourceName = "<request>");

bool loadMissionRequest(const std::string& path, RouteRequest& out, std::string* outError = nullptr);

bool saveMissionRequest(const std::string& path, const RouteRequest& request, std::string* outError = nullptr);

// Validates shape and converts to a descriptor. `position` is 0-based and names
// missions without an id ("M<position+1>").
//
// Rejects: missing or multi-valued pickup, missing dropoffs/dropoff, empty dropoff
// list or entry, multi-valued legacy dropoff, non-numeric payout.
// Lenient: malformed dropoff_cargo_amounts are dropped as a whole; absent or
// malformed cargo_scu becomes the sum of the per-dropoff amounts (0 when none).
bool normalizeMission(const MissionFields& fields,
                      std::size_t position,
                      route::MissionDescriptor& out,
                      std::string* outError = nullptr);

bool normalizeMissions(const std::vector<MissionFields>& fields,
                       std::vector<route::MissionDescriptor>& out,
                       std::string* outError = nullptr);

// Builds raw fields from a typed descriptor (tools, tests).
MissionFields missionFieldsFrom(const route::MissionDescriptor& desc);

} // namespace haul::service
