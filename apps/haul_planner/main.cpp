#include "haul/core/Args.h"
#include "haul/core/Config.h"
#include "haul/core/JobSystem.h"
#include "haul/core/JsonWriter.h"
#include "haul/core/Log.h"
#include "haul/nav/LocationProvider.h"
#include "haul/route/RouteJson.h"
#include "haul/route/RouteSignature.h"
#include "haul/service/MissionRequest.h"
#include "haul/service/RoutePlanner.h"
#include "haul/service/VehicleCatalog.h"

#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace haul;

static void printHelp() {
  std::cout << "haul_planner\n"
            << "  --missions <file>...   Mission request file(s); several files are planned as a batch\n"
            << "  --start <name>         Override the start location of every request\n"
            << "  --ship <id>            Override the ship of every request (see --ships)\n"
            << "  --capacity <scu>       Override the cargo capacity of every request\n"
            << "  --catalog <path>       Location catalog (default: config data.catalog)\n"
            << "  --config <path>        Load config variables from a file\n"
            << "  --threads <n>          Worker threads for batches (default: config planner.threads)\n"
            << "  --json                 Emit JSON instead of text\n"
            << "  --out <path>           Write output to a file instead of stdout ('-' means stdout)\n"
            << "\n"
            << "Data:\n"
            << "  --ships                List known ships and capacities\n"
            << "  --locations            List catalog locations (map coordinates in millions of km)\n"
            << "  --matrix <path>        Write the distance matrix as JSON\n"
            << "\n"
            << "  --log <level>          trace|debug|info|warn|error|off\n"
            << "  --help                 Show this help\n"
            << "\n"
            << "Exit codes: 0 all requests planned, 1 a request failed, 2 usage or data error\n";
}

static std::string fmtFixed(double v, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
  return buf;
}

static void printOutcome(std::ostream& out, const service::RouteRequest& req, const route::RouteOutcome& o) {
  out << "== " << req.label << " ==\n";
  if (!o.success) {
    const auto& e = o.error;
    out << "error [" << route::routeErrorName(e.kind) << "]: " << e.message << "\n";
    if (e.kind == route::RouteErrorKind::InvalidLocations) {
      out << "  valid locations:";
      for (const auto& n : e.validLocations) out << " '" << n << "'";
      out << "\n";
    } else if (e.kind == route::RouteErrorKind::Infeasible) {
      out << "  route so far:";
      for (const auto& n : e.routeSoFar) out << " [" << n << "]";
      out << "\n  completed:";
      for (const auto& n : e.completedMissions) out << " " << n;
      out << "\n  remaining:";
      for (const auto& n : e.remainingMissions) out << " " << n;
      out << "\n";
    }
    return;
  }

  const auto& r = o.result;
  out << "start: " << r.route.front() << "\n";
  for (std::size_t i = 0; i < r.actions.size(); ++i) {
    const auto& a = r.actions[i];
    out << std::setw(3) << (i + 1) << ". " << r.missionOrder[i];
    if (!a.local) out << "  (+" << fmtFixed(a.legDistance / 1.0e6, 2) << " Mkm)";
    out << "  cargo " << fmtFixed(r.cargoAtEachStep[i + 1], 1) << " SCU\n";
  }
  out << "total distance: " << fmtFixed(r.totalDistance / 1.0e6, 3) << " Mkm\n"
      << "total payout:   " << fmtFixed(r.totalPayout, 0) << " aUEC\n"
      << "peak cargo:     " << fmtFixed(r.maxCargo(), 1) << " SCU\n"
      << "completed:     ";
  for (const auto& id : r.completedMissions) out << " " << id;
  out << "\nsignature:      " << (unsigned long long)route::signatureRouteResult(r) << "\n";
}

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Info);

  core::Args args;
  args.setVariadic("missions");
  args.setFlag("json");
  args.setFlag("ships");
  args.setFlag("locations");
  args.setFlag("help");
  args.parse(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  auto& cfg = core::config();
  core::installDefaultConfig(cfg);

  std::string configPath;
  if (args.getString("config", configPath)) {
    std::string err;
    if (!cfg.loadFile(configPath, &err)) {
      std::cerr << "Failed to load config: " << err << "\n";
      return 2;
    }
  }

  std::string logLevel;
  if (args.getString("log", logLevel)) {
    std::string err;
    if (!cfg.setString("log.level", logLevel, &err)) {
      std::cerr << "--log: " << err << "\n";
      return 2;
    }
  }

  std::string catalogPath = cfg.getString("data.catalog", "data/stanton.locations");
  (void)args.getString("catalog", catalogPath);

  const bool json = args.hasFlag("json");
  const bool pretty = cfg.getBool("json.pretty", true);
  const bool listShips = args.hasFlag("ships");
  const bool listLocations = args.hasFlag("locations");
  std::string matrixPath;
  const bool writeMatrix = args.getString("matrix", matrixPath);
  const std::vector<std::string> missionFiles = args.values("missions");

  if (missionFiles.empty() && !listShips && !listLocations && !writeMatrix) {
    std::cerr << "Nothing to do: pass --missions <file>, --ships, --locations or --matrix (see --help)\n";
    return 2;
  }

  std::string outPath;
  (void)args.getString("out", outPath);
  std::unique_ptr<std::ofstream> outFile;
  std::ostream* out = &std::cout;
  if (!outPath.empty() && outPath != "-") {
    outFile = std::make_unique<std::ofstream>(outPath, std::ios::out | std::ios::trunc);
    if (!*outFile) {
      std::cerr << "Failed to open --out file: " << outPath << "\n";
      return 2;
    }
    out = outFile.get();
  }

  if (listShips) {
    if (json) {
      core::JsonWriter w(*out, pretty);
      service::writeVehicleCatalogJson(w);
    } else {
      for (const auto& v : service::vehicleCatalog()) {
        *out << std::left << std::setw(16) << v.id << std::setw(24) << v.name << std::right
             << fmtFixed(v.capacityScu, 0) << " SCU\n";
      }
    }
  }

  // Location data is only needed past this point.
  if (!listLocations && !writeMatrix && missionFiles.empty()) return 0;

  nav::CatalogFileProvider provider(catalogPath, /*loadNow=*/false);

  if (listLocations || writeMatrix) {
    std::string err;
    if (!provider.regenerate(&err)) {
      std::cerr << "Failed to load locations: " << err << "\n";
      return 2;
    }
    const auto snap = provider.snapshot();

    if (listLocations) {
      if (json) {
        core::JsonWriter w(*out, pretty);
        nav::writeLocationsJson(w, snap->locations);
      } else {
        for (const auto& loc : snap->locations) {
          const math::Vec2d p = nav::mapCoordsMkm(loc);
          *out << std::left << std::setw(16) << loc.name << std::setw(14) << loc.type
               << std::setw(12) << (loc.parent.empty() ? "-" : loc.parent) << std::right
               << "(" << fmtFixed(p.x, 3) << ", " << fmtFixed(p.y, 3) << ")\n";
        }
      }
    }

    if (writeMatrix) {
      std::ofstream f(matrixPath, std::ios::out | std::ios::trunc);
      if (!f) {
        std::cerr << "Failed to open --matrix file: " << matrixPath << "\n";
        return 2;
      }
      core::JsonWriter w(f, pretty);
      nav::writeDistanceIndexJson(w, snap->graph.index());
      HAUL_LOG_INFO("Wrote " + std::to_string(snap->graph.size()) + "x" + std::to_string(snap->graph.size()) +
                    " distance matrix to " + matrixPath);
    }
  }

  if (missionFiles.empty()) return 0;

  // Requests
  std::vector<service::RouteRequest> requests;
  requests.reserve(missionFiles.size());
  for (const auto& path : missionFiles) {
    service::RouteRequest req;
    std::string err;
    if (!service::loadMissionRequest(path, req, &err)) {
      std::cerr << err << "\n";
      return 2;
    }
    requests.push_back(std::move(req));
  }

  std::string startOverride;
  std::string shipOverride;
  double capacityOverride = 0.0;
  const bool hasStart = args.getString("start", startOverride);
  const bool hasShip = args.getString("ship", shipOverride);
  const bool hasCapacity = args.has("capacity");
  if (hasCapacity && (!args.getDouble("capacity", capacityOverride) || !(capacityOverride > 0.0))) {
    std::cerr << "--capacity expects a positive number\n";
    return 2;
  }
  for (auto& r : requests) {
    if (hasStart) r.startLocation = startOverride;
    if (hasShip) {
      r.shipId = shipOverride;
      r.shipCapacity.reset();
    }
    if (hasCapacity) r.shipCapacity = capacityOverride;
  }

  std::size_t threads = 0;
  if (args.has("threads")) {
    if (!args.getSize("threads", threads)) {
      std::cerr << "--threads expects a non-negative integer\n";
      return 2;
    }
  } else {
    const auto t = cfg.getInt("planner.threads", 0);
    threads = t > 0 ? static_cast<std::size_t>(t) : 0;
  }

  service::RoutePlanner planner(provider, service::plannerOptionsFromConfig(cfg));

  std::vector<route::RouteOutcome> outcomes;
  if (requests.size() == 1) {
    outcomes.push_back(planner.plan(requests.front()));
  } else {
    core::JobSystem jobs(threads);
    outcomes = planner.planBatch(requests, jobs);
  }

  bool allOk = true;
  for (const auto& o : outcomes) allOk = allOk && o.success;

  if (json) {
    core::JsonWriter w(*out, pretty);
    if (outcomes.size() == 1) {
      route::writeRouteOutcomeJson(w, outcomes.front());
    } else {
      w.beginArray();
      for (std::size_t i = 0; i < outcomes.size(); ++i) {
        w.beginObject();
        w.key("request");
        w.value(requests[i].label);
        w.key("outcome");
        route::writeRouteOutcomeJson(w, outcomes[i]);
        w.endObject();
      }
      w.endArray();
    }
  } else {
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
      if (i > 0) *out << "\n";
      printOutcome(*out, requests[i], outcomes[i]);
    }
  }

  out->flush();
  if (!*out) {
    std::cerr << "Failed to write output\n";
    return 2;
  }
  return allOk ? 0 : 1;
}
