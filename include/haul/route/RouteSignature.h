#pragma once

#include "haul/core/StableHash.h"
#include "haul/route/RouteResult.h"

namespace haul::route {

// Stable 64-bit signatures over planner output, for regression checks in tests and
// for the CLI summary line. Distances and quantities are quantized (1e-6) so the
// signature survives last-bit float differences between platforms.

inline void signatureCargoManifest(core::StableHash64& h, const CargoManifest& cargo) {
  h.addSize(cargo.size());
  for (const auto& kv : cargo) {
    h.addString(kv.first);
    h.addDoubleQ(kv.second);
  }
}

inline void signatureRouteAction(core::StableHash64& h, const RouteAction& a) {
  h.addByte(static_cast<core::u8>(a.kind));
  h.addString(a.missionId);
  h.addString(a.location);
  h.addString(a.cargoType);
  h.addDoubleQ(a.amountScu);
  h.addDoubleQ(a.legDistance);
  h.addBool(a.local);
}

inline core::u64 signatureRouteResult(const RouteResult& r) {
  core::StableHash64 h;

  h.addSize(r.route.size());
  for (const auto& s : r.route) h.addString(s);

  h.addSize(r.missionOrder.size());
  for (const auto& s : r.missionOrder) h.addString(s);

  h.addSize(r.cargoAtEachStep.size());
  for (double c : r.cargoAtEachStep) h.addDoubleQ(c);

  h.addSize(r.cargoTypesAtSteps.size());
  for (const auto& m : r.cargoTypesAtSteps) signatureCargoManifest(h, m);

  h.addDoubleQ(r.totalDistance);
  h.addDoubleQ(r.totalPayout);

  h.addSize(r.completedMissions.size());
  for (const auto& s : r.completedMissions) h.addString(s);

  h.addSize(r.actions.size());
  for (const auto& a : r.actions) signatureRouteAction(h, a);

  return h.value();
}

} // namespace haul::route
