#pragma once

#include "asterism/core/StableHash.h"
#include "asterism/sim/System.h"

namespace asterism::sim {

// Portable 64-bit signatures of generated content for regression checks.
// Distances are hashed in metres quantized to 1 m, angles to 1e-9 rad.

inline void signatureOrbitBody(core::StableHash64& h, const OrbitBody& b) {
  h.addQuantized(b.distanceM, 1.0);
  h.addQuantized(b.angleRad, 1e9);
  h.addBool(b.orbitFault);
}

inline core::u64 signatureStarSystem(const StarSystem& s) {
  core::StableHash64 h;
  h.addI64(s.x);
  h.addI64(s.y);
  h.addByte(static_cast<core::u8>(s.starClass));
  h.addString(s.name);
  h.addQuantized(s.edgeRadiusM, 1.0);

  h.addU64(static_cast<core::u64>(s.planets.size()));
  for (const auto& p : s.planets) {
    h.addBool(p.has_value());
    if (!p) continue;
    h.addString(p->name);
    h.addByte(static_cast<core::u8>(p->type));
    signatureOrbitBody(h, p->orbit);
  }

  h.addBool(s.starbase.has_value());
  if (s.starbase) {
    h.addString(s.starbase->name);
    signatureOrbitBody(h, s.starbase->orbit);
  }
  return h.value();
}

} // namespace asterism::sim
