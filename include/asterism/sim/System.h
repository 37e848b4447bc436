#pragma once

#include "asterism/core/Random.h"
#include "asterism/sim/Celestial.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace asterism::sim {

struct Planet {
  std::string name;
  PlanetType type{PlanetType::Rock};
  StarClass starClass{StarClass::G};
  // Slot index within the system, 0-based.
  int slot{0};
  // Effective temperature at the orbit (K) used to pick the type.
  double temperatureK{0.0};
  OrbitBody orbit{};
  // Private stream read by proc::generateCharacteristics.
  core::Prng rng;
};

struct Starbase {
  std::string name;
  OrbitBody orbit{};
  core::Prng rng;
};

// One generated star system. Everything except the orbit angle and position
// of its bodies is fixed at generation.
struct StarSystem {
  core::i64 x{0};
  core::i64 y{0};
  StarClass starClass{StarClass::G};
  std::string name;

  // Fixed-length; an empty slot means no planet formed there.
  std::vector<std::optional<Planet>> planets;
  std::optional<Starbase> starbase;

  double edgeRadiusM{0.0};

  std::size_t planetCount() const;
  // Largest orbit distance among planets and starbase; 0 if none.
  double outermostOrbitM() const;
};

// Hit-test order is planets by slot, then the starbase. Returns nullptr on miss.
const OrbitBody* findBodyNear(const StarSystem& sys, double xM, double yM, double radiusM);

// Name of the body returned by findBodyNear, or empty.
std::string bodyNameNear(const StarSystem& sys, double xM, double yM, double radiusM);

// True when (xM, yM) lies outside edgeRadiusM * margin.
bool isBeyondEdge(const StarSystem& sys, double xM, double yM, double margin = 1.1);

// Stable human-readable multi-line dump; identical systems give identical text.
std::string describeSystem(const StarSystem& sys);

} // namespace asterism::sim
