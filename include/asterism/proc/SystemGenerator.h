#pragma once

#include "asterism/core/Random.h"
#include "asterism/sim/System.h"
#include "asterism/sim/Units.h"

#include <array>
#include <vector>

namespace asterism::proc {

enum class ClimateZone : core::u8 {
  Hot,
  OuterHot,
  Habitable,
  Cool,
  Cold,
  Count
};

const char* toString(ClimateZone z);

// Zone thresholds (effective temperature, K) and weighted planet types per zone.
struct ClimateTable {
  double hotAboveK{800.0};
  double outerHotAboveK{390.0};
  double habitableAboveK{260.0};
  double coolAboveK{150.0};

  std::array<std::vector<core::Weighted<sim::PlanetType>>, static_cast<std::size_t>(ClimateZone::Count)> types{{
    // Hot
    {{sim::PlanetType::Molten, 2}, {sim::PlanetType::Rock, 1}},
    // OuterHot
    {{sim::PlanetType::Rock, 2}, {sim::PlanetType::Lunar, 1}, {sim::PlanetType::Molten, 1}},
    // Habitable
    {{sim::PlanetType::Rock, 2}, {sim::PlanetType::Oceanic, 2}, {sim::PlanetType::Lunar, 1}},
    // Cool
    {{sim::PlanetType::Rock, 1}, {sim::PlanetType::Frozen, 1}, {sim::PlanetType::GasGiant, 1},
     {sim::PlanetType::IceGiant, 1}, {sim::PlanetType::Lunar, 1}},
    // Cold
    {{sim::PlanetType::GasGiant, 1}, {sim::PlanetType::IceGiant, 1}, {sim::PlanetType::Frozen, 2},
     {sim::PlanetType::Lunar, 1}},
  }};
};

// All distances in metres.
struct SystemGenParams {
  // Table order is part of the draw contract.
  std::vector<core::Weighted<sim::StarClass>> spectralWeights{
    {sim::StarClass::M, 8}, {sim::StarClass::K, 3}, {sim::StarClass::G, 2},
    {sim::StarClass::F, 1}, {sim::StarClass::A, 1}, {sim::StarClass::B, 1},
    {sim::StarClass::O, 1},
  };

  int maxPlanets{9};

  double starbaseProbability{0.2};
  double starbaseOrbitM{sim::auToM(1.5)};

  double firstOrbitMinM{sim::auToM(0.2)};
  double firstOrbitMaxM{sim::auToM(0.6)};
  double scaleBaseMin{1.5};
  double scaleBaseMax{2.0};
  double jitterMax{0.2};
  double additiveMaxM{sim::auToM(0.05)};
  double minSeparationM{sim::auToM(0.1)};
  double maxOrbitM{sim::auToM(80.0)};

  // Slot i forms a planet with probability formationBase - formationDecay * i.
  double formationBase{0.9};
  double formationDecay{0.03};

  double edgeRadiusFloorM{sim::auToM(5.0)};
  double edgeRadiusFactor{1.5};

  ClimateTable climate{};
};

// Black-body equilibrium temperature at distanceM from a star of class `cls`:
//   L = (T/T_G)^4 * (R/R_G)^2,  T_eff = 278.3 * L^0.25 / sqrt(d_AU).
// NaN for a non-positive or non-finite distance.
double effectiveTemperatureK(sim::StarClass cls, double distanceM);

ClimateZone climateZone(double temperatureK, const ClimateTable& table = {});

// One weighted draw from the zone table. Non-finite temperature gives Rock
// without drawing.
sim::PlanetType pickPlanetType(double temperatureK, core::Prng& rng, const ClimateTable& table = {});

// Derives the system at integer cell (x, y) from `root`. `root` is not advanced.
//
// Draws on rng = root.seedNew("star_{x},{y}"), in this order:
//   1. spectral class (weighted)
//   2. name: number, letter, prefix
//   3. starbase roll; if present, its angle comes from rng.seedNew("starbase_" + name)
//   4. first orbit distance
//   5. spacing scale base
//   6. per slot: jitter, additive, formation roll; when formed the type is drawn
//      from rng.seedNew("type_{round(distance)}"), then the angle from rng, and
//      the planet keeps rng.seedNew("planet_" + planetName)
sim::StarSystem generateSystem(core::i64 x, core::i64 y, const core::Prng& root,
                               const SystemGenParams& params = {});

} // namespace asterism::proc
