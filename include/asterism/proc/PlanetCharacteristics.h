#pragma once

#include "asterism/core/Random.h"
#include "asterism/sim/System.h"

#include <string_view>
#include <vector>

namespace asterism::proc {

enum class AtmosphereDensity : core::u8 { None, Thin, EarthLike, Thick };

enum class Gas : core::u8 {
  Hydrogen, Helium, Nitrogen, Oxygen, CarbonDioxide, Argon, WaterVapor, Methane,
  Ammonia, Neon, Xenon, CarbonMonoxide, Ethane, Chlorine, Fluorine, SulfurDioxide,
  Count
};

enum class MineralRichness : core::u8 { None, Poor, Average, Rich, Exceptional };

const char* toString(AtmosphereDensity d);
const char* toString(Gas g);
const char* toString(MineralRichness r);

struct GasShare {
  Gas gas{Gas::Nitrogen};
  double percent{0.0};
};

struct Atmosphere {
  AtmosphereDensity density{AtmosphereDensity::None};
  double pressureBar{0.0};
  // Primary gas first. Empty when density is None, otherwise sums to 100.
  std::vector<GasShare> composition;

  double percentOf(Gas g) const;
};

// Surface detail derived from a planet's private stream.
// Units: km, g/cm^3, Earth gravities, bar, kelvin.
struct PlanetCharacteristics {
  double diameterKm{0.0};
  double densityGcm3{0.0};
  double gravityG{0.0};
  Atmosphere atmosphere{};
  double surfaceTemperatureK{0.0};
  std::string_view hydrosphere{};
  std::string_view lithosphere{};
  MineralRichness mineralRichness{MineralRichness::None};
  core::i64 baseMinerals{0};
};

// Surface gravity relative to Earth from bulk density and diameter,
// clamped to [0.01, 10].
double surfaceGravityG(double diameterKm, double densityGcm3);

// Equilibrium temperature from the planet's black-body temperature and its
// type's albedo, raised by the atmosphere's greenhouse factor (clamped to
// [1, 3]). Rounded, at least 2 K. Falls back to the type's base temperature
// when the planet's temperature is not finite.
double surfaceTemperatureK(const sim::Planet& planet, const Atmosphere& atmosphere);

// Works on a copy of planet.rng, so repeated calls give the same result.
// Draws, in order: diameter, density, atmosphere (density roll, adjustment,
// pressure, gas count, temperature jitter, primary gas, shares), hydrosphere,
// lithosphere; mineral richness uses rng.seedNew("minerals") taken at that
// point and the mineral amount comes last from the planet stream.
PlanetCharacteristics generateCharacteristics(const sim::Planet& planet);

} // namespace asterism::proc
