#include "asterism/proc/PlanetCharacteristics.h"

#include "asterism/core/Log.h"
#include "asterism/math/Math.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <string>

namespace asterism::proc {

static constexpr double kEarthDensityGcm3 = 5.51;
static constexpr double kEarthDiameterKm = 12742.0;
static constexpr double kFreezingK = 273.15;
static constexpr double kBoilingK = 373.15;
// Water's triple point, bar.
static constexpr double kTriplePointBar = 0.006;

const char* toString(AtmosphereDensity d) {
  switch (d) {
    case AtmosphereDensity::None:      return "None";
    case AtmosphereDensity::Thin:      return "Thin";
    case AtmosphereDensity::EarthLike: return "Earth-like";
    case AtmosphereDensity::Thick:     return "Thick";
  }
  return "?";
}

const char* toString(Gas g) {
  static constexpr std::array<const char*, static_cast<std::size_t>(Gas::Count)> kNames = {
    "Hydrogen", "Helium", "Nitrogen", "Oxygen", "Carbon Dioxide", "Argon", "Water Vapor", "Methane",
    "Ammonia", "Neon", "Xenon", "Carbon Monoxide", "Ethane", "Chlorine", "Fluorine", "Sulfur Dioxide",
  };
  const auto i = static_cast<std::size_t>(g);
  return i < kNames.size() ? kNames[i] : "?";
}

const char* toString(MineralRichness r) {
  switch (r) {
    case MineralRichness::None:        return "None";
    case MineralRichness::Poor:        return "Poor";
    case MineralRichness::Average:     return "Average";
    case MineralRichness::Rich:        return "Rich";
    case MineralRichness::Exceptional: return "Exceptional";
  }
  return "?";
}

double Atmosphere::percentOf(Gas g) const {
  for (const auto& share : composition) {
    if (share.gas == g) return share.percent;
  }
  return 0.0;
}

double surfaceGravityG(double diameterKm, double densityGcm3) {
  const double g = (densityGcm3 / kEarthDensityGcm3) * (diameterKm / kEarthDiameterKm);
  if (!std::isfinite(g)) return 0.01;
  return math::clamp(g, 0.01, 10.0);
}

static bool isGiant(sim::PlanetType t) {
  return t == sim::PlanetType::GasGiant || t == sim::PlanetType::IceGiant;
}

static double drawDensity(sim::PlanetType type, core::Prng& rng) {
  auto rr = [&](double a, double b) { return rng.random(a, b); };
  double d = 0.0;
  switch (type) {
    case sim::PlanetType::Molten:   d = rr(4.0, 7.0); break;
    case sim::PlanetType::Rock:     d = rr(3.0, 6.0); break;
    case sim::PlanetType::Oceanic:  d = rr(2.8, 4.5); break;
    case sim::PlanetType::Lunar:    d = rr(2.5, 4.0); break;
    case sim::PlanetType::GasGiant: d = rr(0.5, 2.0); break;
    case sim::PlanetType::IceGiant: d = rr(1.0, 2.5); break;
    case sim::PlanetType::Frozen:   d = rr(1.5, 3.5); break;
    default:                        d = rr(3.0, 5.5); break;
  }
  return std::max(0.1, d);
}

static Gas drawPrimaryGas(sim::PlanetType type, double approxTempK, core::Prng& rng) {
  static constexpr std::array<Gas, 2> kGiant = {Gas::Hydrogen, Gas::Helium};
  static constexpr std::array<Gas, 5> kCold = {Gas::Nitrogen, Gas::Nitrogen, Gas::Methane,
                                               Gas::CarbonDioxide, Gas::Argon};
  static constexpr std::array<Gas, 5> kHot = {Gas::CarbonDioxide, Gas::CarbonDioxide, Gas::Nitrogen,
                                              Gas::SulfurDioxide, Gas::WaterVapor};
  static constexpr std::array<Gas, 6> kTemperate = {Gas::Nitrogen, Gas::Nitrogen, Gas::Nitrogen,
                                                    Gas::CarbonDioxide, Gas::Argon, Gas::WaterVapor};
  const Gas* g = nullptr;
  if (isGiant(type)) {
    g = rng.choice(kGiant);
  } else if (approxTempK < 150.0) {
    g = rng.choice(kCold);
  } else if (approxTempK > 500.0) {
    g = rng.choice(kHot);
  } else {
    g = rng.choice(kTemperate);
  }
  return g ? *g : Gas::Nitrogen;
}

static double roundTenth(double v) { return std::round(v * 10.0) / 10.0; }

static std::vector<GasShare> drawComposition(const sim::Planet& planet, core::Prng& rng) {
  const auto gasCount = rng.randomInt(2, 6);

  const double baseK = std::isfinite(planet.temperatureK) ? planet.temperatureK
                                                          : sim::planetTypeInfo(planet.type).baseTemperatureK;
  const double approxTempK = baseK + rng.random(-50.0, 50.0);

  const Gas primary = drawPrimaryGas(planet.type, approxTempK, rng);
  std::vector<GasShare> raw{{primary, rng.random(50.0, 95.0)}};
  double remaining = 100.0 - raw.front().percent;

  std::vector<Gas> unused;
  for (std::size_t i = 0; i < static_cast<std::size_t>(Gas::Count); ++i) {
    if (static_cast<Gas>(i) != primary) unused.push_back(static_cast<Gas>(i));
  }

  for (core::i64 i = 1; i < gasCount && remaining > 0.1 && !unused.empty(); ++i) {
    const auto pick = static_cast<std::size_t>(rng.randomInt(0, static_cast<core::i64>(unused.size()) - 1));
    const Gas gas = unused[pick];
    unused.erase(unused.begin() + static_cast<std::ptrdiff_t>(pick));

    const bool last = i == gasCount - 1 || unused.empty();
    const double percent = last ? remaining : rng.random(0.1, remaining / 1.5);
    if (percent > 0.05) {
      raw.push_back({gas, percent});
      remaining -= percent;
    }
  }

  double total = 0.0;
  for (const auto& s : raw) total += s.percent;

  std::vector<GasShare> out;
  for (const auto& s : raw) {
    const double p = roundTenth(s.percent * 100.0 / total);
    if (p > 0.0) out.push_back({s.gas, p});
  }

  // Rounding residue goes to the primary gas.
  double sum = 0.0;
  for (const auto& s : out) sum += s.percent;
  out.front().percent = std::max(0.0, roundTenth(out.front().percent + (100.0 - sum)));
  return out;
}

static Atmosphere drawAtmosphere(const sim::Planet& planet, double gravityG, core::Prng& rng) {
  const double roll = rng.random();
  int level = roll < 0.2 ? 0 : roll < 0.5 ? 1 : roll < 0.85 ? 2 : 3;

  if (isGiant(planet.type)) {
    level = 3;
  } else if (planet.type == sim::PlanetType::Lunar || planet.type == sim::PlanetType::Molten) {
    static constexpr std::array<int, 3> kSparse = {0, 0, 1};
    level = *rng.choice(kSparse);
  } else if (gravityG < 0.3 && level > 1) {
    level = 1;
  }

  Atmosphere atm;
  atm.density = static_cast<AtmosphereDensity>(level);
  if (level == 0) return atm;

  atm.pressureBar = std::max(0.01, rng.random(0.01, 5.0) * level);
  atm.composition = drawComposition(planet, rng);
  return atm;
}

double surfaceTemperatureK(const sim::Planet& planet, const Atmosphere& atmosphere) {
  const sim::PlanetTypeInfo& info = sim::planetTypeInfo(planet.type);
  if (!std::isfinite(planet.temperatureK) || planet.temperatureK <= 0.0) {
    ASTERISM_LOG_WARN("surfaceTemperatureK: " + planet.name + " has no usable orbit temperature; using " +
                      std::to_string(info.baseTemperatureK) + " K");
    return info.baseTemperatureK;
  }

  const double equilibriumK = planet.temperatureK * std::pow(1.0 - info.albedo, 0.25);

  const double p = atmosphere.pressureBar;
  double greenhouse = 1.0;
  switch (atmosphere.density) {
    case AtmosphereDensity::None:      break;
    case AtmosphereDensity::Thin:      greenhouse = 1.05 + (p / 0.5) * 0.05; break;
    case AtmosphereDensity::EarthLike: greenhouse = 1.10 + p * 0.15; break;
    case AtmosphereDensity::Thick:     greenhouse = 1.25 + (p / 2.0) * 0.35; break;
  }

  const double co2 = atmosphere.percentOf(Gas::CarbonDioxide);
  const double ch4 = atmosphere.percentOf(Gas::Methane);
  const double h2o = atmosphere.percentOf(Gas::WaterVapor);
  if (co2 > 20.0 || ch4 > 5.0 || h2o > 1.0) greenhouse *= 1.15;
  if (co2 > 80.0 || ch4 > 20.0 || h2o > 5.0) greenhouse *= 1.25;
  greenhouse = math::clamp(greenhouse, 1.0, 3.0);

  const double t = std::max(2.0, std::round(equilibriumK * greenhouse));
  if (!std::isfinite(t)) {
    ASTERISM_LOG_WARN("surfaceTemperatureK: non-finite result for " + planet.name + "; using base temperature");
    return info.baseTemperatureK;
  }
  return t;
}

static std::string_view drawHydrosphere(sim::PlanetType type, double tempK, double pressureBar, core::Prng& rng) {
  switch (type) {
    case sim::PlanetType::Oceanic:  return "Global Saline Ocean";
    case sim::PlanetType::Frozen:   return "Global Ice Sheet, Subsurface Ocean Possible";
    case sim::PlanetType::Molten:
    case sim::PlanetType::Lunar:    return "None";
    case sim::PlanetType::GasGiant:
    case sim::PlanetType::IceGiant: return "N/A (Gaseous/Fluid Interior)";
    default: break;
  }

  if (tempK < kFreezingK && pressureBar > kTriplePointBar) {
    return rng.random() < 0.6 ? "Polar Ice Caps, Surface Ice Deposits" : "Scattered Subsurface Ice Pockets";
  }

  // Boiling point rises about 35 K per bar around 1 bar.
  const double boilingK = kBoilingK + (pressureBar - 1.0) * 35.0;
  if (tempK > kFreezingK && tempK < boilingK && pressureBar > 0.01) {
    const double r = rng.random();
    if (r < 0.15) return "Arid, Trace Liquid Water Possible";
    if (r < 0.6) return "Lakes, Rivers, Small Seas";
    return "Significant Oceans and Seas";
  }
  if (tempK > boilingK && pressureBar > 0.01) {
    return (pressureBar > 5.0 && rng.random() < 0.3) ? "Atmospheric Water Vapor, Potential Supercritical Fluid"
                                                     : "Trace Water Vapor";
  }
  return "None or Trace Ice Sublimating";
}

static std::string_view drawLithosphere(sim::PlanetType type, core::Prng& rng) {
  static constexpr std::array<std::string_view, 3> kRock = {
    "Silicate Rock (Granite/Basalt), Tectonically Active?",
    "Carbonaceous Rock, Sedimentary Layers, Fossil Potential?",
    "Iron-Rich Crust, Evidence of Metallic Core",
  };
  static constexpr std::array<std::string_view, 3> kIce = {
    "Water Ice Dominant, Ammonia/Methane Ices Present",
    "Nitrogen/CO2 Ice Glaciers, Possible Cryovolcanism",
    "Mixed Ice/Rock Surface, Sublimation Features",
  };
  switch (type) {
    case sim::PlanetType::Molten:   return "Silicate Lava Flows, Rapidly Cooling Crust";
    case sim::PlanetType::Rock:     return *rng.choice(kRock);
    case sim::PlanetType::Oceanic:  return "Submerged Silicate Crust, Probable Hydrothermal Vents";
    case sim::PlanetType::Lunar:    return "Impact-Pulverized Regolith, Basaltic Maria, Scarce Volatiles";
    case sim::PlanetType::GasGiant: return "No Solid Surface Defined";
    case sim::PlanetType::IceGiant: return "No Solid Surface Defined, Deep Icy/Fluid Mantle";
    case sim::PlanetType::Frozen:   return *rng.choice(kIce);
    default: break;
  }
  ASTERISM_LOG_WARN("drawLithosphere: unknown planet type index " +
                    std::to_string(static_cast<int>(type)));
  return "Unknown Composition";
}

static MineralRichness drawMineralRichness(sim::PlanetType type, core::Prng mineralRng) {
  double chance = 0.5;
  switch (type) {
    case sim::PlanetType::Molten:   chance = 0.6; break;
    case sim::PlanetType::Rock:     chance = 0.8; break;
    case sim::PlanetType::Lunar:    chance = 0.7; break;
    case sim::PlanetType::Frozen:   chance = 0.4; break;
    case sim::PlanetType::Oceanic:  chance = 0.2; break;
    case sim::PlanetType::GasGiant:
    case sim::PlanetType::IceGiant: return MineralRichness::None;
    default: break;
  }
  if (mineralRng.random() > chance) return MineralRichness::None;

  const double r = mineralRng.random();
  if (r < 0.40) return MineralRichness::Poor;
  if (r < 0.75) return MineralRichness::Average;
  if (r < 0.95) return MineralRichness::Rich;
  return MineralRichness::Exceptional;
}

static core::i64 drawBaseMinerals(MineralRichness richness, core::Prng& rng) {
  double factor = 0.0;
  switch (richness) {
    case MineralRichness::None:        return 0;
    case MineralRichness::Poor:        factor = 1.0; break;
    case MineralRichness::Average:     factor = 2.0; break;
    case MineralRichness::Rich:        factor = 5.0; break;
    case MineralRichness::Exceptional: factor = 10.0; break;
  }
  return std::llround(factor * 1000.0 * rng.random(0.8, 1.2));
}

PlanetCharacteristics generateCharacteristics(const sim::Planet& planet) {
  core::Prng rng = planet.rng;
  PlanetCharacteristics c;

  c.diameterKm = static_cast<double>(std::max<core::i64>(1000, rng.randomInt(2000, 20000)));
  c.densityGcm3 = drawDensity(planet.type, rng);
  c.gravityG = surfaceGravityG(c.diameterKm, c.densityGcm3);

  c.atmosphere = drawAtmosphere(planet, c.gravityG, rng);
  c.surfaceTemperatureK = surfaceTemperatureK(planet, c.atmosphere);
  c.hydrosphere = drawHydrosphere(planet.type, c.surfaceTemperatureK, c.atmosphere.pressureBar, rng);
  c.lithosphere = drawLithosphere(planet.type, rng);

  c.mineralRichness = drawMineralRichness(planet.type, rng.seedNew("minerals"));
  c.baseMinerals = drawBaseMinerals(c.mineralRichness, rng);

  if (core::logEnabled(core::LogLevel::Debug)) {
    ASTERISM_LOG_DEBUG("generateCharacteristics: " + planet.name + " " + std::to_string(c.diameterKm) +
                       " km, " + std::to_string(c.gravityG) + " g, " + toString(c.atmosphere.density) +
                       " atmosphere, " + std::to_string(c.surfaceTemperatureK) + " K");
  }
  return c;
}

} // namespace asterism::proc
