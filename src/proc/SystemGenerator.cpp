#include "asterism/proc/SystemGenerator.h"

#include "asterism/core/Log.h"
#include "asterism/math/Math.h"
#include "asterism/proc/NameGenerator.h"
#include "asterism/sim/Orbit.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

namespace asterism::proc {

// Absorbs rounding when a distance is placed exactly minSeparation away.
static constexpr double kSeparationSlack = 1e-9;

const char* toString(ClimateZone z) {
  switch (z) {
    case ClimateZone::Hot:       return "hot";
    case ClimateZone::OuterHot:  return "outer-hot";
    case ClimateZone::Habitable: return "habitable";
    case ClimateZone::Cool:      return "cool";
    case ClimateZone::Cold:      return "cold";
    case ClimateZone::Count:     break;
  }
  return "?";
}

double effectiveTemperatureK(sim::StarClass cls, double distanceM) {
  if (!std::isfinite(distanceM) || distanceM <= 0.0) return std::nan("");

  const auto& star = sim::spectralInfo(cls);
  const auto& ref = sim::referenceSpectralInfo();

  const double t = star.temperatureK / ref.temperatureK;
  const double r = star.radiusSol / ref.radiusSol;
  const double luminosity = (t * t * t * t) * (r * r);

  return 278.3 * std::pow(luminosity, 0.25) / std::sqrt(sim::mToAu(distanceM));
}

ClimateZone climateZone(double temperatureK, const ClimateTable& table) {
  if (temperatureK > table.hotAboveK) return ClimateZone::Hot;
  if (temperatureK > table.outerHotAboveK) return ClimateZone::OuterHot;
  if (temperatureK > table.habitableAboveK) return ClimateZone::Habitable;
  if (temperatureK > table.coolAboveK) return ClimateZone::Cool;
  return ClimateZone::Cold;
}

sim::PlanetType pickPlanetType(double temperatureK, core::Prng& rng, const ClimateTable& table) {
  if (!std::isfinite(temperatureK)) {
    ASTERISM_LOG_WARN("pickPlanetType: non-finite temperature; using Rock");
    return sim::PlanetType::Rock;
  }

  const ClimateZone zone = climateZone(temperatureK, table);
  const auto& weights = table.types[static_cast<std::size_t>(zone)];
  if (const sim::PlanetType* t = rng.chooseWeighted(weights)) return *t;

  ASTERISM_LOG_WARN(std::string("pickPlanetType: empty type table for zone ") + toString(zone) + "; using Rock");
  return sim::PlanetType::Rock;
}

static bool tooClose(double a, double b, double minSep) {
  return std::fabs(a - b) < minSep * (1.0 - kSeparationSlack);
}

// Moves `candidate` off the starbase orbit. Returns nullopt when no distance in
// [lowest, maxOrbit] keeps minSep from the starbase.
static std::optional<double> avoidStarbase(double candidate, double starbaseM, double lowest,
                                           double maxOrbit, double minSep) {
  if (!tooClose(candidate, starbaseM, minSep)) return candidate;

  const bool leansOut = candidate >= starbaseM;
  double c = leansOut ? starbaseM + minSep : starbaseM - minSep;
  c = std::min(std::max(c, lowest), maxOrbit);
  if (!tooClose(c, starbaseM, minSep)) return c;

  c = starbaseM + minSep;
  if (c >= lowest && c <= maxOrbit) return c;
  return std::nullopt;
}

sim::StarSystem generateSystem(core::i64 x, core::i64 y, const core::Prng& root,
                               const SystemGenParams& params) {
  core::Prng rng = root.seedNew("star_" + std::to_string(x) + "," + std::to_string(y));

  sim::StarSystem sys;
  sys.x = x;
  sys.y = y;

  if (const sim::StarClass* cls = rng.chooseWeighted(params.spectralWeights)) {
    sys.starClass = *cls;
  } else {
    ASTERISM_LOG_WARN("generateSystem: empty spectral distribution; using G");
    sys.starClass = sim::StarClass::G;
  }

  sys.name = drawSystemName(rng);

  const double minSep = params.minSeparationM;
  const double maxOrbit = params.maxOrbitM;

  if (rng.random() < params.starbaseProbability) {
    sim::Starbase sb{starbaseName(sys.name), {}, rng.seedNew("starbase_" + sys.name)};
    sb.orbit.distanceM = params.starbaseOrbitM;
    sb.orbit.angleRad = sb.rng.random(0.0, math::kTwoPi);
    sim::placeOnOrbit(sb.orbit);
    ASTERISM_LOG_DEBUG("generateSystem: " + sb.name + " at " +
                       std::to_string(sim::mToAu(sb.orbit.distanceM)) + " AU");
    sys.starbase = std::move(sb);
  }

  const int slots = std::max(0, params.maxPlanets);
  sys.planets.resize(static_cast<std::size_t>(slots));

  double last = rng.random(params.firstOrbitMinM, params.firstOrbitMaxM);
  const double scaleBase = rng.random(params.scaleBaseMin, params.scaleBaseMax);

  for (int i = 0; i < slots; ++i) {
    if (last + minSep > maxOrbit) break;

    const double jitter = rng.random(-params.jitterMax, params.jitterMax);
    const double additive = rng.random(0.0, params.additiveMaxM);

    double candidate = last * std::pow(scaleBase, 1.0 + jitter) + additive;
    candidate = std::max(last + minSep, candidate);
    candidate = std::min(candidate, maxOrbit);

    if (sys.starbase) {
      const auto moved = avoidStarbase(candidate, sys.starbase->orbit.distanceM, last + minSep, maxOrbit, minSep);
      if (!moved) {
        ASTERISM_LOG_DEBUG("generateSystem: " + sys.name + " slot " + std::to_string(i) +
                           " has no room beside the starbase; stopping");
        break;
      }
      candidate = *moved;
    }

    const double roll = rng.random();
    if (roll < params.formationBase - params.formationDecay * static_cast<double>(i)) {
      const double tempK = effectiveTemperatureK(sys.starClass, candidate);

      core::Prng typeRng = rng.seedNew("type_" + std::to_string(std::llround(candidate)));
      const sim::PlanetType type = pickPlanetType(tempK, typeRng, params.climate);

      const double angle = rng.random(0.0, math::kTwoPi);
      std::string name = planetName(sys.name, i);
      core::Prng branch = rng.seedNew("planet_" + name);

      sim::Planet p{std::move(name), type, sys.starClass, i, tempK, {}, std::move(branch)};
      p.orbit.distanceM = candidate;
      p.orbit.angleRad = angle;
      sim::placeOnOrbit(p.orbit);
      sys.planets[static_cast<std::size_t>(i)] = std::move(p);
    }

    last = candidate;
  }

  sys.edgeRadiusM = std::max(params.edgeRadiusFloorM, sys.outermostOrbitM() * params.edgeRadiusFactor);

  if (core::logEnabled(core::LogLevel::Debug)) {
    ASTERISM_LOG_DEBUG("generateSystem: " + sys.name + " (" + std::to_string(x) + ", " + std::to_string(y) +
                       ") class " + sim::toChar(sys.starClass) + ", " + std::to_string(sys.planetCount()) +
                       " planets, starbase " + (sys.starbase ? "yes" : "no"));
  }
  return sys;
}

} // namespace asterism::proc
