#include <catch2/catch_test_macros.hpp>

#include "asterism/math/Math.h"
#include "asterism/proc/SystemGenerator.h"
#include "asterism/render/Nebula.h"
#include "asterism/sim/Orbit.h"
#include "asterism/sim/Signature.h"
#include "asterism/sim/Universe.h"
#include "asterism/sim/Units.h"

#include <cmath>

using namespace asterism;

TEST_CASE("Two sessions with the same seed produce the same system") {
  sim::Universe a("alpha");
  sim::Universe b("alpha");

  const sim::StarSystem& sa = a.system(5, 5);
  const sim::StarSystem& sb = b.system(5, 5);

  REQUIRE(sa.name == sb.name);
  REQUIRE(sa.starClass == sb.starClass);
  REQUIRE(sa.planets.size() == sb.planets.size());
  REQUIRE(sim::describeSystem(sa) == sim::describeSystem(sb));
  REQUIRE(sim::signatureStarSystem(sa) == sim::signatureStarSystem(sb));
}

TEST_CASE("A close orbit around an O star lands in the hot zone") {
  const double t = proc::effectiveTemperatureK(sim::StarClass::O, sim::auToM(0.05));
  REQUIRE(t > 800.0);
  REQUIRE(proc::climateZone(t) == proc::ClimateZone::Hot);

  const double sunlike = proc::effectiveTemperatureK(sim::StarClass::G, sim::auToM(1.0));
  REQUIRE(proc::climateZone(sunlike) == proc::ClimateZone::Habitable);
}

TEST_CASE("Palette midpoint blends the two neighbouring colours") {
  const std::vector<render::RgbF> palette{{0.0, 0.0, 0.0}, {255.0, 255.0, 255.0}};
  const render::RgbF mid = render::paletteColour(palette, 0.5);
  REQUIRE(std::abs(mid.r - 127.5) < 1e-9);
  REQUIRE(std::abs(mid.g - 127.5) < 1e-9);
  REQUIRE(std::abs(mid.b - 127.5) < 1e-9);
}

TEST_CASE("A body returns to its starting angle after one simulated year") {
  sim::StarSystem sys;
  sys.planets.resize(1);
  sys.planets[0] = sim::Planet{"P", sim::PlanetType::Rock, sim::StarClass::G, 0, 280.0, {}, core::Prng("p")};
  sys.planets[0]->orbit.distanceM = sim::auToM(1.0);
  sys.planets[0]->orbit.angleRad = 1.0;

  const sim::OrbitIntegrator integrator;
  for (int i = 0; i < 120; ++i) integrator.advance(sys, 1.0);

  const double a = sys.planets[0]->orbit.angleRad;
  REQUIRE(a >= 0.0);
  REQUIRE(a < math::kTwoPi);
  REQUIRE(std::abs(a - 1.0) < 1e-6);
}

TEST_CASE("An empty system still has the minimum edge radius") {
  proc::SystemGenParams params;
  params.maxPlanets = 0;
  params.starbaseProbability = 0.0;

  const sim::StarSystem sys = proc::generateSystem(0, 0, core::Prng("edge"), params);
  REQUIRE(sys.planetCount() == 0);
  REQUIRE(!sys.starbase);
  REQUIRE(sys.edgeRadiusM == sim::auToM(5.0));
}
