#include "asterism/sim/Signature.h"
#include "asterism/sim/System.h"
#include "asterism/sim/Units.h"
#include "tests/test_harness.h"

#include <cmath>
#include <string>

using namespace asterism;

static sim::StarSystem makeSystem() {
  sim::StarSystem s;
  s.x = 4;
  s.y = -2;
  s.starClass = sim::StarClass::K;
  s.name = "Ross-12C";
  s.planets.resize(2);

  sim::Planet p{"Ross-12C I", sim::PlanetType::Lunar, sim::StarClass::K, 0, 300.0, {}, core::Prng("p")};
  p.orbit.distanceM = sim::auToM(1.0);
  p.orbit.angleRad = 0.0;
  p.orbit.positionM = {sim::auToM(1.0), 0.0};
  s.planets[0] = std::move(p);

  s.starbase = sim::Starbase{"Ross-12C Starbase", {}, core::Prng("sb")};
  s.starbase->orbit.distanceM = sim::auToM(2.0);
  s.starbase->orbit.positionM = {0.0, sim::auToM(2.0)};

  s.edgeRadiusM = sim::auToM(5.0);
  return s;
}

int test_system_queries() {
  int failures = 0;

  const sim::StarSystem s = makeSystem();

  CHECK(s.planetCount() == 1);
  CHECK(s.outermostOrbitM() == sim::auToM(2.0));

  // Hit-testing.
  {
    const double r = sim::auToM(0.05);
    const sim::OrbitBody* hit = sim::findBodyNear(s, sim::auToM(1.01), 0.0, r);
    CHECK(hit == &s.planets[0]->orbit);
    CHECK(sim::bodyNameNear(s, sim::auToM(1.01), 0.0, r) == "Ross-12C I");

    CHECK(sim::findBodyNear(s, 0.0, sim::auToM(1.98), r) == &s.starbase->orbit);
    CHECK(sim::bodyNameNear(s, 0.0, sim::auToM(1.98), r) == "Ross-12C Starbase");

    CHECK(sim::findBodyNear(s, sim::auToM(3.0), sim::auToM(3.0), r) == nullptr);
    CHECK(sim::bodyNameNear(s, sim::auToM(3.0), sim::auToM(3.0), r).empty());
    CHECK(sim::findBodyNear(s, std::nan(""), 0.0, r) == nullptr);
  }

  // Edge with the default 1.1 margin.
  {
    CHECK(!sim::isBeyondEdge(s, sim::auToM(5.4), 0.0));
    CHECK(sim::isBeyondEdge(s, sim::auToM(5.6), 0.0));
    CHECK(sim::isBeyondEdge(s, sim::auToM(5.4), 0.0, 1.0));
    CHECK(sim::isBeyondEdge(s, std::nan(""), 0.0));
  }

  // Description and signature track content, not identity.
  {
    const sim::StarSystem t = makeSystem();
    CHECK(sim::describeSystem(s) == sim::describeSystem(t));
    CHECK(sim::signatureStarSystem(s) == sim::signatureStarSystem(t));

    const std::string text = sim::describeSystem(s);
    CHECK(text.find("Ross-12C @ (4, -2)") != std::string::npos);
    CHECK(text.find("class K") != std::string::npos);
    CHECK(text.find("Ross-12C I: Lunar") != std::string::npos);
    CHECK(text.find("[1] -") != std::string::npos);
    CHECK(text.find("starbase: Ross-12C Starbase") != std::string::npos);

    sim::StarSystem moved = makeSystem();
    moved.planets[0]->orbit.angleRad = 1.0;
    CHECK(sim::signatureStarSystem(moved) != sim::signatureStarSystem(s));
    CHECK(sim::describeSystem(moved) != sim::describeSystem(s));
  }

  // Constant tables.
  {
    const auto& o = sim::spectralInfo(sim::StarClass::O);
    CHECK(o.letter == 'O');
    CHECK(o.temperatureK == 40000.0);
    CHECK(o.colourHex == "#6A8DFF");
    CHECK(o.glyph == '*');
    CHECK(sim::referenceSpectralInfo().letter == 'G');
    CHECK(sim::spectralInfo(sim::StarClass::Count).letter == 'G');

    sim::StarClass c{};
    CHECK(sim::parseStarClass('m', c) && c == sim::StarClass::M);
    CHECK(!sim::parseStarClass('Q', c));

    CHECK(sim::planetTypeInfo(sim::PlanetType::Frozen).baseTemperatureK == 50.0);
    CHECK(sim::planetTypeInfo(sim::PlanetType::Molten).palette[0] == "#200000");
    CHECK(sim::toString(sim::PlanetType::GasGiant) == "GasGiant");

    sim::PlanetType t{};
    CHECK(sim::parsePlanetType("icegiant", t) && t == sim::PlanetType::IceGiant);
    CHECK(!sim::parsePlanetType("Desert", t));
  }

  return failures;
}
