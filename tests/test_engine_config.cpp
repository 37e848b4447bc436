#include "asterism/config/EngineConfig.h"
#include "asterism/sim/Units.h"
#include "tests/test_harness.h"

#include <cmath>
#include <string>

using namespace asterism;

static bool near(double a, double b, double eps) { return std::abs(a - b) <= eps; }

int test_engine_config() {
  int failures = 0;

  // Defaults round-trip through the registry.
  {
    core::CVarRegistry reg;
    config::installEngineCVars(reg);
    config::installEngineCVars(reg);

    const config::EngineConfig cfg = config::engineConfigFromCVars(reg);
    const sim::UniverseParams d{};

    CHECK(cfg.seed == "haunting beauty");
    CHECK(cfg.logLevel == core::LogLevel::Info);
    CHECK(cfg.universe.nebula.palette.size() == 3);
    CHECK(cfg.universe.nebula.palette[0].r == 0x5A);
    CHECK(cfg.universe.nebula.palette[2].g == 0x50);
    CHECK(cfg.universe.nebula.cacheCapacity == 10000);
    CHECK(cfg.universe.nebula.scale == 0.05);
    CHECK(cfg.universe.system.maxPlanets == 9);
    CHECK(cfg.universe.system.spectralWeights.size() == d.system.spectralWeights.size());
    CHECK(near(cfg.universe.system.maxOrbitM, d.system.maxOrbitM, 1.0));
    CHECK(near(cfg.universe.system.starbaseOrbitM, sim::auToM(1.5), 1.0));
    CHECK(cfg.universe.orbit.secondsPerSimulatedYear == 120.0);
    CHECK(reg.getString("nebula.palette") == "#5A0046,#000A5A,#00500A");
    CHECK(reg.getString("system.spectralWeights") == "M:8,K:3,G:2,F:1,A:1,B:1,O:1");
  }

  // Malformed values fall back to defaults; good ones apply.
  {
    core::CVarRegistry reg;
    config::installEngineCVars(reg);
    reg.setString("nebula.palette", "#FFFFFF,#zz0000");
    reg.setString("system.spectralWeights", "G:1,Q:2");
    reg.setString("log.level", "chatty");
    reg.setInt("nebula.cacheCapacity", -5);
    reg.setFloat("system.minSeparationAU", 0.2);
    reg.setString("universe.seed", "alpha");

    const config::EngineConfig cfg = config::engineConfigFromCVars(reg);
    CHECK(cfg.seed == "alpha");
    CHECK(cfg.logLevel == core::LogLevel::Info);
    CHECK(cfg.universe.nebula.palette.size() == 3);
    CHECK(cfg.universe.nebula.cacheCapacity == 10000);
    CHECK(cfg.universe.system.spectralWeights.size() == 7);
    CHECK(near(cfg.universe.system.minSeparationM, sim::auToM(0.2), 1.0));
  }

  // Cache precision is clamped as a 64-bit value, never wrapped.
  {
    core::CVarRegistry reg;
    config::installEngineCVars(reg);
    reg.setInt("nebula.cachePrecision", 4294967298LL);
    reg.setInt("noise.cachePrecision", -4294967295LL);

    const config::EngineConfig cfg = config::engineConfigFromCVars(reg);
    CHECK(cfg.universe.nebula.cachePrecision == 10);
    CHECK(cfg.universe.nebula.noise.cachePrecision == 0);
  }

  // Parsers.
  {
    std::vector<core::Weighted<sim::StarClass>> w;
    std::string err;
    CHECK(config::parseSpectralWeights("g:2, M", w, &err));
    CHECK(w.size() == 2);
    CHECK(w.size() == 2 && w[0].value == sim::StarClass::G && w[0].weight == 2);
    CHECK(w.size() == 2 && w[1].value == sim::StarClass::M && w[1].weight == 1);
    CHECK(!config::parseSpectralWeights("", w, &err));
    CHECK(!config::parseSpectralWeights("O:0", w, &err));
    CHECK(!config::parseSpectralWeights("O:-1", w, &err));
    CHECK(w.size() == 2);

    std::vector<render::RgbF> p;
    CHECK(config::parsePalette("#000, ffffff", p, &err));
    CHECK(p.size() == 2);
    CHECK(p.size() == 2 && p[1].b == 255.0);
    CHECK(config::formatPalette(p) == "#000000,#FFFFFF");
    CHECK(!config::parsePalette("#12345", p, &err));
    CHECK(p.size() == 2);
  }

  return failures;
}
