#include "asterism/proc/SystemGenerator.h"
#include "asterism/sim/Signature.h"
#include "asterism/sim/Universe.h"
#include "tests/test_harness.h"

#include <string>

using namespace asterism;

int test_universe() {
  int failures = 0;

  sim::UniverseParams params;
  params.systemCacheCapacity = 2;
  sim::Universe u("alpha", params);

  CHECK(u.seed() == "alpha");
  CHECK(u.nebula().noise().seed() == "alpha_nebula");

  // Cached systems match direct generation.
  const core::u64 sig55 = sim::signatureStarSystem(proc::generateSystem(5, 5, core::Prng("alpha")));
  {
    sim::StarSystem& s = u.system(5, 5);
    CHECK(sim::signatureStarSystem(s) == sig55);
    CHECK(&u.system(5, 5) == &s);
  }
  CHECK(u.systemCacheStats().hits == 1);
  CHECK(u.systemCacheStats().misses == 1);

  // Orbit progress persists while cached and resets after eviction.
  {
    sim::StarSystem& s = u.system(5, 5);
    const sim::OrbitReport r = u.advanceOrbits(s, 17.0);
    CHECK(r.faulted == 0);
    if (r.updated > 0) CHECK(sim::signatureStarSystem(u.system(5, 5)) != sig55);

    u.system(1, 1);
    u.system(2, 2);
    CHECK(u.systemCacheStats().evictions >= 1);
    CHECK(sim::signatureStarSystem(u.system(5, 5)) == sig55);
  }

  // Background colour comes from the session nebula.
  {
    render::NebulaField neb("alpha");
    CHECK(u.backgroundColour(12.5, -3.25) == neb.colourAt(12.5, -3.25));
  }

  // Star presence comes from the session map.
  {
    const proc::StarMap map("alpha");
    bool agree = true;
    for (int y = -20; y < 20; ++y) {
      for (int x = -20; x < 20; ++x) {
        if (u.hasStarAt(x, y) != map.hasStar(x, y)) agree = false;
      }
    }
    CHECK(agree);
  }

  // Reseed rebuilds everything.
  {
    u.reseed("beta");
    CHECK(u.seed() == "beta");
    CHECK(u.systemCacheStats().size == 0);
    const core::u64 betaSig = sim::signatureStarSystem(proc::generateSystem(5, 5, core::Prng("beta")));
    CHECK(sim::signatureStarSystem(u.system(5, 5)) == betaSig);
    CHECK(u.nebula().noise().seed() == "beta_nebula");
  }

  return failures;
}
