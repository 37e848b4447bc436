#include "asterism/core/Random.h"
#include "asterism/proc/Noise.h"
#include "tests/test_harness.h"

#include <cmath>
#include <limits>

using namespace asterism;

int test_noise() {
  int failures = 0;

  CHECK(proc::smootherstep(0.0) == 0.0);
  CHECK(proc::smootherstep(1.0) == 1.0);
  CHECK(proc::smootherstep(0.5) == 0.5);
  CHECK(proc::interp(0.0, 2.0, 4.0) == 2.0);
  CHECK(proc::interp(1.0, 2.0, 4.0) == 4.0);

  {
    proc::QuantizedCoord q;
    CHECK(proc::quantizeCoord(1.234, -5.678, 2, q));
    CHECK(q.x == 123);
    CHECK(q.y == -568);
    CHECK(!proc::quantizeCoord(std::numeric_limits<double>::quiet_NaN(), 0.0, 2, q));
    CHECK(!proc::quantizeCoord(1e300, 0.0, 2, q));
  }

  // Zero at every lattice corner.
  {
    proc::NoiseField n("corners");
    bool allZero = true;
    for (int y = -5; y <= 5; ++y) {
      for (int x = -5; x <= 5; ++x) {
        if (std::abs(n.sample(double(x), double(y))) > 1e-12) allZero = false;
      }
    }
    CHECK(allZero);
  }

  // Bounded over random points.
  {
    proc::NoiseField n("bounds");
    core::Prng p("points");
    bool inRange = true;
    bool nonZero = false;
    for (int i = 0; i < 10000; ++i) {
      const double x = p.random(-1000.0, 1000.0);
      const double y = p.random(-1000.0, 1000.0);
      const double v = n.sample(x, y);
      if (!std::isfinite(v) || v < -1.0 - 1e-9 || v > 1.0 + 1e-9) inRange = false;
      if (std::abs(v) > 1e-6) nonZero = true;
    }
    CHECK(inRange);
    CHECK(nonZero);
  }

  // A repeated sample is a pure cache hit.
  {
    proc::NoiseField n("cache");
    const double a = n.sample(3.21, 7.65);
    const std::size_t grads = n.gradientCacheSize();
    const auto gradStats = n.gradientCacheStats();
    const std::size_t values = n.valueCacheSize();

    const double b = n.sample(3.21, 7.65);
    // Same quantized key at precision 2.
    const double c = n.sample(3.2104, 7.6496);

    CHECK(a == b);
    CHECK(a == c);
    CHECK(n.gradientCacheSize() == grads);
    CHECK(n.gradientCacheStats().hits == gradStats.hits);
    CHECK(n.gradientCacheStats().misses == gradStats.misses);
    CHECK(n.valueCacheSize() == values);
    CHECK(n.valueCacheStats().hits == 2);
  }

  // Continuity: nearby points give nearby values, including across cell edges.
  {
    proc::NoiseField n("smooth", proc::NoiseField::Settings{6, 1024, 1024});
    bool smooth = true;
    for (int i = 0; i < 200; ++i) {
      const double x = -3.0 + i * 0.031;
      const double a = n.sample(x, 1.999999);
      const double b = n.sample(x, 2.000001);
      if (std::abs(a - b) > 1e-4) smooth = false;
    }
    CHECK(smooth);
  }

  // Gradients are unit length and independent of visit order.
  {
    proc::NoiseField a("order");
    proc::NoiseField b("order");
    const math::Vec2d ga = a.gradientAt(10, -4);
    b.gradientAt(0, 0);
    b.gradientAt(-7, 3);
    const math::Vec2d gb = b.gradientAt(10, -4);
    CHECK(ga.x == gb.x);
    CHECK(ga.y == gb.y);
    CHECK_NEAR(math::length(ga), 1.0, 1e-12);
  }

  // Eviction never changes output.
  {
    proc::NoiseField big("evict");
    proc::NoiseField tiny("evict", proc::NoiseField::Settings{2, 4, 4});
    bool same = true;
    for (int i = 0; i < 300; ++i) {
      const double x = i * 0.37 - 50.0;
      const double y = i * 0.11 + 20.0;
      if (big.sample(x, y) != tiny.sample(x, y)) same = false;
    }
    CHECK(same);
    CHECK(tiny.valueCacheSize() <= 4);
    CHECK(tiny.gradientCacheSize() <= 4);
  }

  // Reseed clears everything and is idempotent.
  {
    proc::NoiseField n("one");
    const double v1 = n.sample(0.5, 0.5);
    n.reseed("two");
    CHECK(n.valueCacheSize() == 0);
    CHECK(n.gradientCacheSize() == 0);
    CHECK(n.seed() == "two");
    const double v2 = n.sample(0.5, 0.5);
    CHECK(v1 != v2);

    n.reseed("one");
    n.reseed("one");
    CHECK(n.sample(0.5, 0.5) == v1);
  }

  // Unsampleable input gives 0 without caching.
  {
    proc::NoiseField n("edge");
    CHECK(n.sample(std::numeric_limits<double>::quiet_NaN(), 1.0) == 0.0);
    CHECK(n.sample(1.0, std::numeric_limits<double>::infinity()) == 0.0);
    CHECK(n.sample(1e300, -1e300) == 0.0);
    CHECK(n.valueCacheSize() == 0);
  }

  return failures;
}
