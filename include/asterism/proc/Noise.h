#pragma once

#include "asterism/core/LruCache.h"
#include "asterism/core/Random.h"
#include "asterism/core/Types.h"
#include "asterism/math/Vec2.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace asterism::proc {

// Integer pair used both as a lattice point and as a quantized sample coordinate.
struct QuantizedCoord {
  core::i64 x{0};
  core::i64 y{0};

  bool operator==(const QuantizedCoord& o) const { return x == o.x && y == o.y; }
};

struct QuantizedCoordHash {
  std::size_t operator()(const QuantizedCoord& c) const;
};

// Rounds (x, y) to `precision` decimal places as integers (x * 10^precision).
// Returns false for non-finite input or values that do not fit in 64 bits.
bool quantizeCoord(double x, double y, int precision, QuantizedCoord& out);

// 6t^5 - 15t^4 + 10t^3
inline double smootherstep(double t) {
  return t * t * t * (t * (t * 6.0 - 15.0) + 10.0);
}

// Linear blend from a to b weighted by smootherstep(t).
inline double interp(double t, double a, double b) {
  return a + (b - a) * smootherstep(t);
}

// Seeded 2D gradient (Perlin) noise with memoized gradients and samples.
//
// Gradients are unit vectors, one per integer lattice point, derived from the
// field's seeded source and the lattice coordinates. They do not depend on the
// order in which points are visited, so cache eviction never changes output.
// Output lies in [-sqrt(2)/2, sqrt(2)/2].
//
// Not thread-safe; give each thread its own field.
class NoiseField {
public:
  struct Settings {
    // Decimal places kept in the sample cache key; clamped to [0, 10].
    int cachePrecision{2};
    std::size_t valueCacheCapacity{262144};
    std::size_t gradientCacheCapacity{65536};
  };

  explicit NoiseField(std::string_view seed);
  NoiseField(std::string_view seed, const Settings& settings);

  // Total over finite input. Non-finite or out-of-range coordinates yield 0.
  double sample(double x, double y);

  // Clears both caches and reinitializes the seeded source.
  void reseed(std::string_view seed);

  const std::string& seed() const { return source_.initialSeed(); }
  const Settings& settings() const { return settings_; }

  // Gradient at an integer lattice point, created on first access.
  math::Vec2d gradientAt(core::i64 lx, core::i64 ly);

  std::size_t valueCacheSize() const { return values_.size(); }
  std::size_t gradientCacheSize() const { return gradients_.size(); }

  using ValueCache = core::LruCache<QuantizedCoord, double, QuantizedCoordHash>;
  using GradientCache = core::LruCache<QuantizedCoord, math::Vec2d, QuantizedCoordHash>;

  ValueCache::Stats valueCacheStats() const { return values_.stats(); }
  GradientCache::Stats gradientCacheStats() const { return gradients_.stats(); }

private:
  double computeUncached(double x, double y);
  void remember(const QuantizedCoord& key, double value);

  Settings settings_;
  core::Prng source_;
  core::u64 latticeKey_{0};

  ValueCache values_;
  GradientCache gradients_;
  bool allocWarned_{false};
};

} // namespace asterism::proc
