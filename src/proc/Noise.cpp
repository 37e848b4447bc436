#include "asterism/proc/Noise.h"

#include "asterism/core/Hash.h"
#include "asterism/core/Log.h"
#include "asterism/math/Math.h"

#include <cmath>
#include <new>
#include <string>

namespace asterism::proc {

static constexpr double kMaxQuantized = 9.0e18;

static inline double hash01(core::u64 h) {
  // top 53 bits -> [0,1)
  return static_cast<double>(h >> 11) / 9007199254740992.0;
}

std::size_t QuantizedCoordHash::operator()(const QuantizedCoord& c) const {
  const core::u64 h = core::hashCombine(static_cast<core::u64>(c.x), static_cast<core::u64>(c.y));
  return static_cast<std::size_t>(h);
}

bool quantizeCoord(double x, double y, int precision, QuantizedCoord& out) {
  if (!std::isfinite(x) || !std::isfinite(y)) return false;
  const double factor = std::pow(10.0, math::clamp(precision, 0, 10));
  const double qx = x * factor;
  const double qy = y * factor;
  if (!(std::fabs(qx) < kMaxQuantized) || !(std::fabs(qy) < kMaxQuantized)) return false;
  out.x = static_cast<core::i64>(std::llround(qx));
  out.y = static_cast<core::i64>(std::llround(qy));
  return true;
}

NoiseField::NoiseField(std::string_view seed)
: NoiseField(seed, Settings{}) {}

NoiseField::NoiseField(std::string_view seed, const Settings& settings)
: settings_(settings),
  source_(seed),
  values_(settings.valueCacheCapacity),
  gradients_(settings.gradientCacheCapacity) {
  settings_.cachePrecision = math::clamp(settings_.cachePrecision, 0, 10);
  reseed(seed);
}

void NoiseField::reseed(std::string_view seed) {
  values_.clear();
  gradients_.clear();
  values_.resetStats();
  gradients_.resetStats();
  source_ = core::Prng(seed);
  // One draw from the seeded source fixes the lattice key for this seed.
  const auto draw = static_cast<core::u64>(source_.next() * 4294967296.0);
  latticeKey_ = core::hashCombine(core::fnv1a64(seed), draw);
}

math::Vec2d NoiseField::gradientAt(core::i64 lx, core::i64 ly) {
  const QuantizedCoord key{lx, ly};
  if (const math::Vec2d* g = gradients_.get(key)) return *g;

  core::u64 h = core::hashCombine(latticeKey_, static_cast<core::u64>(lx));
  h = core::hashCombine(h, static_cast<core::u64>(ly));
  const double theta = hash01(h) * math::kTwoPi;
  const math::Vec2d g{std::cos(theta), std::sin(theta)};

  try {
    gradients_.put(key, g);
  } catch (const std::bad_alloc&) {
    if (!allocWarned_) {
      allocWarned_ = true;
      ASTERISM_LOG_WARN("NoiseField: out of memory growing gradient cache; continuing uncached");
    }
  }
  return g;
}

double NoiseField::computeUncached(double x, double y) {
  const double fx = std::floor(x);
  const double fy = std::floor(y);
  const auto x0 = static_cast<core::i64>(fx);
  const auto y0 = static_cast<core::i64>(fy);

  const double dx = x - fx;
  const double dy = y - fy;

  const math::Vec2d g00 = gradientAt(x0,     y0);
  const math::Vec2d g10 = gradientAt(x0 + 1, y0);
  const math::Vec2d g01 = gradientAt(x0,     y0 + 1);
  const math::Vec2d g11 = gradientAt(x0 + 1, y0 + 1);

  const double n00 = math::dot(g00, {dx,       dy});
  const double n10 = math::dot(g10, {dx - 1.0, dy});
  const double n01 = math::dot(g01, {dx,       dy - 1.0});
  const double n11 = math::dot(g11, {dx - 1.0, dy - 1.0});

  const double bottom = interp(dx, n00, n10);
  const double top = interp(dx, n01, n11);
  return interp(dy, bottom, top);
}

void NoiseField::remember(const QuantizedCoord& key, double value) {
  try {
    values_.put(key, value);
  } catch (const std::bad_alloc&) {
    if (!allocWarned_) {
      allocWarned_ = true;
      ASTERISM_LOG_WARN("NoiseField: out of memory growing value cache; continuing uncached");
    }
  }
}

double NoiseField::sample(double x, double y) {
  QuantizedCoord key;
  if (!quantizeCoord(x, y, settings_.cachePrecision, key)) {
    if (core::logEnabled(core::LogLevel::Debug)) {
      ASTERISM_LOG_DEBUG("NoiseField: unsampleable coordinate (" + std::to_string(x) + ", " +
                         std::to_string(y) + "), returning 0");
    }
    return 0.0;
  }

  if (const double* cached = values_.get(key)) return *cached;

  double v = computeUncached(x, y);
  if (!std::isfinite(v)) {
    ASTERISM_LOG_DEBUG("NoiseField: non-finite sample, returning 0");
    v = 0.0;
  }
  remember(key, v);
  return v;
}

} // namespace asterism::proc
