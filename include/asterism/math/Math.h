#pragma once

#include <algorithm>
#include <cmath>

namespace asterism::math {

constexpr double kPi = 3.1415926535897932384626433832795;
constexpr double kTwoPi = 2.0 * kPi;

template <class T>
inline T clamp(T v, T lo, T hi) {
  return std::max(lo, std::min(v, hi));
}

inline double lerp(double a, double b, double t) {
  return a + (b - a) * t;
}

// Wraps into [0, 2pi). Non-finite input returns 0.
inline double wrapAngle(double rad) {
  if (!std::isfinite(rad)) return 0.0;
  double r = std::fmod(rad, kTwoPi);
  if (r < 0.0) r += kTwoPi;
  // fmod of a tiny negative value can round up to exactly 2pi.
  if (r >= kTwoPi) r = 0.0;
  return r;
}

} // namespace asterism::math
