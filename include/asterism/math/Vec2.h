#pragma once
#include <cmath>

namespace asterism::math {

// Plane position or direction in double precision (metres for bodies).
struct Vec2d {
  double x{0};
  double y{0};
};

inline Vec2d operator-(Vec2d a, Vec2d b) { return {a.x - b.x, a.y - b.y}; }

inline double dot(Vec2d a, Vec2d b) { return a.x * b.x + a.y * b.y; }
inline double length(Vec2d v) { return std::hypot(v.x, v.y); }
inline bool isFinite(Vec2d v) { return std::isfinite(v.x) && std::isfinite(v.y); }

// Angle measured anticlockwise from +x.
inline Vec2d fromPolar(double radius, double angleRad) {
  return {radius * std::cos(angleRad), radius * std::sin(angleRad)};
}

} // namespace asterism::math
