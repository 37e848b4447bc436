#include "asterism/sim/System.h"

#include "asterism/sim/Units.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace asterism::sim {

std::size_t StarSystem::planetCount() const {
  return static_cast<std::size_t>(
    std::count_if(planets.begin(), planets.end(), [](const auto& p) { return p.has_value(); }));
}

double StarSystem::outermostOrbitM() const {
  double r = 0.0;
  for (const auto& p : planets) {
    if (p && std::isfinite(p->orbit.distanceM)) r = std::max(r, p->orbit.distanceM);
  }
  if (starbase && std::isfinite(starbase->orbit.distanceM)) r = std::max(r, starbase->orbit.distanceM);
  return r;
}

static bool within(const OrbitBody& b, double xM, double yM, double radiusM) {
  const math::Vec2d d = b.positionM - math::Vec2d{xM, yM};
  return math::dot(d, d) <= radiusM * radiusM;
}

const OrbitBody* findBodyNear(const StarSystem& sys, double xM, double yM, double radiusM) {
  if (!std::isfinite(xM) || !std::isfinite(yM) || !(radiusM >= 0.0)) return nullptr;
  for (const auto& p : sys.planets) {
    if (p && within(p->orbit, xM, yM, radiusM)) return &p->orbit;
  }
  if (sys.starbase && within(sys.starbase->orbit, xM, yM, radiusM)) return &sys.starbase->orbit;
  return nullptr;
}

std::string bodyNameNear(const StarSystem& sys, double xM, double yM, double radiusM) {
  const OrbitBody* hit = findBodyNear(sys, xM, yM, radiusM);
  if (!hit) return {};
  for (const auto& p : sys.planets) {
    if (p && &p->orbit == hit) return p->name;
  }
  if (sys.starbase && &sys.starbase->orbit == hit) return sys.starbase->name;
  return {};
}

bool isBeyondEdge(const StarSystem& sys, double xM, double yM, double margin) {
  if (!std::isfinite(xM) || !std::isfinite(yM)) return true;
  const double limit = sys.edgeRadiusM * margin;
  return std::hypot(xM, yM) > limit;
}

std::string describeSystem(const StarSystem& sys) {
  const auto& star = spectralInfo(sys.starClass);

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(6);
  oss << sys.name << " @ (" << sys.x << ", " << sys.y << ")\n";
  oss << "  star: class " << star.letter << ", " << std::setprecision(0) << star.temperatureK << " K\n";
  oss << std::setprecision(6);
  oss << "  edge: " << mToAu(sys.edgeRadiusM) << " AU\n";

  for (std::size_t i = 0; i < sys.planets.size(); ++i) {
    const auto& p = sys.planets[i];
    oss << "  [" << i << "] ";
    if (!p) {
      oss << "-\n";
      continue;
    }
    oss << p->name << ": " << toString(p->type)
        << ", " << mToAu(p->orbit.distanceM) << " AU"
        << ", angle " << p->orbit.angleRad
        << ", " << std::setprecision(1) << p->temperatureK << " K\n";
    oss << std::setprecision(6);
  }

  if (sys.starbase) {
    oss << "  starbase: " << sys.starbase->name
        << ", " << mToAu(sys.starbase->orbit.distanceM) << " AU"
        << ", angle " << sys.starbase->orbit.angleRad << "\n";
  } else {
    oss << "  starbase: none\n";
  }
  return oss.str();
}

} // namespace asterism::sim
