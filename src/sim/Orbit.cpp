#include "asterism/sim/Orbit.h"

#include "asterism/core/Log.h"
#include "asterism/math/Math.h"

#include <cmath>
#include <string>

namespace asterism::sim {

bool placeOnOrbit(OrbitBody& body) {
  if (!std::isfinite(body.distanceM) || !(body.distanceM > 0.0) || !std::isfinite(body.angleRad)) {
    body.positionM = {};
    body.orbitFault = true;
    return false;
  }

  const math::Vec2d p = math::fromPolar(body.distanceM, body.angleRad);
  if (!math::isFinite(p)) {
    body.positionM = {};
    body.orbitFault = true;
    return false;
  }

  body.positionM = p;
  body.orbitFault = false;
  return true;
}

OrbitIntegrator::OrbitIntegrator(const OrbitParams& params)
: params_(params) {
  if (!std::isfinite(params_.secondsPerSimulatedYear) || params_.secondsPerSimulatedYear <= 0.0) {
    ASTERISM_LOG_WARN("OrbitIntegrator: invalid secondsPerSimulatedYear " +
                      std::to_string(params_.secondsPerSimulatedYear) + "; using 120");
    params_.secondsPerSimulatedYear = OrbitParams{}.secondsPerSimulatedYear;
  }
  radPerSec_ = math::kTwoPi / params_.secondsPerSimulatedYear;
}

bool OrbitIntegrator::advanceBody(OrbitBody& body, const std::string& name, double increment) const {
  if (!std::isfinite(body.distanceM) || !(body.distanceM > 0.0)) {
    body.positionM = {};
    body.orbitFault = true;
    ASTERISM_LOG_WARN("OrbitIntegrator: " + name + " has invalid orbit distance " +
                      std::to_string(body.distanceM) + "; parked at origin");
    return false;
  }

  body.angleRad = math::wrapAngle(body.angleRad + increment);
  if (!placeOnOrbit(body)) {
    ASTERISM_LOG_WARN("OrbitIntegrator: non-finite position for " + name + "; reset to origin");
    return false;
  }
  return true;
}

OrbitReport OrbitIntegrator::advance(StarSystem& sys, double deltaSeconds) const {
  if (!std::isfinite(deltaSeconds) || deltaSeconds < 0.0) {
    ASTERISM_LOG_WARN("OrbitIntegrator: ignoring deltaSeconds " + std::to_string(deltaSeconds));
    deltaSeconds = 0.0;
  }

  const double increment = radPerSec_ * deltaSeconds;

  OrbitReport report;
  for (auto& p : sys.planets) {
    if (!p) continue;
    if (advanceBody(p->orbit, p->name, increment)) ++report.updated;
    else ++report.faulted;
  }
  if (sys.starbase) {
    if (advanceBody(sys.starbase->orbit, sys.starbase->name, increment)) ++report.updated;
    else ++report.faulted;
  }
  return report;
}

} // namespace asterism::sim
