#pragma once

#include "asterism/sim/System.h"

#include <cstddef>

namespace asterism::sim {

struct OrbitParams {
  // Real seconds for one full revolution of every body.
  double secondsPerSimulatedYear{120.0};
};

struct OrbitReport {
  std::size_t updated{0};
  std::size_t faulted{0};
};

// Recomputes positionM from angleRad and distanceM. On an invalid distance or a
// non-finite result the body is parked at the origin with orbitFault set and
// false is returned.
bool placeOnOrbit(OrbitBody& body);

// Constant angular speed for all bodies: one revolution per simulated year.
class OrbitIntegrator {
public:
  explicit OrbitIntegrator(const OrbitParams& params = {});

  // Planets in slot order, then the starbase. Negative or non-finite
  // deltaSeconds is treated as 0.
  OrbitReport advance(StarSystem& sys, double deltaSeconds) const;

  double angularSpeedRadPerSec() const { return radPerSec_; }
  const OrbitParams& params() const { return params_; }

private:
  bool advanceBody(OrbitBody& body, const std::string& name, double increment) const;

  OrbitParams params_;
  double radPerSec_{0.0};
};

} // namespace asterism::sim
