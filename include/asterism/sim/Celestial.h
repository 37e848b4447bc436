#pragma once

#include "asterism/core/Types.h"
#include "asterism/math/Vec2.h"

#include <array>
#include <string_view>

namespace asterism::sim {

enum class StarClass : core::u8 {
  O, B, A, F, G, K, M,
  Count
};

enum class PlanetType : core::u8 {
  Molten,
  Rock,
  Oceanic,
  Lunar,
  GasGiant,
  IceGiant,
  Frozen,
  Count
};

// Physical and display constants per spectral class.
// Units: temperatureK kelvin; radius and mass in solar units.
struct SpectralClassInfo {
  StarClass cls{StarClass::G};
  char letter{'G'};
  double temperatureK{5778.0};
  double radiusSol{1.0};
  double massSol{1.0};
  std::string_view colourHex{"#FFFACD"};
  char glyph{'o'};
  double brightness{0.9};
};

// The G row; stands in for any class without a table entry.
const SpectralClassInfo& referenceSpectralInfo();
const SpectralClassInfo& spectralInfo(StarClass cls);

struct PlanetTypeInfo {
  PlanetType type{PlanetType::Rock};
  std::string_view name{"Rock"};
  double baseTemperatureK{300.0};
  double albedo{0.25};
  // Height-ordered display colours, darkest first.
  std::array<std::string_view, 9> palette{};
};

const PlanetTypeInfo& planetTypeInfo(PlanetType type);

char toChar(StarClass cls);
bool parseStarClass(char letter, StarClass& out);

std::string_view toString(PlanetType type);
bool parsePlanetType(std::string_view name, PlanetType& out);

// Circular orbit around the system primary at the origin.
// Units: metres, radians.
struct OrbitBody {
  double distanceM{0.0};
  double angleRad{0.0};
  math::Vec2d positionM{};
  // Set when the body was reset to the origin after a numeric fault.
  bool orbitFault{false};
};

} // namespace asterism::sim
