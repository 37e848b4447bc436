#include "asterism/sim/Celestial.h"

#include "asterism/core/Log.h"

#include <cctype>
#include <string>

namespace asterism::sim {

static const SpectralClassInfo kSpectral[] = {
  {StarClass::O, 'O', 40000.0, 10.0, 40.0, "#6A8DFF", '*', 1.5},
  {StarClass::B, 'B', 20000.0,  5.0,  8.0, "#8FABFF", '*', 1.3},
  {StarClass::A, 'A',  8500.0,  1.8,  2.0, "#DDE5FF", 'o', 1.1},
  {StarClass::F, 'F',  6500.0,  1.3,  1.3, "#FFFFFF", 'o', 1.0},
  {StarClass::G, 'G',  5778.0,  1.0,  1.0, "#FFFACD", 'o', 0.9},
  {StarClass::K, 'K',  4500.0,  0.8,  0.7, "#FFC864", '.', 0.7},
  {StarClass::M, 'M',  3000.0,  0.4,  0.3, "#FF9A5A", '.', 0.5},
};

static const PlanetTypeInfo kPlanetTypes[] = {
  {PlanetType::Molten, "Molten", 1500.0, 0.08,
   {"#200000", "#401000", "#662000", "#993000", "#CC5000", "#FF8010", "#FFB030", "#FFE060", "#FFFF99"}},
  {PlanetType::Rock, "Rock", 300.0, 0.25,
   {"#2B2B2B", "#404040", "#555555", "#6F6F6F", "#8A8A8A", "#A5A5A5", "#C0C0C0", "#DBDBDB", "#F6F6F6"}},
  {PlanetType::Oceanic, "Oceanic", 280.0, 0.15,
   {"#000020", "#001040", "#002060", "#003399", "#0050B2", "#3380CC", "#66B0FF", "#99D0FF", "#CCF0FF"}},
  {PlanetType::Lunar, "Lunar", 250.0, 0.12,
   {"#303030", "#404040", "#505050", "#656565", "#7F7F7F", "#9A9A9A", "#B5B5B5", "#D0D0D0", "#EBEBEB"}},
  {PlanetType::GasGiant, "GasGiant", 150.0, 0.35,
   {"#6F3F1F", "#8B4513", "#A0522D", "#B86B42", "#CD853F", "#D2B48C", "#E8D8B8", "#F5EDE0", "#FFFFF0"}},
  {PlanetType::IceGiant, "IceGiant", 100.0, 0.30,
   {"#003060", "#004080", "#0050A0", "#0060C0", "#3377D0", "#6699E0", "#99BBF0", "#CCE6FF", "#E6F2FF"}},
  {PlanetType::Frozen, "Frozen", 50.0, 0.70,
   {"#A0C0C0", "#C0D0D0", "#E0E8E8", "#F0F4F4", "#FFFFFF", "#F8F8F8", "#E8E8E8", "#D8D8D8", "#C8C8C8"}},
};

static_assert(sizeof(kSpectral) / sizeof(kSpectral[0]) == static_cast<std::size_t>(StarClass::Count),
              "spectral table out of sync with StarClass");
static_assert(sizeof(kPlanetTypes) / sizeof(kPlanetTypes[0]) == static_cast<std::size_t>(PlanetType::Count),
              "planet type table out of sync with PlanetType");

const SpectralClassInfo& referenceSpectralInfo() {
  return kSpectral[static_cast<std::size_t>(StarClass::G)];
}

const SpectralClassInfo& spectralInfo(StarClass cls) {
  const auto i = static_cast<std::size_t>(cls);
  if (i >= static_cast<std::size_t>(StarClass::Count)) {
    ASTERISM_LOG_WARN("spectralInfo: no entry for class index " + std::to_string(i) + "; using G");
    return referenceSpectralInfo();
  }
  return kSpectral[i];
}

const PlanetTypeInfo& planetTypeInfo(PlanetType type) {
  const auto i = static_cast<std::size_t>(type);
  if (i >= static_cast<std::size_t>(PlanetType::Count)) {
    ASTERISM_LOG_WARN("planetTypeInfo: no entry for type index " + std::to_string(i) + "; using Rock");
    return kPlanetTypes[static_cast<std::size_t>(PlanetType::Rock)];
  }
  return kPlanetTypes[i];
}

char toChar(StarClass cls) {
  return spectralInfo(cls).letter;
}

bool parseStarClass(char letter, StarClass& out) {
  const char u = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
  for (const auto& s : kSpectral) {
    if (s.letter == u) {
      out = s.cls;
      return true;
    }
  }
  return false;
}

std::string_view toString(PlanetType type) {
  return planetTypeInfo(type).name;
}

bool parsePlanetType(std::string_view name, PlanetType& out) {
  for (const auto& p : kPlanetTypes) {
    if (p.name.size() != name.size()) continue;
    bool same = true;
    for (std::size_t i = 0; i < name.size() && same; ++i) {
      same = std::tolower(static_cast<unsigned char>(p.name[i])) ==
             std::tolower(static_cast<unsigned char>(name[i]));
    }
    if (same) {
      out = p.type;
      return true;
    }
  }
  return false;
}

} // namespace asterism::sim
