#pragma once

#include "asterism/core/CVar.h"
#include "asterism/core/Log.h"
#include "asterism/core/Random.h"
#include "asterism/render/Colour.h"
#include "asterism/sim/Celestial.h"
#include "asterism/sim/Universe.h"

#include <string>
#include <string_view>
#include <vector>

namespace asterism::config {

constexpr const char* kDefaultSeed = "haunting beauty";

struct EngineConfig {
  std::string seed{kDefaultSeed};
  core::LogLevel logLevel{core::LogLevel::Info};
  sim::UniverseParams universe{};
};

// Defines every engine tunable with its default. Idempotent.
//   universe.*  log.level  noise.*  nebula.*  starmap.*  system.*  orbit.*
// Distances are exposed in AU.
void installEngineCVars(core::CVarRegistry& reg);

// Reads the variables defined by installEngineCVars. Malformed values are
// reported at Warn and replaced by their defaults.
EngineConfig engineConfigFromCVars(const core::CVarRegistry& reg);

// "M:8,K:3,G:2" -> weighted table in the given order.
bool parseSpectralWeights(std::string_view text, std::vector<core::Weighted<sim::StarClass>>& out,
                          std::string* outError = nullptr);
std::string formatSpectralWeights(const std::vector<core::Weighted<sim::StarClass>>& table);

// "#5A0046,#000A5A" -> colours in order.
bool parsePalette(std::string_view text, std::vector<render::RgbF>& out, std::string* outError = nullptr);
std::string formatPalette(const std::vector<render::RgbF>& palette);

} // namespace asterism::config
