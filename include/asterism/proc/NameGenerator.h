#pragma once

#include "asterism/core/Random.h"

#include <string>
#include <string_view>

namespace asterism::proc {

// Draws "{prefix}-{number}{letter}" from `rng`, e.g. "Kepler-442B".
// Draw order: number in [1, 999], letter index in [0, 25], prefix choice.
std::string drawSystemName(core::Prng& rng);

// "{system} {roman(index + 1)}" for a 0-based slot index.
std::string planetName(std::string_view systemName, int index);

// "{system} Starbase"
std::string starbaseName(std::string_view systemName);

// Upper-case Roman numeral for n >= 1; decimal text otherwise.
std::string toRoman(int n);

} // namespace asterism::proc
