#pragma once

namespace asterism::sim {

// Generation and orbit code works in metres; climate rules are stated in AU.

constexpr double kAU_M = 1.495978707e11; // IAU 2012 AU (m)

constexpr double auToM(double au) { return au * kAU_M; }
constexpr double mToAu(double m) { return m / kAU_M; }

} // namespace asterism::sim
