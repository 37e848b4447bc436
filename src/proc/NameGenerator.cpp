#include "asterism/proc/NameGenerator.h"

#include <array>
#include <string>
#include <utility>

namespace asterism::proc {

static const std::array<std::string_view, 34> kPrefixes = {
  "Alpha", "Beta", "Gamma", "Delta", "Epsilon", "Zeta", "Eta", "Theta", "Iota", "Kappa",
  "Lambda", "Mu", "Nu", "Xi", "Omicron", "Pi", "Rho", "Sigma", "Tau", "Upsilon",
  "Phi", "Chi", "Psi", "Omega",
  "Proxima", "Cygnus", "Kepler", "Gliese", "HD", "Trappist", "Luyten", "Wolf", "Ross", "Barnard"
};

std::string drawSystemName(core::Prng& rng) {
  const core::i64 number = rng.randomInt(1, 999);
  const char letter = static_cast<char>('A' + rng.randomInt(0, 25));
  const std::string_view* prefix = rng.choice(kPrefixes);

  std::string s(*prefix);
  s += '-';
  s += std::to_string(number);
  s += letter;
  return s;
}

std::string toRoman(int n) {
  if (n <= 0) return std::to_string(n);

  static const std::array<std::pair<int, const char*>, 13> kTable = {{
    {1000, "M"}, {900, "CM"}, {500, "D"}, {400, "CD"},
    {100, "C"}, {90, "XC"}, {50, "L"}, {40, "XL"},
    {10, "X"}, {9, "IX"}, {5, "V"}, {4, "IV"}, {1, "I"}
  }};

  std::string out;
  for (const auto& [value, glyphs] : kTable) {
    while (n >= value) {
      out += glyphs;
      n -= value;
    }
  }
  return out;
}

std::string planetName(std::string_view systemName, int index) {
  std::string s(systemName);
  s += ' ';
  s += toRoman(index + 1);
  return s;
}

std::string starbaseName(std::string_view systemName) {
  std::string s(systemName);
  s += " Starbase";
  return s;
}

} // namespace asterism::proc
