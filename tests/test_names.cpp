#include "asterism/core/Random.h"
#include "asterism/proc/NameGenerator.h"
#include "tests/test_harness.h"

#include <cctype>
#include <string>

using namespace asterism;

int test_names() {
  int failures = 0;

  CHECK(proc::toRoman(1) == "I");
  CHECK(proc::toRoman(4) == "IV");
  CHECK(proc::toRoman(9) == "IX");
  CHECK(proc::toRoman(14) == "XIV");
  CHECK(proc::toRoman(1994) == "MCMXCIV");
  CHECK(proc::toRoman(0) == "0");

  CHECK(proc::planetName("Kepler-442B", 0) == "Kepler-442B I");
  CHECK(proc::planetName("Kepler-442B", 8) == "Kepler-442B IX");
  CHECK(proc::starbaseName("Wolf-7Q") == "Wolf-7Q Starbase");

  // "{prefix}-{1..999}{A..Z}", consuming exactly three draws.
  core::Prng p("names");
  bool wellFormed = true;
  for (int i = 0; i < 200; ++i) {
    core::Prng shadow = p;
    const std::string name = proc::drawSystemName(p);

    const auto dash = name.find('-');
    if (dash == std::string::npos || dash == 0) { wellFormed = false; continue; }
    const char letter = name.back();
    if (letter < 'A' || letter > 'Z') wellFormed = false;
    const std::string digits = name.substr(dash + 1, name.size() - dash - 2);
    if (digits.empty() || digits.size() > 3) wellFormed = false;
    for (char c : digits) {
      if (!std::isdigit(static_cast<unsigned char>(c))) wellFormed = false;
    }
    const int n = digits.empty() ? 0 : std::stoi(digits);
    if (n < 1 || n > 999) wellFormed = false;

    shadow.next();
    shadow.next();
    shadow.next();
    if (shadow.state() != p.state()) wellFormed = false;
  }
  CHECK(wellFormed);

  return failures;
}
