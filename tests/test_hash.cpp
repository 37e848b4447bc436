#include "asterism/core/Hash.h"
#include "asterism/core/StableHash.h"
#include "tests/test_harness.h"

#include <cmath>
#include <limits>

using namespace asterism;

int test_hash() {
  int failures = 0;

  CHECK(core::fnv1a64("") == 14695981039346656037ull);
  CHECK(core::fnv1a64("a") == 0xaf63dc4c8601ec8cull);
  CHECK(core::fnv1a64("star") != core::fnv1a64("rats"));

  CHECK(core::mix64(0) == 0);
  CHECK(core::mix64(1) != core::mix64(2));

  CHECK(core::hashCombine(1, 2) == core::hashCombine(1, 2));
  CHECK(core::hashCombine(1, 2) != core::hashCombine(2, 1));

  // coordHash32 is a pure function of (x, y, seed).
  CHECK(core::coordHash32(3, -7, 42u) == core::coordHash32(3, -7, 42u));
  CHECK(core::coordHash32(3, -7, 42u) != core::coordHash32(-7, 3, 42u));
  CHECK(core::coordHash32(3, -7, 42u) != core::coordHash32(3, -7, 43u));
  CHECK(core::coordHash32(0, 0, 0u) == 0u);

  // StableHash64: strings are length-prefixed.
  {
    core::StableHash64 a;
    a.addString("ab");
    a.addString("c");
    core::StableHash64 b;
    b.addString("a");
    b.addString("bc");
    CHECK(a.value() != b.value());
  }

  // Quantized doubles: differences below the quantum vanish.
  {
    core::StableHash64 a;
    a.addQuantized(1.0000000001);
    core::StableHash64 b;
    b.addQuantized(1.0);
    CHECK(a.value() == b.value());

    core::StableHash64 c;
    c.addQuantized(1.001);
    CHECK(c.value() != b.value());
  }

  // Non-finite values hash without trapping and differ from zero.
  {
    core::StableHash64 a;
    a.addQuantized(std::numeric_limits<double>::quiet_NaN());
    core::StableHash64 b;
    b.addQuantized(0.0);
    CHECK(a.value() != b.value());
  }

  return failures;
}
