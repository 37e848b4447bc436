#include "asterism/render/Colour.h"
#include "tests/test_harness.h"

#include <cmath>
#include <limits>
#include <string>

using namespace asterism;

int test_colour() {
  int failures = 0;

  render::Rgb8 c;
  std::string err;
  CHECK(render::parseHexColour("#5A0046", c, &err));
  CHECK(c == (render::Rgb8{0x5A, 0x00, 0x46}));
  CHECK(render::parseHexColour("  00500a ", c, &err));
  CHECK(c == (render::Rgb8{0x00, 0x50, 0x0A}));
  CHECK(render::parseHexColour("#fA0", c, &err));
  CHECK(c == (render::Rgb8{0xFF, 0xAA, 0x00}));

  const render::Rgb8 before = c;
  CHECK(!render::parseHexColour("#GG0000", c, &err));
  CHECK(!err.empty());
  CHECK(!render::parseHexColour("#1234", c, &err));
  CHECK(c == before);

  CHECK(render::toHex({0x6A, 0x8D, 0xFF}) == "#6A8DFF");

  // Midpoint grey stays fractional until quantization.
  const render::RgbF mid = render::lerp({0, 0, 0}, {255, 255, 255}, 0.5);
  CHECK(mid.r == 127.5);
  CHECK(render::toRgb8(mid) == (render::Rgb8{128, 128, 128}));

  // Factor is clamped.
  const render::RgbF over = render::lerp({10, 20, 30}, {110, 120, 130}, 2.0);
  CHECK(over.r == 110.0 && over.b == 130.0);
  const render::RgbF nanT = render::lerp({10, 20, 30}, {110, 120, 130}, std::numeric_limits<double>::quiet_NaN());
  CHECK(nanT.g == 20.0);

  CHECK(render::toRgb8({-5.0, 300.0, std::numeric_limits<double>::infinity()}) == (render::Rgb8{0, 255, 0}));

  CHECK(render::scaleBrightness({100, 200, 50}, 1.5) == (render::Rgb8{150, 255, 75}));
  CHECK(render::scaleBrightness({100, 200, 50}, 0.5) == (render::Rgb8{50, 100, 25}));

  return failures;
}
