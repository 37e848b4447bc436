#pragma once

#include "asterism/core/Types.h"

#include <string>
#include <string_view>

namespace asterism::render {

// 8-bit sRGB triple as handed to a renderer.
struct Rgb8 {
  core::u8 r{0}, g{0}, b{0};

  bool operator==(const Rgb8& o) const { return r == o.r && g == o.g && b == o.b; }
  bool operator!=(const Rgb8& o) const { return !(*this == o); }
};

// Unquantized colour, channels nominally in [0, 255].
struct RgbF {
  double r{0.0}, g{0.0}, b{0.0};
};

inline RgbF toRgbF(const Rgb8& c) { return {double(c.r), double(c.g), double(c.b)}; }

// Rounds and clamps each channel to [0, 255]; non-finite channels become 0.
Rgb8 toRgb8(const RgbF& c);

// Channel-wise linear blend; t is clamped to [0, 1].
RgbF lerp(const RgbF& a, const RgbF& b, double t);

// Multiplies every channel by `factor`, then clamps.
Rgb8 scaleBrightness(const Rgb8& c, double factor);

// Accepts "#RRGGBB", "RRGGBB", "#RGB" or "RGB" (case-insensitive).
bool parseHexColour(std::string_view text, Rgb8& out, std::string* outError = nullptr);

// "#RRGGBB", upper case.
std::string toHex(const Rgb8& c);

} // namespace asterism::render
