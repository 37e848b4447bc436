#include "asterism/render/Colour.h"

#include "asterism/math/Math.h"

#include <cctype>
#include <cmath>
#include <cstdio>

namespace asterism::render {

static core::u8 quantizeChannel(double v) {
  if (!std::isfinite(v)) return 0;
  return static_cast<core::u8>(math::clamp(std::round(v), 0.0, 255.0));
}

Rgb8 toRgb8(const RgbF& c) {
  return {quantizeChannel(c.r), quantizeChannel(c.g), quantizeChannel(c.b)};
}

RgbF lerp(const RgbF& a, const RgbF& b, double t) {
  if (!std::isfinite(t)) t = 0.0;
  t = math::clamp(t, 0.0, 1.0);
  return {math::lerp(a.r, b.r, t), math::lerp(a.g, b.g, t), math::lerp(a.b, b.b, t)};
}

Rgb8 scaleBrightness(const Rgb8& c, double factor) {
  const RgbF f = toRgbF(c);
  return toRgb8({f.r * factor, f.g * factor, f.b * factor});
}

static int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  const char l = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (l >= 'a' && l <= 'f') return 10 + (l - 'a');
  return -1;
}

bool parseHexColour(std::string_view text, Rgb8& out, std::string* outError) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  if (!text.empty() && text.front() == '#') text.remove_prefix(1);

  if (text.size() != 6 && text.size() != 3) {
    if (outError) *outError = "expected 3 or 6 hex digits: '" + std::string(text) + "'";
    return false;
  }

  int d[6] = {};
  for (std::size_t i = 0; i < text.size(); ++i) {
    d[i] = hexDigit(text[i]);
    if (d[i] < 0) {
      if (outError) *outError = "invalid hex digit in '" + std::string(text) + "'";
      return false;
    }
  }

  if (text.size() == 3) {
    out = {static_cast<core::u8>(d[0] * 17), static_cast<core::u8>(d[1] * 17), static_cast<core::u8>(d[2] * 17)};
  } else {
    out = {static_cast<core::u8>(d[0] * 16 + d[1]),
           static_cast<core::u8>(d[2] * 16 + d[3]),
           static_cast<core::u8>(d[4] * 16 + d[5])};
  }
  return true;
}

std::string toHex(const Rgb8& c) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", c.r, c.g, c.b);
  return buf;
}

} // namespace asterism::render
