#pragma once

#include "asterism/core/Types.h"

#include <cmath>
#include <cstring>
#include <string_view>

namespace asterism::core {

// FNV-1a accumulator for regression signatures of generated content.
//
// Every value is fed as explicit little-endian bytes, so the result does not
// depend on host byte order or struct layout. Feeding order matters.
class StableHash64 {
public:
  u64 value() const { return h_; }

  void addByte(u8 b) { h_ = (h_ ^ b) * 0x100000001b3ull; }
  void addBool(bool v) { addByte(v ? 1 : 0); }

  void addU64(u64 v) {
    for (int shift = 0; shift < 64; shift += 8) addByte(static_cast<u8>(v >> shift));
  }
  void addI64(i64 v) { addU64(static_cast<u64>(v)); }

  // Length first, so ("ab", "c") and ("a", "bc") differ.
  void addString(std::string_view s) {
    addU64(s.size());
    for (const unsigned char c : s) addByte(c);
  }

  // Rounded to a multiple of 1/scale, so sub-quantum noise does not change the
  // signature. Non-finite values get a marker byte; values too large to round
  // into 64 bits are hashed by their bit pattern.
  void addQuantized(double v, double scale = 1e6) {
    if (!std::isfinite(v)) {
      addByte(0xFF);
      return;
    }
    const double q = v * scale;
    if (std::fabs(q) < 9.0e18) {
      addByte(0x01);
      addI64(std::llround(q));
      return;
    }
    u64 bits = 0;
    std::memcpy(&bits, &v, sizeof bits);
    addByte(0x02);
    addU64(bits);
  }

private:
  u64 h_{0xcbf29ce484222325ull};
};

} // namespace asterism::core
