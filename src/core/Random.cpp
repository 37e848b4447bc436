#include "asterism/core/Random.h"

#include <string>

namespace asterism::core {

static constexpr int kWarmupDraws = 10;

u32 Prng::hashSeed(std::string_view text) {
  constexpr u32 k = 387420489u; // 9^9
  u32 h = 9u;
  for (unsigned char c : text) {
    h = (h ^ static_cast<u32>(c)) * k;
  }
  return h ^ (h >> 9);
}

Prng::Prng(std::string_view seed)
: initialSeed_(seed),
  state_(hashSeed(seed)) {
  for (int i = 0; i < kWarmupDraws; ++i) next();
}

double Prng::next() {
  state_ += 0x6D2B79F5u;
  u32 t = state_;
  t = (t ^ (t >> 15)) * (t | 1u);
  t ^= t + (t ^ (t >> 7)) * (t | 61u);
  state_ = t;
  return static_cast<double>(t ^ (t >> 14)) / 4294967296.0;
}

Prng Prng::seedNew(std::string_view suffix) const {
  std::string combined = std::to_string(static_cast<i32>(state_));
  combined.push_back(':');
  combined.append(suffix);
  return Prng(combined);
}

} // namespace asterism::core
