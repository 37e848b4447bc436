#pragma once

#include "asterism/core/Types.h"

#include <cmath>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace asterism::core {

// One entry of an integer-weighted categorical table.
template <class T>
struct Weighted {
  T value{};
  u32 weight{1};
};

// String-seeded PRNG (Mulberry32 step on a 32-bit state).
//
// Every stream in the engine is derived from a root Prng through seedNew(), so a
// single seed string reproduces the whole universe. The draw sequence depends only
// on the seed text; it is identical across platforms and runs.
// Not suitable for crypto.
class Prng {
public:
  explicit Prng(std::string_view seed);

  // [0,1)
  double next();

  double random() { return next(); }

  // [min,max)
  double random(double min, double max) { return next() * (max - min) + min; }

  // Inclusive on both ends.
  i64 randomInt(i64 minInclusive, i64 maxInclusive) {
    if (maxInclusive < minInclusive) std::swap(minInclusive, maxInclusive);
    const double span = static_cast<double>(maxInclusive - minInclusive) + 1.0;
    return static_cast<i64>(std::floor(next() * span)) + minInclusive;
  }

  bool chance(double p) { return next() < p; }

  // Uniform pick; nullptr (and no draw) when empty.
  template <class Container>
  const typename Container::value_type* choice(const Container& items) {
    if (items.empty()) return nullptr;
    const auto idx = randomInt(0, static_cast<i64>(items.size()) - 1);
    return &items[static_cast<std::size_t>(idx)];
  }

  // Weighted pick with a single draw. Equivalent to choice() over an array in which
  // each value is repeated `weight` times in table order.
  // nullptr (and no draw) when the table is empty or all weights are zero.
  template <class T>
  const T* chooseWeighted(const std::vector<Weighted<T>>& table) {
    u64 total = 0;
    for (const auto& w : table) total += w.weight;
    if (total == 0) return nullptr;

    i64 k = randomInt(0, static_cast<i64>(total) - 1);
    for (const auto& w : table) {
      if (k < static_cast<i64>(w.weight)) return &w.value;
      k -= static_cast<i64>(w.weight);
    }
    return &table.back().value;
  }

  // Independent child stream seeded from this stream's current state and `suffix`.
  // Does not advance this stream.
  Prng seedNew(std::string_view suffix) const;

  const std::string& initialSeed() const { return initialSeed_; }
  u32 state() const { return state_; }

  static u32 hashSeed(std::string_view text);

private:
  std::string initialSeed_;
  u32 state_{0};
};

} // namespace asterism::core
