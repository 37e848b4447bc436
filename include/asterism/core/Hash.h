#pragma once

#include "asterism/core/Types.h"

#include <string_view>

namespace asterism::core {

// Non-cryptographic hashes for seeds, cache keys and cell lookups. All of them
// are pure functions with the same results on every platform.

u64 fnv1a64(std::string_view text);

// SplitMix64 finalizer: a bijection with full avalanche.
u64 mix64(u64 x);

// Order-sensitive: hashCombine(a, b) != hashCombine(b, a) in general.
u64 hashCombine(u64 a, u64 b);

// Murmur3-style mix of a grid cell and a 32-bit seed. Only the low 32 bits
// of x and y take part, so cells 2^32 apart collide.
u32 coordHash32(i64 x, i64 y, u32 seed);

} // namespace asterism::core
