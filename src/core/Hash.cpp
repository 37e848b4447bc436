#include "asterism/core/Hash.h"

namespace asterism::core {
namespace {

constexpr u64 kFnvOffset = 0xcbf29ce484222325ull;
constexpr u64 kFnvPrime  = 0x100000001b3ull;
constexpr u64 kGolden    = 0x9e3779b97f4a7c15ull;

constexpr u32 kMurmurC1 = 0xcc9e2d51u;
constexpr u32 kMurmurC2 = 0x1b873593u;

constexpr u32 rotl32(u32 v, int r) { return (v << r) | (v >> (32 - r)); }

// One Murmur3 body round.
constexpr u32 murmurRound(u32 h, u32 k) { return rotl32((h ^ k) * kMurmurC1, 15) * kMurmurC2; }

} // namespace

u64 fnv1a64(std::string_view text) {
  u64 h = kFnvOffset;
  for (const unsigned char c : text) h = (h ^ c) * kFnvPrime;
  return h;
}

u64 mix64(u64 x) {
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
  return x ^ (x >> 31);
}

u64 hashCombine(u64 a, u64 b) {
  return mix64(a ^ (mix64(b + kGolden) + (a << 6) + (a >> 2)));
}

u32 coordHash32(i64 x, i64 y, u32 seed) {
  u32 h = murmurRound(seed, static_cast<u32>(x));
  h = murmurRound(h, static_cast<u32>(y));
  return h ^ (h >> 16);
}

} // namespace asterism::core
