#pragma once

#include "asterism/core/Types.h"

#include <string_view>
#include <vector>

namespace asterism::proc {

struct StarMapParams {
  // Fraction of cells holding a star.
  double density{0.008};
  core::u32 hashScale{10000};
};

struct StarCell {
  core::i64 x{0};
  core::i64 y{0};
};

// Which integer cells of the hyperspace plane hold a star.
// Presence is a pure hash of the cell and the seed: no stream is consumed.
class StarMap {
public:
  explicit StarMap(std::string_view rootSeed, const StarMapParams& params = {});

  bool hasStar(core::i64 x, core::i64 y) const;

  // Star cells in the inclusive rectangle, row-major (y, then x).
  std::vector<StarCell> starsIn(core::i64 minX, core::i64 minY, core::i64 maxX, core::i64 maxY) const;

  core::u32 seedHash() const { return seedHash_; }
  core::u32 threshold() const { return threshold_; }

private:
  StarMapParams params_;
  core::u32 seedHash_{0};
  core::u32 threshold_{0};
};

} // namespace asterism::proc
