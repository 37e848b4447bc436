#include "asterism/proc/StarMap.h"

#include "asterism/core/Hash.h"
#include "asterism/core/Log.h"
#include "asterism/core/Random.h"
#include "asterism/math/Math.h"

#include <cmath>
#include <string>

namespace asterism::proc {

StarMap::StarMap(std::string_view rootSeed, const StarMapParams& params)
: params_(params),
  seedHash_(core::Prng::hashSeed(rootSeed)) {
  if (params_.hashScale == 0) {
    ASTERISM_LOG_WARN("StarMap: hashScale 0; using 10000");
    params_.hashScale = StarMapParams{}.hashScale;
  }
  double density = params_.density;
  if (!std::isfinite(density)) {
    ASTERISM_LOG_WARN("StarMap: non-finite density; using 0");
    density = 0.0;
  }
  density = math::clamp(density, 0.0, 1.0);
  threshold_ = static_cast<core::u32>(std::floor(density * static_cast<double>(params_.hashScale)));
}

bool StarMap::hasStar(core::i64 x, core::i64 y) const {
  return (core::coordHash32(x, y, seedHash_) % params_.hashScale) < threshold_;
}

std::vector<StarCell> StarMap::starsIn(core::i64 minX, core::i64 minY, core::i64 maxX, core::i64 maxY) const {
  std::vector<StarCell> out;
  if (maxX < minX || maxY < minY) return out;
  for (core::i64 y = minY; y <= maxY; ++y) {
    for (core::i64 x = minX; x <= maxX; ++x) {
      if (hasStar(x, y)) out.push_back({x, y});
    }
  }
  return out;
}

} // namespace asterism::proc
