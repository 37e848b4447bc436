#include "asterism/render/Nebula.h"

#include "asterism/core/Log.h"
#include "asterism/math/Math.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <new>
#include <utility>

namespace asterism::render {

RgbF paletteColour(const std::vector<RgbF>& palette, double factor01) {
  if (palette.empty()) return {};
  if (palette.size() == 1 || !std::isfinite(factor01)) return palette.front();

  const double f = math::clamp(factor01, 0.0, 1.0);
  const double pos = f * static_cast<double>(palette.size() - 1);
  const auto i0 = static_cast<std::size_t>(std::floor(pos));
  const std::size_t i1 = std::min(palette.size() - 1, i0 + 1);
  return lerp(palette[i0], palette[i1], pos - static_cast<double>(i0));
}

double maskAlpha(double maskNoise, double sparsity, double exponent, double intensity) {
  constexpr double kInvalid = std::numeric_limits<double>::quiet_NaN();
  if (!std::isfinite(maskNoise) || !std::isfinite(sparsity) || !std::isfinite(exponent) ||
      !std::isfinite(intensity)) {
    return kInvalid;
  }

  const double shaped = std::pow(sparsity, exponent);
  if (std::isnan(shaped)) return kInvalid;
  const double denom = 1.0 - shaped;
  if (!(denom > 0.0)) return 0.0;

  const double maskNorm = (maskNoise + 1.0) * 0.5;
  const double alpha = std::max(0.0, 1.0 - maskNorm / denom);
  return std::min(1.0, alpha * intensity);
}

std::string NebulaField::noiseSeedFor(std::string_view rootSeed) {
  std::string s(rootSeed);
  s += "_nebula";
  return s;
}

NebulaField::NebulaField(std::string_view rootSeed)
: NebulaField(rootSeed, Settings{}) {}

NebulaField::NebulaField(std::string_view rootSeed, Settings settings)
: settings_(std::move(settings)),
  noise_(noiseSeedFor(rootSeed), settings_.noise) {
  settings_.cachePrecision = math::clamp(settings_.cachePrecision, 0, 10);
  paletteUsable_ = settings_.palette.size() >= 2;
  if (!paletteUsable_) {
    ASTERISM_LOG_WARN("NebulaField: palette needs at least 2 colours (got " +
                      std::to_string(settings_.palette.size()) + "); using default colour " +
                      toHex(settings_.defaultColour));
  }
  ASTERISM_LOG_INFO("NebulaField: seed \"" + noise_.seed() + "\", " +
                    std::to_string(settings_.palette.size()) + " palette colours");
}

void NebulaField::clearCache() {
  cache_.clear();
}

void NebulaField::reseed(std::string_view rootSeed) {
  noise_.reseed(noiseSeedFor(rootSeed));
  clearCache();
}

bool NebulaField::compose(double worldX, double worldY, Rgb8& out) {
  const double sx = worldX * settings_.scale;
  const double sy = worldY * settings_.scale;
  const double mf = settings_.maskScaleFactor;
  if (!std::isfinite(sx) || !std::isfinite(sy) || !std::isfinite(sx * mf) || !std::isfinite(sy * mf)) {
    return false;
  }

  const double structure = noise_.sample(sx, sy);
  const double mask = noise_.sample(sx * mf, sy * mf);

  const RgbF base = paletteColour(settings_.palette, (structure + 1.0) * 0.5);
  const double alpha = maskAlpha(mask, settings_.sparsity, settings_.sparsityExponent, settings_.intensity);
  if (!std::isfinite(alpha)) return false;

  const RgbF c = alpha < 1.0 ? lerp(RgbF{}, base, alpha) : base;
  if (!std::isfinite(c.r) || !std::isfinite(c.g) || !std::isfinite(c.b)) return false;

  out = toRgb8(c);
  return true;
}

Rgb8 NebulaField::colourAt(double worldX, double worldY) {
  if (!paletteUsable_) return settings_.defaultColour;

  proc::QuantizedCoord key;
  if (!proc::quantizeCoord(worldX, worldY, settings_.cachePrecision, key)) {
    return settings_.defaultColour;
  }

  auto it = cache_.find(key);
  if (it != cache_.end()) return it->second;

  Rgb8 c;
  if (!compose(worldX, worldY, c)) {
    ASTERISM_LOG_DEBUG("NebulaField: non-finite colour at (" + std::to_string(worldX) + ", " +
                       std::to_string(worldY) + "), using default");
    return settings_.defaultColour;
  }

  if (cache_.size() < settings_.cacheCapacity) {
    try {
      cache_.emplace(key, c);
    } catch (const std::bad_alloc&) {
      if (!allocWarned_) {
        allocWarned_ = true;
        ASTERISM_LOG_WARN("NebulaField: out of memory growing colour cache; continuing uncached");
      }
    }
  }
  return c;
}

} // namespace asterism::render
