#pragma once

#include "asterism/proc/Noise.h"
#include "asterism/render/Colour.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace asterism::render {

// Unmasked nebula colour: factor01 selects a fractional palette index and the
// two bracketing entries are blended. Requires palette.size() >= 2.
RgbF paletteColour(const std::vector<RgbF>& palette, double factor01);

// Opacity from a mask noise value in [-1, 1]:
//   alpha = max(0, 1 - maskNorm / (1 - sparsity^exponent)), then min(1, alpha * intensity).
// A sparsity of 1 or more suppresses the nebula entirely (alpha 0). Non-finite
// inputs, or a sparsity^exponent that is NaN, give NaN so callers fall back.
double maskAlpha(double maskNoise, double sparsity, double exponent, double intensity);

// World-coordinate -> background colour function built from two noise samples
// at different frequencies: one picks the palette colour, the other fades it
// toward black.
//
// Results are memoized per quantized coordinate in a bounded cache. Once the
// cache is full new colours are computed but not stored; nothing is evicted.
class NebulaField {
public:
  struct Settings {
    double scale{0.05};
    // Mask frequency relative to `scale`.
    double maskScaleFactor{0.75};
    double sparsity{0.4};
    double sparsityExponent{0.7};
    double intensity{1.0};

    std::vector<RgbF> palette{
      {0x5A, 0x00, 0x46},
      {0x00, 0x0A, 0x5A},
      {0x00, 0x50, 0x0A},
    };

    int cachePrecision{2};
    std::size_t cacheCapacity{10000};

    Rgb8 defaultColour{0, 0, 0};

    proc::NoiseField::Settings noise{};
  };

  explicit NebulaField(std::string_view rootSeed);
  NebulaField(std::string_view rootSeed, Settings settings);

  Rgb8 colourAt(double worldX, double worldY);

  void clearCache();

  // Reseeds the inner noise field with rootSeed + "_nebula" and clears the cache.
  void reseed(std::string_view rootSeed);

  const Settings& settings() const { return settings_; }
  std::size_t cacheSize() const { return cache_.size(); }

  proc::NoiseField& noise() { return noise_; }

  static std::string noiseSeedFor(std::string_view rootSeed);

private:
  bool compose(double worldX, double worldY, Rgb8& out);

  Settings settings_;
  proc::NoiseField noise_;
  bool paletteUsable_{false};

  std::unordered_map<proc::QuantizedCoord, Rgb8, proc::QuantizedCoordHash> cache_;
  bool allocWarned_{false};
};

} // namespace asterism::render
