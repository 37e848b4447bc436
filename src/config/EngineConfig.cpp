#include "asterism/config/EngineConfig.h"

#include "asterism/math/Math.h"
#include "asterism/sim/Units.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <system_error>
#include <utility>

namespace asterism::config {

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

template <class Fn>
static void forEachItem(std::string_view text, Fn&& fn) {
  while (!text.empty()) {
    const auto comma = text.find(',');
    fn(trim(text.substr(0, comma)));
    if (comma == std::string_view::npos) break;
    text.remove_prefix(comma + 1);
  }
}

bool parseSpectralWeights(std::string_view text, std::vector<core::Weighted<sim::StarClass>>& out,
                          std::string* outError) {
  std::vector<core::Weighted<sim::StarClass>> table;
  std::string err;

  forEachItem(text, [&](std::string_view item) {
    if (!err.empty() || item.empty()) return;
    const auto colon = item.find(':');
    const std::string_view cls = trim(item.substr(0, colon));
    sim::StarClass c{};
    if (cls.size() != 1 || !sim::parseStarClass(cls.front(), c)) {
      err = "unknown spectral class '" + std::string(cls) + "'";
      return;
    }

    core::u32 weight = 1;
    if (colon != std::string_view::npos) {
      const std::string_view w = trim(item.substr(colon + 1));
      const auto res = std::from_chars(w.data(), w.data() + w.size(), weight);
      if (res.ec != std::errc{} || res.ptr != w.data() + w.size()) {
        err = "bad weight '" + std::string(w) + "' for class " + std::string(cls);
        return;
      }
    }
    table.push_back({c, weight});
  });

  if (err.empty() && table.empty()) err = "empty spectral distribution";
  if (err.empty()) {
    core::u64 total = 0;
    for (const auto& w : table) total += w.weight;
    if (total == 0) err = "spectral weights sum to zero";
  }

  if (!err.empty()) {
    if (outError) *outError = err;
    return false;
  }
  out = std::move(table);
  return true;
}

std::string formatSpectralWeights(const std::vector<core::Weighted<sim::StarClass>>& table) {
  std::string s;
  for (const auto& w : table) {
    if (!s.empty()) s += ',';
    s += sim::toChar(w.value);
    s += ':';
    s += std::to_string(w.weight);
  }
  return s;
}

bool parsePalette(std::string_view text, std::vector<render::RgbF>& out, std::string* outError) {
  std::vector<render::RgbF> palette;
  std::string err;

  forEachItem(text, [&](std::string_view item) {
    if (!err.empty() || item.empty()) return;
    render::Rgb8 c;
    if (!render::parseHexColour(item, c, &err)) return;
    palette.push_back(render::toRgbF(c));
  });

  if (!err.empty()) {
    if (outError) *outError = err;
    return false;
  }
  out = std::move(palette);
  return true;
}

std::string formatPalette(const std::vector<render::RgbF>& palette) {
  std::string s;
  for (const auto& c : palette) {
    if (!s.empty()) s += ',';
    s += render::toHex(render::toRgb8(c));
  }
  return s;
}

void installEngineCVars(core::CVarRegistry& reg) {
  const sim::UniverseParams d{};
  const auto& sys = d.system;
  const auto& neb = d.nebula;

  reg.defineString("universe.seed", kDefaultSeed, {.help = "Root seed string"});
  reg.defineInt("universe.systemCacheCapacity", static_cast<std::int64_t>(d.systemCacheCapacity),
                {.help = "Generated systems kept in memory"});
  reg.defineString("log.level", "info", {.help = "trace|debug|info|warn|error|off"});

  reg.defineInt("noise.cachePrecision", neb.noise.cachePrecision, {.help = "Decimal places in noise cache keys"});
  reg.defineInt("noise.valueCacheCapacity", static_cast<std::int64_t>(neb.noise.valueCacheCapacity));
  reg.defineInt("noise.gradientCacheCapacity", static_cast<std::int64_t>(neb.noise.gradientCacheCapacity));

  reg.defineFloat("nebula.scale", neb.scale, {.help = "World to noise frequency"});
  reg.defineFloat("nebula.maskScaleFactor", neb.maskScaleFactor);
  reg.defineFloat("nebula.sparsity", neb.sparsity, {.help = "0 = dense, towards 1 = sparse"});
  reg.defineFloat("nebula.sparsityExponent", neb.sparsityExponent);
  reg.defineFloat("nebula.intensity", neb.intensity);
  reg.defineString("nebula.palette", formatPalette(neb.palette), {.help = "Comma-separated hex colours"});
  reg.defineInt("nebula.cachePrecision", neb.cachePrecision);
  reg.defineInt("nebula.cacheCapacity", static_cast<std::int64_t>(neb.cacheCapacity));
  reg.defineString("nebula.defaultColour", render::toHex(neb.defaultColour));

  reg.defineFloat("starmap.density", d.starMap.density, {.help = "Fraction of cells with a star"});

  reg.defineString("system.spectralWeights", formatSpectralWeights(sys.spectralWeights));
  reg.defineInt("system.maxPlanets", sys.maxPlanets);
  reg.defineFloat("system.starbaseProbability", sys.starbaseProbability);
  reg.defineFloat("system.starbaseOrbitAU", sim::mToAu(sys.starbaseOrbitM));
  reg.defineFloat("system.firstOrbitMinAU", sim::mToAu(sys.firstOrbitMinM));
  reg.defineFloat("system.firstOrbitMaxAU", sim::mToAu(sys.firstOrbitMaxM));
  reg.defineFloat("system.scaleBaseMin", sys.scaleBaseMin);
  reg.defineFloat("system.scaleBaseMax", sys.scaleBaseMax);
  reg.defineFloat("system.jitterMax", sys.jitterMax);
  reg.defineFloat("system.additiveMaxAU", sim::mToAu(sys.additiveMaxM));
  reg.defineFloat("system.minSeparationAU", sim::mToAu(sys.minSeparationM));
  reg.defineFloat("system.maxOrbitAU", sim::mToAu(sys.maxOrbitM));
  reg.defineFloat("system.formationBase", sys.formationBase);
  reg.defineFloat("system.formationDecay", sys.formationDecay);
  reg.defineFloat("system.edgeRadiusFloorAU", sim::mToAu(sys.edgeRadiusFloorM));
  reg.defineFloat("system.edgeRadiusFactor", sys.edgeRadiusFactor);

  reg.defineFloat("orbit.secondsPerYear", d.orbit.secondsPerSimulatedYear, {.help = "Real seconds per simulated orbit"});
}

static std::size_t readCapacity(const core::CVarRegistry& reg, std::string_view name, std::size_t fallback) {
  const std::int64_t v = reg.getInt(name, static_cast<std::int64_t>(fallback));
  if (v <= 0) {
    ASTERISM_LOG_WARN(std::string(name) + ": capacity must be positive; using " + std::to_string(fallback));
    return fallback;
  }
  return static_cast<std::size_t>(v);
}

static double readNonNegative(const core::CVarRegistry& reg, std::string_view name, double fallback) {
  const double v = reg.getFloat(name, fallback);
  if (!(v >= 0.0)) {
    ASTERISM_LOG_WARN(std::string(name) + ": must be >= 0; using " + std::to_string(fallback));
    return fallback;
  }
  return v;
}

// Decimal places for cache keys, clamped to [0, 10] before narrowing.
static int readPrecision(const core::CVarRegistry& reg, std::string_view name, int fallback) {
  const std::int64_t v = reg.getInt(name, fallback);
  const std::int64_t clamped = math::clamp<std::int64_t>(v, 0, 10);
  if (clamped != v) {
    ASTERISM_LOG_WARN(std::string(name) + ": " + std::to_string(v) + " is outside [0, 10]; using " +
                      std::to_string(clamped));
  }
  return static_cast<int>(clamped);
}

EngineConfig engineConfigFromCVars(const core::CVarRegistry& reg) {
  EngineConfig cfg;
  const sim::UniverseParams d{};
  auto& u = cfg.universe;

  cfg.seed = reg.getString("universe.seed", kDefaultSeed);

  const std::string level = reg.getString("log.level", "info");
  if (!core::parseLogLevel(level, cfg.logLevel)) {
    ASTERISM_LOG_WARN("log.level: unknown level '" + level + "'; using info");
    cfg.logLevel = core::LogLevel::Info;
  }

  u.systemCacheCapacity = readCapacity(reg, "universe.systemCacheCapacity", d.systemCacheCapacity);

  auto& noise = u.nebula.noise;
  noise.cachePrecision = readPrecision(reg, "noise.cachePrecision", noise.cachePrecision);
  noise.valueCacheCapacity = readCapacity(reg, "noise.valueCacheCapacity", d.nebula.noise.valueCacheCapacity);
  noise.gradientCacheCapacity = readCapacity(reg, "noise.gradientCacheCapacity", d.nebula.noise.gradientCacheCapacity);

  auto& neb = u.nebula;
  neb.scale = reg.getFloat("nebula.scale", d.nebula.scale);
  neb.maskScaleFactor = reg.getFloat("nebula.maskScaleFactor", d.nebula.maskScaleFactor);
  neb.sparsity = readNonNegative(reg, "nebula.sparsity", d.nebula.sparsity);
  neb.sparsityExponent = reg.getFloat("nebula.sparsityExponent", d.nebula.sparsityExponent);
  neb.intensity = readNonNegative(reg, "nebula.intensity", d.nebula.intensity);
  neb.cachePrecision = readPrecision(reg, "nebula.cachePrecision", d.nebula.cachePrecision);
  neb.cacheCapacity = readCapacity(reg, "nebula.cacheCapacity", d.nebula.cacheCapacity);

  {
    std::string err;
    std::vector<render::RgbF> palette;
    const std::string text = reg.getString("nebula.palette");
    if (parsePalette(text, palette, &err)) {
      neb.palette = std::move(palette);
    } else {
      ASTERISM_LOG_WARN("nebula.palette: " + err + "; using default palette");
    }

    render::Rgb8 bg;
    const std::string bgText = reg.getString("nebula.defaultColour", "#000000");
    if (render::parseHexColour(bgText, bg, &err)) {
      neb.defaultColour = bg;
    } else {
      ASTERISM_LOG_WARN("nebula.defaultColour: " + err + "; using black");
    }
  }

  u.starMap.density = readNonNegative(reg, "starmap.density", d.starMap.density);

  auto& sys = u.system;
  {
    std::string err;
    std::vector<core::Weighted<sim::StarClass>> weights;
    const std::string text = reg.getString("system.spectralWeights");
    if (parseSpectralWeights(text, weights, &err)) {
      sys.spectralWeights = std::move(weights);
    } else {
      ASTERISM_LOG_WARN("system.spectralWeights: " + err + "; using default distribution");
    }
  }

  const std::int64_t maxPlanets = reg.getInt("system.maxPlanets", d.system.maxPlanets);
  if (maxPlanets < 0 || maxPlanets > 64) {
    ASTERISM_LOG_WARN("system.maxPlanets: out of range [0, 64]; using " + std::to_string(d.system.maxPlanets));
  } else {
    sys.maxPlanets = static_cast<int>(maxPlanets);
  }

  const auto au = [&](std::string_view name, double fallbackM) {
    return sim::auToM(readNonNegative(reg, name, sim::mToAu(fallbackM)));
  };

  sys.starbaseProbability = readNonNegative(reg, "system.starbaseProbability", d.system.starbaseProbability);
  sys.starbaseOrbitM = au("system.starbaseOrbitAU", d.system.starbaseOrbitM);
  sys.firstOrbitMinM = au("system.firstOrbitMinAU", d.system.firstOrbitMinM);
  sys.firstOrbitMaxM = au("system.firstOrbitMaxAU", d.system.firstOrbitMaxM);
  sys.scaleBaseMin = readNonNegative(reg, "system.scaleBaseMin", d.system.scaleBaseMin);
  sys.scaleBaseMax = readNonNegative(reg, "system.scaleBaseMax", d.system.scaleBaseMax);
  sys.jitterMax = readNonNegative(reg, "system.jitterMax", d.system.jitterMax);
  sys.additiveMaxM = au("system.additiveMaxAU", d.system.additiveMaxM);
  sys.minSeparationM = au("system.minSeparationAU", d.system.minSeparationM);
  sys.maxOrbitM = au("system.maxOrbitAU", d.system.maxOrbitM);
  sys.formationBase = reg.getFloat("system.formationBase", d.system.formationBase);
  sys.formationDecay = reg.getFloat("system.formationDecay", d.system.formationDecay);
  sys.edgeRadiusFloorM = au("system.edgeRadiusFloorAU", d.system.edgeRadiusFloorM);
  sys.edgeRadiusFactor = readNonNegative(reg, "system.edgeRadiusFactor", d.system.edgeRadiusFactor);

  u.orbit.secondsPerSimulatedYear = reg.getFloat("orbit.secondsPerYear", d.orbit.secondsPerSimulatedYear);

  return cfg;
}

} // namespace asterism::config
