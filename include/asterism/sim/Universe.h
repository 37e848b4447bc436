#pragma once

#include "asterism/core/LruCache.h"
#include "asterism/core/Random.h"
#include "asterism/proc/StarMap.h"
#include "asterism/proc/SystemGenerator.h"
#include "asterism/render/Nebula.h"
#include "asterism/sim/Orbit.h"
#include "asterism/sim/System.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace asterism::sim {

struct UniverseParams {
  proc::SystemGenParams system{};
  proc::StarMapParams starMap{};
  render::NebulaField::Settings nebula{};
  OrbitParams orbit{};
  std::size_t systemCacheCapacity{64};
};

// One exploration session: everything derived from a single root seed.
//
// Systems are generated on first request and kept in an LRU cache. An evicted
// system is regenerated identically, except that orbit progress made through
// advanceOrbits() is lost.
class Universe {
public:
  explicit Universe(std::string_view seed, UniverseParams params = {});

  const std::string& seed() const { return root_.initialSeed(); }
  const core::Prng& root() const { return root_; }
  const UniverseParams& params() const { return params_; }

  bool hasStarAt(core::i64 x, core::i64 y) const { return starMap_.hasStar(x, y); }
  const proc::StarMap& starMap() const { return starMap_; }

  // Generates or fetches the system at cell (x, y), star or not.
  // The reference stays valid until the next call that may evict.
  StarSystem& system(core::i64 x, core::i64 y);

  render::Rgb8 backgroundColour(double worldX, double worldY) { return nebula_.colourAt(worldX, worldY); }
  render::NebulaField& nebula() { return nebula_; }

  OrbitReport advanceOrbits(StarSystem& sys, double deltaSeconds) const { return orbits_.advance(sys, deltaSeconds); }

  // Drops every cached system and rebuilds all derived state from `seed`.
  void reseed(std::string_view seed);

  void setSystemCacheCapacity(std::size_t cap) { systems_.setCapacity(cap); }

  struct CellKey {
    core::i64 x{0};
    core::i64 y{0};
    bool operator==(const CellKey& o) const { return x == o.x && y == o.y; }
  };
  struct CellKeyHash {
    std::size_t operator()(const CellKey& k) const;
  };

  using SystemCache = core::LruCache<CellKey, StarSystem, CellKeyHash>;
  SystemCache::Stats systemCacheStats() const { return systems_.stats(); }
  void resetCacheStats() { systems_.resetStats(); }

private:
  UniverseParams params_;
  core::Prng root_;
  proc::StarMap starMap_;
  render::NebulaField nebula_;
  OrbitIntegrator orbits_;
  SystemCache systems_;
};

} // namespace asterism::sim
