#include "asterism/sim/Universe.h"

#include "asterism/core/Hash.h"
#include "asterism/core/Log.h"

#include <utility>

namespace asterism::sim {

std::size_t Universe::CellKeyHash::operator()(const CellKey& k) const {
  return static_cast<std::size_t>(core::hashCombine(static_cast<core::u64>(k.x), static_cast<core::u64>(k.y)));
}

Universe::Universe(std::string_view seed, UniverseParams params)
: params_(std::move(params)),
  root_(seed),
  starMap_(seed, params_.starMap),
  nebula_(seed, params_.nebula),
  orbits_(params_.orbit),
  systems_(params_.systemCacheCapacity) {
  ASTERISM_LOG_INFO("Universe: seed \"" + root_.initialSeed() + "\", system cache " +
                    std::to_string(systems_.capacity()));
}

StarSystem& Universe::system(core::i64 x, core::i64 y) {
  const CellKey key{x, y};
  if (StarSystem* cached = systems_.get(key)) return *cached;

  return systems_.put(key, proc::generateSystem(x, y, root_, params_.system));
}

void Universe::reseed(std::string_view seed) {
  root_ = core::Prng(seed);
  starMap_ = proc::StarMap(seed, params_.starMap);
  nebula_.reseed(seed);
  systems_.clear();
  systems_.resetStats();
  ASTERISM_LOG_INFO("Universe: reseeded with \"" + root_.initialSeed() + "\"");
}

} // namespace asterism::sim
