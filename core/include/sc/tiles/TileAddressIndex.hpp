#pragma once
#include "sc/core/EngineError.hpp"
#include "sc/tiles/PileAllocator.hpp"
#include "sc/tiles/TileTypes.hpp"

#include <cstdint>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace sc {

struct TileResult {
  bool ok{true};
  EngineError err{};
  Tile tile{};
};

// TileKey -> Tile. Owns the sentinel "empty tile".
//
// Lock order: the index lock and the allocator lock are never held together.
// getOrAllocate() releases the index lock, allocates, then re-takes the index
// lock to publish. If another caller published the same key in between, the
// loser hands its slot back through PileAllocator::returnUnpublished() and
// returns the winner's tile, so no slot is ever leaked.
class TileAddressIndex {
public:
  TileAddressIndex(PileAllocator& allocator, PileHandle sentinelPile);

  TileAddressIndex(const TileAddressIndex&) = delete;
  TileAddressIndex& operator=(const TileAddressIndex&) = delete;

  // Never allocates. A miss returns the sentinel with key.coord patched to
  // the requested coordinate.
  Tile get(const TileKey& key) const;

  TileResult getOrAllocate(const TileKey& key);

  const Tile& sentinel() const { return sentinel_; }

  // Number of published tiles, excluding the sentinel.
  std::size_t size() const;
  std::vector<Tile> tilesForLayer(LayerId layer) const;
  std::uint64_t lostRaceCount() const;

private:
  PileAllocator& allocator_;
  Tile sentinel_;

  mutable std::shared_mutex mtx_;
  std::unordered_map<TileKey, Tile, TileKeyHash> tiles_;
  std::uint64_t lostRaces_{0};
};

} // namespace sc
