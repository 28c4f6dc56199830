#include "sc/tiles/TileAddressIndex.hpp"

#include <mutex>

namespace sc {

TileAddressIndex::TileAddressIndex(PileAllocator& allocator, PileHandle sentinelPile)
    : allocator_(allocator) {
  sentinel_.key = TileKey{kSentinelLayerId, TileCoord{0, 0}};
  sentinel_.slot = PhysicalTileSlot{kSentinelPileIndex, 0};
  sentinel_.view = TileView{sentinelPile, 0};
  tiles_.emplace(sentinel_.key, sentinel_);
}

Tile TileAddressIndex::get(const TileKey& key) const {
  {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = tiles_.find(key);
    if (it != tiles_.end()) return it->second;
  }
  Tile empty = sentinel_;
  empty.key.coord = key.coord;
  return empty;
}

TileResult TileAddressIndex::getOrAllocate(const TileKey& key) {
  TileResult r;
  if (key.layer == kSentinelLayerId) {
    r.ok = false;
    r.err = makeError(kErrInvalidLayer, "the sentinel layer cannot own tiles");
    return r;
  }

  {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = tiles_.find(key);
    if (it != tiles_.end()) {
      r.tile = it->second;
      return r;
    }
  }

  SlotResult slot = allocator_.allocateSlot();
  if (!slot.ok) {
    r.ok = false;
    r.err = slot.err;
    return r;
  }

  Tile fresh;
  fresh.key = key;
  fresh.slot = slot.slot;
  fresh.view = TileView{slot.pile, slot.slot.layer};

  bool lost = false;
  {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    auto ins = tiles_.emplace(key, fresh);
    if (!ins.second) {
      lost = true;
      lostRaces_++;
      r.tile = ins.first->second;
    } else {
      r.tile = fresh;
    }
  }

  if (lost) {
    allocator_.returnUnpublished(slot.slot);
  }
  return r;
}

std::size_t TileAddressIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  return tiles_.size() - 1;
}

std::vector<Tile> TileAddressIndex::tilesForLayer(LayerId layer) const {
  std::vector<Tile> out;
  std::shared_lock<std::shared_mutex> lock(mtx_);
  for (const auto& [key, tile] : tiles_) {
    if (key.layer == layer) out.push_back(tile);
  }
  return out;
}

std::uint64_t TileAddressIndex::lostRaceCount() const {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  return lostRaces_;
}

} // namespace sc
