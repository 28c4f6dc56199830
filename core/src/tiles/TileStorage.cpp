#include "sc/tiles/TileStorage.hpp"

namespace sc {

TileStorage::TileStorage(TileDevice& device, const EngineConfig& cfg)
    : device_(device),
      allocator_(device, cfg.tilesPerPile, cfg.maxPiles),
      index_(allocator_, device.sentinelPile()),
      uploader_(device, index_),
      resolver_(index_, device.tileSize()) {}

} // namespace sc
