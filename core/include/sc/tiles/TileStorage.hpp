#pragma once
#include "sc/config/EngineConfig.hpp"
#include "sc/tiles/PileAllocator.hpp"
#include "sc/tiles/TileAddressIndex.hpp"
#include "sc/tiles/TileDevice.hpp"
#include "sc/tiles/TileUploader.hpp"
#include "sc/tiles/VisibleTileResolver.hpp"

namespace sc {

// Bundles allocator, index, uploader and resolver over one device. Passed
// explicitly to whoever needs tiles; there is no global instance.
class TileStorage {
public:
  TileStorage(TileDevice& device, const EngineConfig& cfg);

  TileStorage(const TileStorage&) = delete;
  TileStorage& operator=(const TileStorage&) = delete;

  UploadResult upload(LayerId layer, const PixelBuffer& pixels) {
    return uploader_.upload(layer, pixels);
  }

  std::uint32_t tileSize() const { return device_.tileSize(); }
  TileGridSize gridFor(std::uint32_t width, std::uint32_t height) const {
    return calcTileCount(width, height, device_.tileSize());
  }

  TileDevice& device() { return device_; }
  PileAllocator& allocator() { return allocator_; }
  const PileAllocator& allocator() const { return allocator_; }
  TileAddressIndex& index() { return index_; }
  const TileAddressIndex& index() const { return index_; }
  TileUploader& uploader() { return uploader_; }
  const VisibleTileResolver& resolver() const { return resolver_; }

private:
  TileDevice& device_;
  PileAllocator allocator_;
  TileAddressIndex index_;
  TileUploader uploader_;
  VisibleTileResolver resolver_;
};

} // namespace sc
