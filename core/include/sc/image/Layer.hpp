#pragma once
#include "sc/ids/Id.hpp"
#include "sc/image/PixelBuffer.hpp"
#include "sc/tiles/TileTypes.hpp"
#include "sc/tiles/TileUploader.hpp"

#include <cstdint>

namespace sc {

struct Layer {
  LayerId id{kSentinelLayerId};
  std::uint32_t width{0};
  std::uint32_t height{0};

  // Fresh id, no pixels yet.
  static Layer create(std::uint32_t width = 0, std::uint32_t height = 0);

  TileGridSize grid(std::uint32_t tileSize) const {
    return calcTileCount(width, height, tileSize);
  }
};

// Create a layer for `pixels` and upload it. `layerOut` is filled even when
// the upload fails part way, so the caller can still address what landed.
UploadResult uploadLayer(const PixelBuffer& pixels, TileUploader& uploader,
                         Layer& layerOut);

// A canvas image: its logical size plus the root layer that is rendered.
class CanvasImage {
public:
  CanvasImage(std::uint32_t width, std::uint32_t height);
  CanvasImage(std::uint32_t width, std::uint32_t height, Layer root);

  std::uint32_t width() const { return width_; }
  std::uint32_t height() const { return height_; }
  const Layer& root() const { return root_; }

private:
  std::uint32_t width_;
  std::uint32_t height_;
  Layer root_;
};

} // namespace sc
