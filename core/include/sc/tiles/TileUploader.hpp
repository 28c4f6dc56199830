#pragma once
#include "sc/core/EngineError.hpp"
#include "sc/image/PixelBuffer.hpp"
#include "sc/tiles/TileAddressIndex.hpp"
#include "sc/tiles/TileDevice.hpp"

#include <cstdint>

namespace sc {

struct UploadResult {
  bool ok{true};
  EngineError err{};
  std::uint32_t tilesWritten{0};
  std::uint64_t bytesStaged{0};
};

// Splits a pixel buffer into tile-sized chunks and writes each chunk into its
// lazily allocated slot. All chunks of one image go out in a single batch.
//
// Edge chunks smaller than a tile only overwrite their own region; the rest
// of the slot keeps whatever it held before.
class TileUploader {
public:
  TileUploader(TileDevice& device, TileAddressIndex& index);

  UploadResult upload(LayerId layer, const PixelBuffer& pixels);

private:
  TileDevice& device_;
  TileAddressIndex& index_;
};

} // namespace sc
