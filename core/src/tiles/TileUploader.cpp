#include "sc/tiles/TileUploader.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

namespace sc {

TileUploader::TileUploader(TileDevice& device, TileAddressIndex& index)
    : device_(device), index_(index) {}

UploadResult TileUploader::upload(LayerId layer, const PixelBuffer& pixels) {
  UploadResult r;
  if (layer == kSentinelLayerId) {
    r.ok = false;
    r.err = makeError(kErrInvalidLayer, "cannot upload into the sentinel layer");
    return r;
  }
  if (!pixels.valid()) {
    r.ok = false;
    r.err = makeError(kErrInvalidPixelBuffer,
        "pixel buffer " + std::to_string(pixels.width) + "x" +
        std::to_string(pixels.height) + " holds " +
        std::to_string(pixels.rgba.size()) + " floats");
    return r;
  }

  const std::uint32_t ts = device_.tileSize();
  const TileGridSize grid = calcTileCount(pixels.width, pixels.height, ts);

  // Chunks partition the image, so the staging size is the image size.
  auto batch = device_.beginUpload(pixels.pixelCount() * 4 * sizeof(float));
  std::vector<float> chunk(static_cast<std::size_t>(ts) * ts * 4);
  std::uint32_t staged = 0;

  for (std::uint32_t ty = 0; ty < grid.y; ty++) {
    for (std::uint32_t tx = 0; tx < grid.x; tx++) {
      TileResult tile = index_.getOrAllocate(TileKey{layer, TileCoord{tx, ty}});
      if (!tile.ok) {
        std::fprintf(stderr, "TileUploader: tile (%u,%u) of layer %llu: %s\n",
                     tx, ty, static_cast<unsigned long long>(layer),
                     tile.err.message.c_str());
        r.ok = false;
        r.err = tile.err;
        break;
      }

      std::uint32_t ox = tx * ts;
      std::uint32_t oy = ty * ts;
      std::uint32_t w = std::min(ts, pixels.width - ox);
      std::uint32_t h = std::min(ts, pixels.height - oy);

      pixels.copyRegion(ox, oy, w, h, chunk.data());
      if (!batch->stageChunk(tile.tile.view, w, h, chunk.data())) {
        r.ok = false;
        r.err = makeError(kErrOutOfDeviceMemory,
            "staging tile (" + std::to_string(tx) + "," + std::to_string(ty) +
            ") of layer " + std::to_string(layer) + " failed");
        std::fprintf(stderr, "TileUploader: %s\n", r.err.message.c_str());
        break;
      }
      staged++;
      r.bytesStaged += static_cast<std::uint64_t>(w) * h * 4 * sizeof(float);
    }
    if (!r.ok) break;
  }

  // Chunks staged before a failure still land in their slots.
  r.tilesWritten = batch->submit();
  if (r.ok && r.tilesWritten < staged) {
    r.ok = false;
    r.err = makeError(kErrOutOfDeviceMemory,
        std::to_string(staged - r.tilesWritten) + " of " + std::to_string(staged) +
        " staged tiles of layer " + std::to_string(layer) + " were not copied");
    std::fprintf(stderr, "TileUploader: %s\n", r.err.message.c_str());
  }
  return r;
}

} // namespace sc
