#pragma once
#include "sc/core/EngineError.hpp"
#include "sc/tiles/TileTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace sc {

struct PileCreateResult {
  bool ok{true};
  EngineError err{};
  PileHandle handle{kNullPile};
};

// One image's worth of tile writes. Chunks are staged into a single source
// buffer and copied into their slots on submit().
class UploadBatch {
public:
  virtual ~UploadBatch() = default;

  // Copy a tightly packed w x h RGBA float chunk into the staging buffer and
  // record a copy into (dst.pile, dst.arrayLayer) at texel (0, 0). Returns
  // false if the chunk could not be staged; nothing is recorded then.
  virtual bool stageChunk(const TileView& dst, std::uint32_t w, std::uint32_t h,
                          const float* rgba) = 0;

  // Issue all recorded copies. Returns number of chunks that reached their
  // slots.
  virtual std::uint32_t submit() = 0;
};

// GPU storage backend for tiles. Pile creation and upload batches go through
// here; everything above it is backend agnostic.
class TileDevice {
public:
  virtual ~TileDevice() = default;

  virtual std::uint32_t tileSize() const = 0;

  // Create one texture array with `capacity` tile-sized layers.
  virtual PileCreateResult createPile(std::uint32_t capacity) = 0;

  // Permanent 1x1 single-layer placeholder backing the empty tile.
  virtual PileHandle sentinelPile() const = 0;

  // stagingBytes is the sum of all chunk sizes that will be staged.
  virtual std::unique_ptr<UploadBatch> beginUpload(std::size_t stagingBytes) = 0;
};

} // namespace sc
