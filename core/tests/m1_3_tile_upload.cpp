// M1.3 - TileUploader: tiling, single batch per image, edge chunks, errors

#include "sc/config/EngineConfig.hpp"
#include "sc/image/Layer.hpp"
#include "sc/tiles/HostTileDevice.hpp"
#include "sc/tiles/TileStorage.hpp"

#include <cstdio>
#include <cstdlib>
#include <set>
#include <utility>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static sc::PixelBuffer gradient(std::uint32_t w, std::uint32_t h) {
  sc::PixelBuffer px(w, h);
  for (std::uint32_t y = 0; y < h; y++) {
    for (std::uint32_t x = 0; x < w; x++) {
      px.setPixel(x, y, static_cast<float>(x) / w, static_cast<float>(y) / h, 0.5f, 1.0f);
    }
  }
  return px;
}

int main() {
  // --- Test 1: 600x400 at tile size 256 -> 6 tiles from one pile ---
  {
    sc::HostTileDevice dev(256);
    sc::EngineConfig cfg;
    cfg.tilesPerPile = 8;
    sc::TileStorage storage(dev, cfg);

    sc::PixelBuffer px = gradient(600, 400);
    sc::Layer layer;
    sc::UploadResult r = sc::uploadLayer(px, storage.uploader(), layer);

    requireTrue(r.ok, "upload ok");
    requireTrue(layer.id != sc::kSentinelLayerId, "layer got an id");
    requireTrue(layer.width == 600 && layer.height == 400, "layer size");
    requireTrue(r.tilesWritten == 6, "6 tiles written");
    requireTrue(r.bytesStaged == 600ull * 400 * 4 * sizeof(float), "whole image staged");
    requireTrue(dev.pilesCreated() == 1, "one pile");
    requireTrue(dev.batchesSubmitted() == 1, "one batch per image");
    requireTrue(dev.chunksCopied() == 6, "one copy per tile");

    sc::TileGridSize grid = layer.grid(256);
    requireTrue(grid.x == 3 && grid.y == 2, "3x2 grid");
    requireTrue(storage.gridFor(600, 400) == grid, "storage grid matches layer grid");
    requireTrue(storage.tileSize() == 256, "tile size from device");

    std::set<std::pair<std::uint32_t, std::uint32_t>> slots;
    for (std::uint32_t y = 0; y < grid.y; y++) {
      for (std::uint32_t x = 0; x < grid.x; x++) {
        sc::TileKey key{layer.id, sc::TileCoord{x, y}};
        sc::Tile t = storage.index().get(key);
        requireTrue(!t.isSentinel(), "every grid tile is resident");
        requireTrue(t.slot.pile == 0, "all tiles in pile 0");
        requireTrue(storage.index().get(key).slot == t.slot, "lookup stable");
        slots.insert({t.slot.pile, t.slot.layer});
      }
    }
    requireTrue(slots.size() == 6, "distinct slots");

    // Interior and edge texels land at their tile-local position.
    sc::Tile edge = storage.index().get(sc::TileKey{layer.id, sc::TileCoord{2, 1}});
    auto texel = dev.readTexel(edge.view.pile, edge.view.arrayLayer, 10, 20);
    const float* src = px.at(512 + 10, 256 + 20);
    requireTrue(texel[0] == src[0] && texel[1] == src[1] &&
                texel[2] == src[2] && texel[3] == src[3], "edge tile texel");

    sc::Tile first = storage.index().get(sc::TileKey{layer.id, sc::TileCoord{0, 0}});
    auto t0 = dev.readTexel(first.view.pile, first.view.arrayLayer, 255, 255);
    const float* s0 = px.at(255, 255);
    requireTrue(t0[0] == s0[0] && t0[1] == s0[1], "interior tile corner texel");

    std::printf("  Test 1 (600x400 tiling) PASS\n");
  }

  // --- Test 2: re-upload of a smaller image leaves the rest of edge slots ---
  {
    sc::HostTileDevice dev(256);
    sc::EngineConfig cfg;
    sc::TileStorage storage(dev, cfg);
    sc::LayerId layer = sc::nextLayerId();

    requireTrue(storage.upload(layer, sc::PixelBuffer::filled(512, 512, 1, 0, 0, 1)).ok,
                "red upload");
    requireTrue(storage.upload(layer, sc::PixelBuffer::filled(300, 300, 0, 0, 1, 1)).ok,
                "blue upload");
    requireTrue(storage.index().size() == 4, "no new tiles for the smaller image");

    sc::Tile t11 = storage.index().get(sc::TileKey{layer, sc::TileCoord{1, 1}});
    auto inside = dev.readTexel(t11.view.pile, t11.view.arrayLayer, 10, 10);
    auto outside = dev.readTexel(t11.view.pile, t11.view.arrayLayer, 100, 100);
    requireTrue(inside[2] == 1.0f && inside[0] == 0.0f, "44x44 chunk overwritten");
    requireTrue(outside[0] == 1.0f && outside[2] == 0.0f, "rest of edge slot kept");

    sc::Tile t10 = storage.index().get(sc::TileKey{layer, sc::TileCoord{1, 0}});
    auto right = dev.readTexel(t10.view.pile, t10.view.arrayLayer, 50, 0);
    requireTrue(right[0] == 1.0f, "column past the chunk kept");

    std::printf("  Test 2 (edge chunks not cleared) PASS\n");
  }

  // --- Test 3: invalid input ---
  {
    sc::HostTileDevice dev(64);
    sc::EngineConfig cfg;
    sc::TileStorage storage(dev, cfg);
    sc::LayerId layer = sc::nextLayerId();

    sc::PixelBuffer shortBuf;
    shortBuf.width = 4;
    shortBuf.height = 4;
    shortBuf.rgba.resize(10);
    sc::UploadResult r = storage.upload(layer, shortBuf);
    requireTrue(!r.ok && r.err.code == sc::kErrInvalidPixelBuffer, "size mismatch rejected");

    sc::UploadResult empty = storage.upload(layer, sc::PixelBuffer{});
    requireTrue(!empty.ok && empty.err.code == sc::kErrInvalidPixelBuffer, "empty rejected");

    sc::UploadResult sentinel = storage.upload(sc::kSentinelLayerId,
                                               sc::PixelBuffer::filled(8, 8, 1, 1, 1, 1));
    requireTrue(!sentinel.ok && sentinel.err.code == sc::kErrInvalidLayer,
                "sentinel layer rejected");

    requireTrue(dev.batchesSubmitted() == 0, "nothing submitted for bad input");
    requireTrue(storage.allocator().pileCount() == 0, "nothing allocated for bad input");
    std::printf("  Test 3 (invalid input) PASS\n");
  }

  // --- Test 4: device runs out part way; staged chunks still land ---
  {
    sc::HostTileDevice dev(256);
    dev.setPileLimit(1);
    sc::EngineConfig cfg;
    cfg.tilesPerPile = 4;
    sc::TileStorage storage(dev, cfg);
    sc::LayerId layer = sc::nextLayerId();

    sc::UploadResult r = storage.upload(layer, gradient(600, 400));
    requireTrue(!r.ok, "upload failed");
    requireTrue(r.err.code == sc::kErrOutOfDeviceMemory, "OUT_OF_DEVICE_MEMORY");
    requireTrue(r.tilesWritten == 4, "first pile's tiles written");
    requireTrue(dev.batchesSubmitted() == 1, "partial batch submitted");
    requireTrue(!storage.index().get(sc::TileKey{layer, sc::TileCoord{0, 0}}).isSentinel(),
                "first tile resident");
    requireTrue(storage.index().get(sc::TileKey{layer, sc::TileCoord{2, 1}}).isSentinel(),
                "last tile missing");
    std::printf("  Test 4 (partial upload on exhaustion) PASS\n");
  }

  // --- Test 5: batch refusing a chunk fails the upload ---
  {
    sc::HostTileDevice dev(256);
    dev.setStagingLimit(2);
    sc::EngineConfig cfg;
    cfg.tilesPerPile = 8;
    sc::TileStorage storage(dev, cfg);
    sc::LayerId layer = sc::nextLayerId();

    sc::UploadResult r = storage.upload(layer, gradient(600, 400));
    requireTrue(!r.ok, "upload reports the refused chunk");
    requireTrue(r.err.code == sc::kErrOutOfDeviceMemory, "OUT_OF_DEVICE_MEMORY");
    requireTrue(r.tilesWritten == 2, "chunks staged before the refusal written");
    requireTrue(r.bytesStaged == 2ull * 256 * 256 * 4 * sizeof(float), "only staged bytes counted");
    requireTrue(dev.chunksCopied() == 2, "two copies");
    requireTrue(dev.batchesSubmitted() == 1, "staged chunks submitted");
    requireTrue(storage.index().get(sc::TileKey{layer, sc::TileCoord{2, 1}}).isSentinel(),
                "tiles after the refusal not published");

    // Without the limit the same layer uploads cleanly into the same slots.
    dev.setStagingLimit(0);
    sc::UploadResult again = storage.upload(layer, gradient(600, 400));
    requireTrue(again.ok && again.tilesWritten == 6, "retry writes every tile");
    std::printf("  Test 5 (staging refused) PASS\n");
  }

  std::printf("M1.3 tile_upload: ALL PASS\n");
  return 0;
}
