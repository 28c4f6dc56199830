#pragma once
#include "sc/tiles/TileDevice.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace sc {

// Tile storage in host memory. Thread safe; used by tests and by tools that
// need the tile layout without a GL context. Slot texels are allocated on
// first write and read back as transparent black until then.
class HostTileDevice : public TileDevice {
public:
  explicit HostTileDevice(std::uint32_t tileSize);

  std::uint32_t tileSize() const override { return tileSize_; }
  PileCreateResult createPile(std::uint32_t capacity) override;
  PileHandle sentinelPile() const override { return kSentinelHandle; }
  std::unique_ptr<UploadBatch> beginUpload(std::size_t stagingBytes) override;

  // Fail pile creation with OUT_OF_DEVICE_MEMORY once `limit` piles exist.
  // 0 = unlimited.
  void setPileLimit(std::uint32_t limit);

  // Batches refuse to stage more than `chunks` chunks. 0 = unlimited.
  void setStagingLimit(std::uint32_t chunks);

  std::array<float, 4> readTexel(PileHandle pile, std::uint32_t layer,
                                 std::uint32_t x, std::uint32_t y) const;

  std::uint32_t pilesCreated() const;
  std::uint32_t batchesSubmitted() const;
  std::uint64_t chunksCopied() const;

private:
  friend class HostUploadBatch;

  struct HostPile {
    std::uint32_t capacity{0};
    std::vector<std::vector<float>> layers; // empty until written
  };

  void writeChunk(const TileView& dst, std::uint32_t w, std::uint32_t h,
                  const float* rgba);
  void noteSubmit(std::uint32_t chunks);
  std::uint32_t stagingLimit() const;

  static constexpr PileHandle kSentinelHandle = 1;

  const std::uint32_t tileSize_;
  mutable std::mutex mtx_;
  std::vector<HostPile> piles_; // piles_[handle - 2]
  std::uint32_t pileLimit_{0};
  std::uint32_t stagingLimit_{0};
  std::uint32_t batches_{0};
  std::uint64_t chunks_{0};
};

} // namespace sc
