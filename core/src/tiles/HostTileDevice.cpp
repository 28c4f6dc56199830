#include "sc/tiles/HostTileDevice.hpp"

#include <cstdio>
#include <cstring>
#include <string>

namespace sc {

class HostUploadBatch : public UploadBatch {
public:
  HostUploadBatch(HostTileDevice& device, std::size_t stagingBytes)
      : device_(device), limit_(device.stagingLimit()) {
    staging_.reserve(stagingBytes / sizeof(float));
  }

  bool stageChunk(const TileView& dst, std::uint32_t w, std::uint32_t h,
                  const float* rgba) override {
    if (limit_ != 0 && copies_.size() >= limit_) {
      std::fprintf(stderr, "HostUploadBatch: staging limit of %u chunks reached\n", limit_);
      return false;
    }
    std::size_t floats = static_cast<std::size_t>(w) * h * 4;
    Copy c{dst, w, h, staging_.size()};
    staging_.insert(staging_.end(), rgba, rgba + floats);
    copies_.push_back(c);
    return true;
  }

  std::uint32_t submit() override {
    for (const Copy& c : copies_) {
      device_.writeChunk(c.dst, c.w, c.h, staging_.data() + c.offset);
    }
    auto n = static_cast<std::uint32_t>(copies_.size());
    device_.noteSubmit(n);
    copies_.clear();
    staging_.clear();
    return n;
  }

private:
  struct Copy {
    TileView dst;
    std::uint32_t w, h;
    std::size_t offset; // in floats
  };

  HostTileDevice& device_;
  const std::uint32_t limit_;
  std::vector<float> staging_;
  std::vector<Copy> copies_;
};

HostTileDevice::HostTileDevice(std::uint32_t tileSize) : tileSize_(tileSize) {}

PileCreateResult HostTileDevice::createPile(std::uint32_t capacity) {
  std::lock_guard<std::mutex> lock(mtx_);
  PileCreateResult r;
  if (pileLimit_ != 0 && piles_.size() >= pileLimit_) {
    r.ok = false;
    r.err = makeError(kErrOutOfDeviceMemory,
                      "host pile limit of " + std::to_string(pileLimit_) + " reached");
    return r;
  }
  HostPile p;
  p.capacity = capacity;
  p.layers.resize(capacity);
  piles_.push_back(std::move(p));
  r.handle = static_cast<PileHandle>(piles_.size() + 1);
  return r;
}

std::unique_ptr<UploadBatch> HostTileDevice::beginUpload(std::size_t stagingBytes) {
  return std::make_unique<HostUploadBatch>(*this, stagingBytes);
}

void HostTileDevice::setPileLimit(std::uint32_t limit) {
  std::lock_guard<std::mutex> lock(mtx_);
  pileLimit_ = limit;
}

void HostTileDevice::setStagingLimit(std::uint32_t chunks) {
  std::lock_guard<std::mutex> lock(mtx_);
  stagingLimit_ = chunks;
}

std::uint32_t HostTileDevice::stagingLimit() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return stagingLimit_;
}

void HostTileDevice::writeChunk(const TileView& dst, std::uint32_t w, std::uint32_t h,
                                const float* rgba) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (dst.pile < 2 || dst.pile - 2 >= piles_.size()) {
    std::fprintf(stderr, "HostTileDevice: write to unknown pile %u\n", dst.pile);
    return;
  }
  HostPile& p = piles_[dst.pile - 2];
  if (dst.arrayLayer >= p.capacity) {
    std::fprintf(stderr, "HostTileDevice: layer %u out of range\n", dst.arrayLayer);
    return;
  }
  auto& texels = p.layers[dst.arrayLayer];
  if (texels.empty()) {
    texels.assign(static_cast<std::size_t>(tileSize_) * tileSize_ * 4, 0.0f);
  }
  // Texels outside the w x h region keep their previous contents.
  for (std::uint32_t row = 0; row < h; row++) {
    std::memcpy(texels.data() + static_cast<std::size_t>(row) * tileSize_ * 4,
                rgba + static_cast<std::size_t>(row) * w * 4,
                static_cast<std::size_t>(w) * 4 * sizeof(float));
  }
  chunks_++;
}

void HostTileDevice::noteSubmit(std::uint32_t /*chunks*/) {
  std::lock_guard<std::mutex> lock(mtx_);
  batches_++;
}

std::array<float, 4> HostTileDevice::readTexel(PileHandle pile, std::uint32_t layer,
                                               std::uint32_t x, std::uint32_t y) const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::array<float, 4> out{0.0f, 0.0f, 0.0f, 0.0f};
  if (pile < 2 || pile - 2 >= piles_.size()) return out;
  const HostPile& p = piles_[pile - 2];
  if (layer >= p.capacity || x >= tileSize_ || y >= tileSize_) return out;
  const auto& texels = p.layers[layer];
  if (texels.empty()) return out;
  const float* t = texels.data() + (static_cast<std::size_t>(y) * tileSize_ + x) * 4;
  out = {t[0], t[1], t[2], t[3]};
  return out;
}

std::uint32_t HostTileDevice::pilesCreated() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return static_cast<std::uint32_t>(piles_.size());
}

std::uint32_t HostTileDevice::batchesSubmitted() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return batches_;
}

std::uint64_t HostTileDevice::chunksCopied() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return chunks_;
}

} // namespace sc
