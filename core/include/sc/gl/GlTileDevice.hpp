#pragma once
#include "sc/tiles/TileDevice.hpp"
#include <glad/gl.h>
#include <vector>

namespace sc {

// Piles are GL_TEXTURE_2D_ARRAY objects of GL_RGBA16F, one tile per layer.
// Every call must come from the thread that owns the current GL context.
class GlTileDevice : public TileDevice {
public:
  explicit GlTileDevice(std::uint32_t tileSize);
  ~GlTileDevice() override;

  GlTileDevice(const GlTileDevice&) = delete;
  GlTileDevice& operator=(const GlTileDevice&) = delete;

  // Create the sentinel pile. Call once after the GL context is current.
  bool init();

  std::uint32_t tileSize() const override { return tileSize_; }
  PileCreateResult createPile(std::uint32_t capacity) override;
  PileHandle sentinelPile() const override { return sentinel_; }
  std::unique_ptr<UploadBatch> beginUpload(std::size_t stagingBytes) override;

private:
  const std::uint32_t tileSize_;
  GLuint sentinel_{0};
  std::vector<GLuint> piles_;
};

} // namespace sc
