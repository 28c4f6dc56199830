#include "sc/gl/CanvasRenderer.hpp"

#include <chrono>
#include <cstdio>

namespace sc {

CanvasRenderer::CanvasRenderer(const EngineConfig& cfg)
  : cfg_(cfg), composite_(cfg) {}

bool CanvasRenderer::init() {
  if (!composite_.init()) return false;
  if (!present_.init()) return false;
  return true;
}

void CanvasRenderer::prepare(const URect& viewRect, const CanvasTransform& transform,
                             const CanvasImage& image) {
  viewRect_ = viewRect;
  pixelToView_ = transform.pixelToWidget;
  layer_ = image.root().id;
  grid_ = calcTileCount(image.width(), image.height(), cfg_.tileSize);

  composite_.prepare(viewRect, pixelToView_, image.width(), image.height(), cfg_.tileSize);
  prepared_ = true;
}

std::vector<GroupedView> CanvasRenderer::resolve(const TileStorage& storage) const {
  if (!prepared_) return {};
  if (storage.tileSize() != cfg_.tileSize) {
    std::fprintf(stderr, "CanvasRenderer: storage tile size %u does not match %u\n",
                 storage.tileSize(), cfg_.tileSize);
    return {};
  }
  return storage.resolver().resolve(layer_, viewRect_.toRect(), pixelToView_, grid_);
}

CompositeSurface CanvasRenderer::render(const std::vector<GroupedView>& groups, Stats& stats) {
  if (!prepared_) return CompositeSurface{};
  return composite_.draw(groups, stats);
}

void CanvasRenderer::present(GLuint targetFbo, int targetWidth, int targetHeight,
                             const URect& clip, Stats& stats) {
  if (!prepared_) return;
  present_.present(composite_.surface(), targetFbo, targetWidth, targetHeight,
                   viewRect_, clip, stats);
}

Stats CanvasRenderer::renderFrame(const TileStorage& storage, const CanvasImage& image,
                                  const CanvasTransform& transform, const URect& viewRect,
                                  GLuint targetFbo, int targetWidth, int targetHeight,
                                  const URect& clip) {
  Stats stats;
  auto t0 = std::chrono::steady_clock::now();

  prepare(viewRect, transform, image);
  std::vector<GroupedView> groups = resolve(storage);
  render(groups, stats);
  present(targetFbo, targetWidth, targetHeight, clip, stats);

  auto t1 = std::chrono::steady_clock::now();
  stats.frameMs = std::chrono::duration<double, std::milli>(t1 - t0).count();
  return stats;
}

} // namespace sc
