#pragma once
#include "sc/config/EngineConfig.hpp"
#include "sc/debug/Stats.hpp"
#include "sc/gl/MappingBufferPool.hpp"
#include "sc/gl/ShaderProgram.hpp"
#include "sc/math/Mat3.hpp"
#include "sc/math/Rect.hpp"
#include "sc/tiles/TileTypes.hpp"

#include <glad/gl.h>
#include <cstdint>
#include <vector>

namespace sc {

// Per-frame uniform block, std140 layout (a mat3 is three vec4 columns).
struct CanvasUniform {
  float transform[12];     // canvas pixel -> intermediate pixel
  float invTransform[12];  // intermediate pixel -> canvas pixel
  std::uint32_t canvasSize[2];
  std::uint32_t tileCount[2];
  std::uint32_t tileSize;
  std::uint32_t pad[3];
};
static_assert(sizeof(CanvasUniform) == 128, "CanvasUniform must match the std140 block");

struct CompositeSurface {
  GLuint texture{0};
  int width{0};
  int height{0};
};

// Compute stage: one dispatch per pile group over the whole intermediate
// surface. Each dispatch only writes pixels whose tile is in its group's
// mapping, so groups never overwrite each other.
class CompositePass {
public:
  explicit CompositePass(const EngineConfig& cfg);
  ~CompositePass();

  CompositePass(const CompositePass&) = delete;
  CompositePass& operator=(const CompositePass&) = delete;

  bool init();

  // Resize the intermediate surface if the view size changed and compute the
  // uniforms shared by every dispatch of this frame.
  void prepare(const URect& viewRect, const Mat3& pixelToView,
               std::uint32_t canvasWidth, std::uint32_t canvasHeight,
               std::uint32_t tileSize);

  CompositeSurface draw(const std::vector<GroupedView>& groups, Stats& stats);

  const CompositeSurface& surface() const { return surface_; }
  TileGridSize grid() const { return grid_; }
  std::uint32_t surfaceReallocations() const { return reallocations_; }

  // Dense grid.x * grid.y array: kNoTile everywhere except the group's tiles,
  // which hold their array layer.
  static std::vector<std::uint32_t> buildMapping(const GroupedView& group,
                                                 TileGridSize grid);

private:
  bool resizeSurface(int width, int height);
  void releaseSurface();

  EngineConfig cfg_;
  ShaderProgram program_;
  MappingBufferPool mappings_;
  GLuint uniformBuffer_{0};
  GLuint sampler_{0};
  GLuint clearFbo_{0};

  CompositeSurface surface_;
  CanvasUniform uniform_{};
  TileGridSize grid_{};
  std::uint32_t reallocations_{0};
  bool prepared_{false};
  bool inited_{false};
};

} // namespace sc
