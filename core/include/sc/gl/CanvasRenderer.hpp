#pragma once
#include "sc/canvas/CanvasTransform.hpp"
#include "sc/config/EngineConfig.hpp"
#include "sc/debug/Stats.hpp"
#include "sc/gl/CompositePass.hpp"
#include "sc/gl/PresentPass.hpp"
#include "sc/image/Layer.hpp"
#include "sc/math/Rect.hpp"
#include "sc/tiles/TileStorage.hpp"

#include <glad/gl.h>
#include <vector>

namespace sc {

// Per-widget renderer. A frame is prepare -> resolve -> render -> present,
// all on the thread that owns the GL context.
class CanvasRenderer {
public:
  explicit CanvasRenderer(const EngineConfig& cfg);

  // Compile both passes. Call once after the GL context is current.
  bool init();

  // viewRect is the widget's rectangle in the target, top-left origin. The
  // transform maps canvas pixels into that same target space.
  void prepare(const URect& viewRect, const CanvasTransform& transform,
               const CanvasImage& image);

  // Visible tiles of the prepared frame's root layer. Never allocates.
  std::vector<GroupedView> resolve(const TileStorage& storage) const;

  CompositeSurface render(const std::vector<GroupedView>& groups, Stats& stats);

  void present(GLuint targetFbo, int targetWidth, int targetHeight,
               const URect& clip, Stats& stats);

  Stats renderFrame(const TileStorage& storage, const CanvasImage& image,
                    const CanvasTransform& transform, const URect& viewRect,
                    GLuint targetFbo, int targetWidth, int targetHeight,
                    const URect& clip);

  const CompositeSurface& surface() const { return composite_.surface(); }
  const CompositePass& compositePass() const { return composite_; }

private:
  EngineConfig cfg_;
  CompositePass composite_;
  PresentPass present_;

  URect viewRect_{};
  Mat3 pixelToView_{};
  LayerId layer_{kSentinelLayerId};
  TileGridSize grid_{};
  bool prepared_{false};
};

} // namespace sc
