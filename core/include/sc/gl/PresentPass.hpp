#pragma once
#include "sc/debug/Stats.hpp"
#include "sc/gl/CompositePass.hpp"
#include "sc/gl/ShaderProgram.hpp"
#include "sc/math/Rect.hpp"

#include <glad/gl.h>

namespace sc {

// Draws the composited surface into a target framebuffer with one fullscreen
// triangle. Rectangles use a top-left origin; the conversion to GL's
// bottom-left viewport and scissor happens here. The target is not cleared
// and blending is off.
class PresentPass {
public:
  PresentPass() = default;
  ~PresentPass();

  PresentPass(const PresentPass&) = delete;
  PresentPass& operator=(const PresentPass&) = delete;

  bool init();

  void present(const CompositeSurface& src, GLuint targetFbo,
               int targetWidth, int targetHeight,
               const URect& viewRect, const URect& clip, Stats& stats);

private:
  ShaderProgram program_;
  GLuint vao_{0};
  GLuint sampler_{0};
};

} // namespace sc
