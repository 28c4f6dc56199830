#pragma once
#include "sc/math/Mat3.hpp"

namespace sc {

// Maps canvas-pixel space to widget (view) space. All edits pre-multiply,
// so the newest operation is applied last, in widget space.
struct CanvasTransform {
  Vec2 widgetSize{};
  Mat3 pixelToWidget{};

  void translate(Vec2 delta);
  void rotateAround(float radians, Vec2 centerWs);
  void scaleAround(float factor, Vec2 centerWs);

  CanvasTransform translated(Vec2 delta) const;
  CanvasTransform rotatedAround(float radians, Vec2 centerWs) const;
  CanvasTransform scaledAround(float factor, Vec2 centerWs) const;

  Mat3 widgetToPixel() const { return pixelToWidget.inverse(); }
};

} // namespace sc
