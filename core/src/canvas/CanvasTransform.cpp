#include "sc/canvas/CanvasTransform.hpp"

namespace sc {

void CanvasTransform::translate(Vec2 delta) {
  pixelToWidget = Mat3::translation(delta.x, delta.y) * pixelToWidget;
}

void CanvasTransform::rotateAround(float radians, Vec2 centerWs) {
  pixelToWidget = Mat3::translation(centerWs.x, centerWs.y)
                * Mat3::rotation(radians)
                * Mat3::translation(-centerWs.x, -centerWs.y)
                * pixelToWidget;
}

void CanvasTransform::scaleAround(float factor, Vec2 centerWs) {
  pixelToWidget = Mat3::translation(centerWs.x, centerWs.y)
                * Mat3::scale(factor, factor)
                * Mat3::translation(-centerWs.x, -centerWs.y)
                * pixelToWidget;
}

CanvasTransform CanvasTransform::translated(Vec2 delta) const {
  CanvasTransform t = *this;
  t.translate(delta);
  return t;
}

CanvasTransform CanvasTransform::rotatedAround(float radians, Vec2 centerWs) const {
  CanvasTransform t = *this;
  t.rotateAround(radians, centerWs);
  return t;
}

CanvasTransform CanvasTransform::scaledAround(float factor, Vec2 centerWs) const {
  CanvasTransform t = *this;
  t.scaleAround(factor, centerWs);
  return t;
}

} // namespace sc
