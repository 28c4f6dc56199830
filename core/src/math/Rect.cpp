#include "sc/math/Rect.hpp"
#include <algorithm>
#include <cmath>

namespace sc {

Rect transformBounds(const Rect& r, const Mat3& m) {
  const Vec2 corners[4] = {
    m.transformPoint(r.topLeft()),
    m.transformPoint(r.topRight()),
    m.transformPoint(r.bottomLeft()),
    m.transformPoint(r.bottomRight()),
  };

  float minX = corners[0].x, maxX = corners[0].x;
  float minY = corners[0].y, maxY = corners[0].y;
  for (const Vec2& c : corners) {
    minX = std::min(minX, c.x);
    maxX = std::max(maxX, c.x);
    minY = std::min(minY, c.y);
    maxY = std::max(maxY, c.y);
  }

  minX = std::floor(minX);
  minY = std::floor(minY);
  maxX = std::ceil(maxX);
  maxY = std::ceil(maxY);
  return Rect{minX, minY, maxX - minX, maxY - minY};
}

} // namespace sc
