#pragma once
#include "sc/math/Mat3.hpp"
#include <cstdint>

namespace sc {

struct Rect {
  float x{0}, y{0}, width{0}, height{0};

  Vec2 topLeft() const { return {x, y}; }
  Vec2 topRight() const { return {x + width, y}; }
  Vec2 bottomLeft() const { return {x, y + height}; }
  Vec2 bottomRight() const { return {x + width, y + height}; }
};

// Pixel rectangle with a top-left origin (view / widget space).
struct URect {
  std::uint32_t x{0}, y{0}, width{0}, height{0};

  Rect toRect() const {
    return Rect{static_cast<float>(x), static_cast<float>(y),
                static_cast<float>(width), static_cast<float>(height)};
  }
};

// Axis-aligned bounds of the four transformed corners, expanded outward to
// whole pixels. Over-approximates for rotations.
Rect transformBounds(const Rect& r, const Mat3& m);

} // namespace sc
