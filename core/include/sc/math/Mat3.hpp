#pragma once

namespace sc {

struct Vec2 {
  float x{0}, y{0};
};

// 2D affine transform as a column-major 3x3 matrix (same layout as a GLSL mat3).
//   | m[0] m[3] m[6] |
//   | m[1] m[4] m[7] |
//   | m[2] m[5] m[8] |
struct Mat3 {
  float m[9] = {1, 0, 0,
                0, 1, 0,
                0, 0, 1};

  static Mat3 identity() { return Mat3{}; }
  static Mat3 translation(float tx, float ty);
  static Mat3 scale(float sx, float sy);
  static Mat3 rotation(float radians);

  Mat3 operator*(const Mat3& rhs) const;

  // Returns identity if the matrix is singular.
  Mat3 inverse() const;
  float determinant() const;

  Vec2 transformPoint(Vec2 p) const;
  Vec2 transformPoint(float x, float y) const { return transformPoint(Vec2{x, y}); }
};

} // namespace sc
