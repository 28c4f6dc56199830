#include "sc/math/Mat3.hpp"
#include <cmath>

namespace sc {

Mat3 Mat3::translation(float tx, float ty) {
  Mat3 r;
  r.m[6] = tx;
  r.m[7] = ty;
  return r;
}

Mat3 Mat3::scale(float sx, float sy) {
  Mat3 r;
  r.m[0] = sx;
  r.m[4] = sy;
  return r;
}

Mat3 Mat3::rotation(float radians) {
  float c = std::cos(radians);
  float s = std::sin(radians);
  Mat3 r;
  r.m[0] = c;  r.m[1] = s;
  r.m[3] = -s; r.m[4] = c;
  return r;
}

Mat3 Mat3::operator*(const Mat3& rhs) const {
  Mat3 r;
  for (int col = 0; col < 3; col++) {
    for (int row = 0; row < 3; row++) {
      float sum = 0.0f;
      for (int k = 0; k < 3; k++) {
        sum += m[k * 3 + row] * rhs.m[col * 3 + k];
      }
      r.m[col * 3 + row] = sum;
    }
  }
  return r;
}

float Mat3::determinant() const {
  return m[0] * (m[4] * m[8] - m[7] * m[5])
       - m[3] * (m[1] * m[8] - m[7] * m[2])
       + m[6] * (m[1] * m[5] - m[4] * m[2]);
}

Mat3 Mat3::inverse() const {
  float det = determinant();
  if (std::fabs(det) < 1e-12f) return Mat3{};
  float inv = 1.0f / det;

  Mat3 r;
  r.m[0] =  (m[4] * m[8] - m[7] * m[5]) * inv;
  r.m[1] = -(m[1] * m[8] - m[7] * m[2]) * inv;
  r.m[2] =  (m[1] * m[5] - m[4] * m[2]) * inv;
  r.m[3] = -(m[3] * m[8] - m[6] * m[5]) * inv;
  r.m[4] =  (m[0] * m[8] - m[6] * m[2]) * inv;
  r.m[5] = -(m[0] * m[5] - m[3] * m[2]) * inv;
  r.m[6] =  (m[3] * m[7] - m[6] * m[4]) * inv;
  r.m[7] = -(m[0] * m[7] - m[6] * m[1]) * inv;
  r.m[8] =  (m[0] * m[4] - m[3] * m[1]) * inv;
  return r;
}

Vec2 Mat3::transformPoint(Vec2 p) const {
  return Vec2{m[0] * p.x + m[3] * p.y + m[6],
              m[1] * p.x + m[4] * p.y + m[7]};
}

} // namespace sc
