#include "sc/image/PixelBuffer.hpp"
#include <cstring>

namespace sc {

PixelBuffer::PixelBuffer(std::uint32_t w, std::uint32_t h)
    : width(w), height(h), rgba(static_cast<std::size_t>(w) * h * 4, 0.0f) {}

bool PixelBuffer::valid() const {
  return width > 0 && height > 0 && rgba.size() == pixelCount() * 4;
}

void PixelBuffer::setPixel(std::uint32_t x, std::uint32_t y,
                           float r, float g, float b, float a) {
  float* p = at(x, y);
  p[0] = r;
  p[1] = g;
  p[2] = b;
  p[3] = a;
}

void PixelBuffer::copyRegion(std::uint32_t x, std::uint32_t y,
                             std::uint32_t w, std::uint32_t h, float* out) const {
  const std::size_t rowFloats = static_cast<std::size_t>(w) * 4;
  for (std::uint32_t row = 0; row < h; row++) {
    std::memcpy(out + row * rowFloats, at(x, y + row), rowFloats * sizeof(float));
  }
}

PixelBuffer PixelBuffer::filled(std::uint32_t w, std::uint32_t h,
                                float r, float g, float b, float a) {
  PixelBuffer buf(w, h);
  for (std::size_t i = 0; i < buf.pixelCount(); i++) {
    buf.rgba[i * 4 + 0] = r;
    buf.rgba[i * 4 + 1] = g;
    buf.rgba[i * 4 + 2] = b;
    buf.rgba[i * 4 + 3] = a;
  }
  return buf;
}

} // namespace sc
