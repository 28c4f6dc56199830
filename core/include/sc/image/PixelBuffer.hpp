#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sc {

// Decoded, fully resolved floating-point RGBA image. Rows are top to bottom.
struct PixelBuffer {
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::vector<float> rgba; // width * height * 4

  PixelBuffer() = default;
  PixelBuffer(std::uint32_t w, std::uint32_t h);

  // True if the pixel vector matches the declared size and the size is non-zero.
  bool valid() const;

  std::size_t pixelCount() const {
    return static_cast<std::size_t>(width) * height;
  }

  float* at(std::uint32_t x, std::uint32_t y) {
    return rgba.data() + (static_cast<std::size_t>(y) * width + x) * 4;
  }
  const float* at(std::uint32_t x, std::uint32_t y) const {
    return rgba.data() + (static_cast<std::size_t>(y) * width + x) * 4;
  }

  void setPixel(std::uint32_t x, std::uint32_t y, float r, float g, float b, float a);

  // Copy a w x h region starting at (x, y) into `out`, tightly packed.
  void copyRegion(std::uint32_t x, std::uint32_t y,
                  std::uint32_t w, std::uint32_t h, float* out) const;

  static PixelBuffer filled(std::uint32_t w, std::uint32_t h,
                            float r, float g, float b, float a);
};

} // namespace sc
