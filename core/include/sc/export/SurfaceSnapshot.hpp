#pragma once
#include "sc/gl/CompositePass.hpp"
#include "sc/image/PixelBuffer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sc {

// 8-bit RGBA image, rows top to bottom unless noted otherwise.
struct Rgba8Image {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> pixels; // width * height * 4
};

// Clamp to [0, 1] and round to 8 bits.
Rgba8Image toRgba8(const PixelBuffer& src);

// Read the composited surface back from the GPU. Row 0 of the result is the
// top of the view. Empty image if the surface has no texture.
PixelBuffer readCompositeSurface(const CompositeSurface& surface);

// PNG bytes (color type 6, stored deflate blocks). flipRows writes the last
// row first, for bottom-up input such as glReadPixels.
std::vector<std::uint8_t> encodePNG(const Rgba8Image& image, bool flipRows = false);

bool writePNG(const std::string& path, const Rgba8Image& image, bool flipRows = false);

// Binary PPM (P6); alpha is dropped.
bool writePPM(const std::string& path, const Rgba8Image& image, bool flipRows = false);

} // namespace sc
