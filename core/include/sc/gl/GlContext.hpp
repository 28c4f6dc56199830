#pragma once
#include <cstdint>
#include <vector>

namespace sc {

// Compute shaders, SSBOs and image load/store need 4.3 core.
inline constexpr int kGlMajorVersion = 4;
inline constexpr int kGlMinorVersion = 3;

class GlContext {
public:
  virtual ~GlContext() = default;

  // Create a 4.3 core context and make it current on the calling thread.
  virtual bool init(int width, int height) = 0;
  virtual void swapBuffers() = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;

  // Read back RGBA8 pixels of the default framebuffer, bottom row first.
  virtual std::vector<std::uint8_t> readPixels() const = 0;
};

} // namespace sc
