#include "sc/gl/OsMesaContext.hpp"
#include <cstdio>

namespace sc {

OsMesaContext::OsMesaContext() = default;

OsMesaContext::~OsMesaContext() {
  if (ctx_) {
    OSMesaDestroyContext(ctx_);
  }
}

bool OsMesaContext::init(int width, int height) {
  static const int attribs[] = {
    OSMESA_FORMAT,            OSMESA_RGBA,
    OSMESA_DEPTH_BITS,        0,
    OSMESA_STENCIL_BITS,      0,
    OSMESA_PROFILE,           OSMESA_CORE_PROFILE,
    OSMESA_CONTEXT_MAJOR_VERSION, kGlMajorVersion,
    OSMESA_CONTEXT_MINOR_VERSION, kGlMinorVersion,
    0
  };

  ctx_ = OSMesaCreateContextAttribs(attribs, nullptr);
  if (!ctx_) {
    std::fprintf(stderr, "OsMesaContext: no %d.%d core context available\n",
                 kGlMajorVersion, kGlMinorVersion);
    return false;
  }

  width_  = width;
  height_ = height;
  framebuf_.assign(static_cast<std::size_t>(width) * height * 4, 0);

  if (!OSMesaMakeCurrent(ctx_, framebuf_.data(), GL_UNSIGNED_BYTE, width, height)) {
    std::fprintf(stderr, "OsMesaContext: OSMesaMakeCurrent failed\n");
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
    return false;
  }

  int version = gladLoadGL((GLADloadfunc)OSMesaGetProcAddress);
  if (!version) {
    std::fprintf(stderr, "OsMesaContext: gladLoadGL failed\n");
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
    return false;
  }
  glVersion_ = GLAD_VERSION_MAJOR(version) * 10 + GLAD_VERSION_MINOR(version);
  if (glVersion_ < kGlMajorVersion * 10 + kGlMinorVersion) {
    std::fprintf(stderr, "OsMesaContext: GL %d.%d loaded, %d.%d required\n",
                 GLAD_VERSION_MAJOR(version), GLAD_VERSION_MINOR(version),
                 kGlMajorVersion, kGlMinorVersion);
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
    glVersion_ = 0;
    return false;
  }

  return true;
}

void OsMesaContext::swapBuffers() {
  glFinish();
}

std::vector<std::uint8_t> OsMesaContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glBindFramebuffer(GL_FRAMEBUFFER, 0);
  glPixelStorei(GL_PACK_ALIGNMENT, 1);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

} // namespace sc
