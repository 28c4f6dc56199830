#include "sc/gl/GlTileDevice.hpp"

#include <cstdio>
#include <cstring>
#include <string>

namespace sc {

static const char* glErrorName(GLenum e) {
  switch (e) {
    case GL_INVALID_ENUM: return "GL_INVALID_ENUM";
    case GL_INVALID_VALUE: return "GL_INVALID_VALUE";
    case GL_INVALID_OPERATION: return "GL_INVALID_OPERATION";
    case GL_OUT_OF_MEMORY: return "GL_OUT_OF_MEMORY";
    default: return "GL error";
  }
}

static void drainGlErrors() {
  while (glGetError() != GL_NO_ERROR) {}
}

static void setPileSampling(GLenum target) {
  glTexParameteri(target, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(target, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(target, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(target, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glTexParameteri(target, GL_TEXTURE_MAX_LEVEL, 0);
}

// ---- upload batch: one pixel-unpack buffer per image ----

class GlUploadBatch : public UploadBatch {
public:
  explicit GlUploadBatch(std::size_t stagingBytes) : size_(stagingBytes) {
    if (size_ == 0) return;
    glGenBuffers(1, &pbo_);
    glBindBuffer(GL_PIXEL_UNPACK_BUFFER, pbo_);
    glBufferData(GL_PIXEL_UNPACK_BUFFER, static_cast<GLsizeiptr>(size_), nullptr, GL_STREAM_DRAW);
    mapped_ = static_cast<std::uint8_t*>(glMapBufferRange(
        GL_PIXEL_UNPACK_BUFFER, 0, static_cast<GLsizeiptr>(size_),
        GL_MAP_WRITE_BIT | GL_MAP_INVALIDATE_BUFFER_BIT));
    glBindBuffer(GL_PIXEL_UNPACK_BUFFER, 0);
    if (!mapped_) {
      std::fprintf(stderr, "GlUploadBatch: could not map %zu staging bytes\n", size_);
    }
  }

  ~GlUploadBatch() override {
    if (pbo_) {
      if (mapped_) {
        glBindBuffer(GL_PIXEL_UNPACK_BUFFER, pbo_);
        glUnmapBuffer(GL_PIXEL_UNPACK_BUFFER);
        glBindBuffer(GL_PIXEL_UNPACK_BUFFER, 0);
      }
      glDeleteBuffers(1, &pbo_);
    }
  }

  bool stageChunk(const TileView& dst, std::uint32_t w, std::uint32_t h,
                  const float* rgba) override {
    std::size_t bytes = static_cast<std::size_t>(w) * h * 4 * sizeof(float);
    if (!mapped_ || used_ + bytes > size_) {
      std::fprintf(stderr, "GlUploadBatch: chunk %ux%u does not fit staging buffer\n", w, h);
      return false;
    }
    std::memcpy(mapped_ + used_, rgba, bytes);
    copies_.push_back(Copy{dst, w, h, used_});
    used_ += bytes;
    return true;
  }

  std::uint32_t submit() override {
    if (!pbo_) return 0;

    glBindBuffer(GL_PIXEL_UNPACK_BUFFER, pbo_);
    if (mapped_) {
      glUnmapBuffer(GL_PIXEL_UNPACK_BUFFER);
      mapped_ = nullptr;
    }
    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    glPixelStorei(GL_UNPACK_ROW_LENGTH, 0);

    drainGlErrors();
    std::uint32_t n = 0;
    for (const Copy& c : copies_) {
      glBindTexture(GL_TEXTURE_2D_ARRAY, c.dst.pile);
      glTexSubImage3D(GL_TEXTURE_2D_ARRAY, 0,
                      0, 0, static_cast<GLint>(c.dst.arrayLayer),
                      static_cast<GLsizei>(c.w), static_cast<GLsizei>(c.h), 1,
                      GL_RGBA, GL_FLOAT,
                      reinterpret_cast<const void*>(c.offset));
      GLenum err = glGetError();
      if (err != GL_NO_ERROR) {
        std::fprintf(stderr, "GlUploadBatch: copy into pile %u layer %u failed (%s)\n",
                     c.dst.pile, c.dst.arrayLayer, glErrorName(err));
        continue;
      }
      n++;
    }
    glBindTexture(GL_TEXTURE_2D_ARRAY, 0);
    glBindBuffer(GL_PIXEL_UNPACK_BUFFER, 0);
    glFlush();

    copies_.clear();
    return n;
  }

private:
  struct Copy {
    TileView dst;
    std::uint32_t w, h;
    std::size_t offset; // bytes into the unpack buffer
  };

  std::size_t size_;
  std::size_t used_{0};
  GLuint pbo_{0};
  std::uint8_t* mapped_{nullptr};
  std::vector<Copy> copies_;
};

// ---- device ----

GlTileDevice::GlTileDevice(std::uint32_t tileSize) : tileSize_(tileSize) {}

GlTileDevice::~GlTileDevice() {
  if (!piles_.empty()) {
    glDeleteTextures(static_cast<GLsizei>(piles_.size()), piles_.data());
  }
  if (sentinel_) {
    glDeleteTextures(1, &sentinel_);
  }
}

bool GlTileDevice::init() {
  if (sentinel_) return true;

  drainGlErrors();
  glGenTextures(1, &sentinel_);
  glBindTexture(GL_TEXTURE_2D_ARRAY, sentinel_);
  glTexStorage3D(GL_TEXTURE_2D_ARRAY, 1, GL_RGBA16F, 1, 1, 1);
  const float transparent[4] = {0.0f, 0.0f, 0.0f, 0.0f};
  glTexSubImage3D(GL_TEXTURE_2D_ARRAY, 0, 0, 0, 0, 1, 1, 1, GL_RGBA, GL_FLOAT, transparent);
  setPileSampling(GL_TEXTURE_2D_ARRAY);
  glBindTexture(GL_TEXTURE_2D_ARRAY, 0);

  GLenum err = glGetError();
  if (err != GL_NO_ERROR) {
    std::fprintf(stderr, "GlTileDevice: sentinel creation failed (%s)\n", glErrorName(err));
    glDeleteTextures(1, &sentinel_);
    sentinel_ = 0;
    return false;
  }
  return true;
}

PileCreateResult GlTileDevice::createPile(std::uint32_t capacity) {
  PileCreateResult r;

  GLint maxLayers = 0;
  glGetIntegerv(GL_MAX_ARRAY_TEXTURE_LAYERS, &maxLayers);
  if (maxLayers > 0 && capacity > static_cast<std::uint32_t>(maxLayers)) {
    r.ok = false;
    r.err = makeError(kErrOutOfDeviceMemory,
        "pile of " + std::to_string(capacity) + " layers exceeds GL_MAX_ARRAY_TEXTURE_LAYERS (" +
        std::to_string(maxLayers) + ")");
    return r;
  }

  drainGlErrors();
  GLuint tex = 0;
  glGenTextures(1, &tex);
  glBindTexture(GL_TEXTURE_2D_ARRAY, tex);
  glTexStorage3D(GL_TEXTURE_2D_ARRAY, 1, GL_RGBA16F,
                 static_cast<GLsizei>(tileSize_), static_cast<GLsizei>(tileSize_),
                 static_cast<GLsizei>(capacity));
  setPileSampling(GL_TEXTURE_2D_ARRAY);
  glBindTexture(GL_TEXTURE_2D_ARRAY, 0);

  GLenum err = glGetError();
  if (err != GL_NO_ERROR) {
    glDeleteTextures(1, &tex);
    r.ok = false;
    r.err = makeError(kErrOutOfDeviceMemory,
        std::string("glTexStorage3D for a ") + std::to_string(capacity) +
        "-layer pile failed: " + glErrorName(err));
    return r;
  }

  piles_.push_back(tex);
  r.handle = tex;
  return r;
}

std::unique_ptr<UploadBatch> GlTileDevice::beginUpload(std::size_t stagingBytes) {
  return std::make_unique<GlUploadBatch>(stagingBytes);
}

} // namespace sc
