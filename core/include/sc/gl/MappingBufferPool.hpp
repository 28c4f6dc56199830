#pragma once
#include <glad/gl.h>
#include <cstdint>
#include <vector>

namespace sc {

// Shader storage buffers for per-group mapping arrays. Buffer N is reused by
// the N-th group of every frame and only reallocated when it must grow.
class MappingBufferPool {
public:
  ~MappingBufferPool();

  // Start of a frame; all buffers become free again.
  void reset();

  // Upload `count` words into the next free buffer and return its name.
  GLuint upload(const std::uint32_t* words, std::size_t count);

  std::uint64_t uploadedBytes() const { return uploaded_; }

private:
  struct Entry {
    GLuint ssbo{0};
    std::size_t capacityBytes{0};
  };
  std::vector<Entry> entries_;
  std::size_t next_{0};
  std::uint64_t uploaded_{0};
};

} // namespace sc
