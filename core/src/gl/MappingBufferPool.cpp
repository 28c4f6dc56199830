#include "sc/gl/MappingBufferPool.hpp"

namespace sc {

MappingBufferPool::~MappingBufferPool() {
  for (auto& e : entries_) {
    if (e.ssbo) {
      glDeleteBuffers(1, &e.ssbo);
    }
  }
}

void MappingBufferPool::reset() {
  next_ = 0;
  uploaded_ = 0;
}

GLuint MappingBufferPool::upload(const std::uint32_t* words, std::size_t count) {
  if (next_ == entries_.size()) {
    entries_.emplace_back();
  }
  Entry& e = entries_[next_++];
  if (!e.ssbo) {
    glGenBuffers(1, &e.ssbo);
  }

  std::size_t bytes = count * sizeof(std::uint32_t);
  glBindBuffer(GL_SHADER_STORAGE_BUFFER, e.ssbo);
  if (bytes > e.capacityBytes) {
    glBufferData(GL_SHADER_STORAGE_BUFFER, static_cast<GLsizeiptr>(bytes), words, GL_DYNAMIC_DRAW);
    e.capacityBytes = bytes;
  } else {
    glBufferSubData(GL_SHADER_STORAGE_BUFFER, 0, static_cast<GLsizeiptr>(bytes), words);
  }
  glBindBuffer(GL_SHADER_STORAGE_BUFFER, 0);

  uploaded_ += bytes;
  return e.ssbo;
}

} // namespace sc
