#pragma once
#include <glad/gl.h>

namespace sc {

class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compile and link. Return false on failure (errors go to stderr).
  bool build(const char* vertSrc, const char* fragSrc);
  bool buildCompute(const char* compSrc);

  void use() const;

  GLuint id() const { return program_; }
  bool valid() const { return program_ != 0; }

private:
  bool link(const GLuint* shaders, int count);

  GLuint program_{0};
};

} // namespace sc
