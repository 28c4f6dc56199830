#include "sc/gl/ShaderProgram.hpp"
#include <cstdio>
#include <vector>

namespace sc {

ShaderProgram::~ShaderProgram() {
  if (program_) {
    glDeleteProgram(program_);
  }
}

static const char* stageName(GLenum type) {
  switch (type) {
    case GL_VERTEX_SHADER: return "vertex";
    case GL_FRAGMENT_SHADER: return "fragment";
    case GL_COMPUTE_SHADER: return "compute";
    default: return "unknown";
  }
}

static GLuint compileShader(GLenum type, const char* src) {
  GLuint s = glCreateShader(type);
  glShaderSource(s, 1, &src, nullptr);
  glCompileShader(s);

  GLint ok = 0;
  glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetShaderiv(s, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
    glGetShaderInfoLog(s, len, nullptr, log.data());
    std::fprintf(stderr, "ShaderProgram: %s compile error:\n%s\n", stageName(type), log.data());
    glDeleteShader(s);
    return 0;
  }
  return s;
}

bool ShaderProgram::link(const GLuint* shaders, int count) {
  program_ = glCreateProgram();
  for (int i = 0; i < count; i++) glAttachShader(program_, shaders[i]);
  glLinkProgram(program_);

  // Shaders can be deleted after linking.
  for (int i = 0; i < count; i++) glDeleteShader(shaders[i]);

  GLint ok = 0;
  glGetProgramiv(program_, GL_LINK_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetProgramiv(program_, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
    glGetProgramInfoLog(program_, len, nullptr, log.data());
    std::fprintf(stderr, "ShaderProgram: link error:\n%s\n", log.data());
    glDeleteProgram(program_);
    program_ = 0;
    return false;
  }
  return true;
}

bool ShaderProgram::build(const char* vertSrc, const char* fragSrc) {
  GLuint vs = compileShader(GL_VERTEX_SHADER, vertSrc);
  if (!vs) return false;

  GLuint fs = compileShader(GL_FRAGMENT_SHADER, fragSrc);
  if (!fs) { glDeleteShader(vs); return false; }

  const GLuint shaders[2] = {vs, fs};
  return link(shaders, 2);
}

bool ShaderProgram::buildCompute(const char* compSrc) {
  GLuint cs = compileShader(GL_COMPUTE_SHADER, compSrc);
  if (!cs) return false;
  return link(&cs, 1);
}

void ShaderProgram::use() const {
  glUseProgram(program_);
}

} // namespace sc
