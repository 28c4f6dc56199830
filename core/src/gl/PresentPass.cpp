#include "sc/gl/PresentPass.hpp"
#include <cstdio>

namespace sc {

static const char* kPresentVert = R"GLSL(
#version 430 core
out vec2 v_uv;
void main() {
    // (0,0) (2,0) (0,2): one triangle covering the viewport.
    vec2 p = vec2(float((gl_VertexID << 1) & 2), float(gl_VertexID & 2));
    // Surface row 0 is the top of the view.
    v_uv = vec2(p.x, 1.0 - p.y);
    gl_Position = vec4(p * 2.0 - 1.0, 0.0, 1.0);
}
)GLSL";

static const char* kPresentFrag = R"GLSL(
#version 430 core
layout(binding = 0) uniform sampler2D u_surface;
in vec2 v_uv;
out vec4 outColor;
void main() {
    outColor = texture(u_surface, v_uv);
}
)GLSL";

PresentPass::~PresentPass() {
  if (sampler_) glDeleteSamplers(1, &sampler_);
  if (vao_) glDeleteVertexArrays(1, &vao_);
}

bool PresentPass::init() {
  if (program_.valid()) return true;
  if (!program_.build(kPresentVert, kPresentFrag)) {
    std::fprintf(stderr, "PresentPass: failed to build present program\n");
    return false;
  }

  // Core profile needs a bound VAO even without attributes.
  glGenVertexArrays(1, &vao_);

  glGenSamplers(1, &sampler_);
  glSamplerParameteri(sampler_, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glSamplerParameteri(sampler_, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glSamplerParameteri(sampler_, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glSamplerParameteri(sampler_, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  return true;
}

void PresentPass::present(const CompositeSurface& src, GLuint targetFbo,
                          int targetWidth, int targetHeight,
                          const URect& viewRect, const URect& clip, Stats& stats) {
  if (!program_.valid() || src.texture == 0) return;
  if (viewRect.width == 0 || viewRect.height == 0) return;
  if (clip.width == 0 || clip.height == 0) return;

  const int vh = static_cast<int>(viewRect.height);
  const int ch = static_cast<int>(clip.height);

  glBindFramebuffer(GL_FRAMEBUFFER, targetFbo);
  glViewport(static_cast<GLint>(viewRect.x),
             targetHeight - static_cast<int>(viewRect.y) - vh,
             static_cast<GLsizei>(viewRect.width), vh);
  glEnable(GL_SCISSOR_TEST);
  glScissor(static_cast<GLint>(clip.x),
            targetHeight - static_cast<int>(clip.y) - ch,
            static_cast<GLsizei>(clip.width), ch);
  glDisable(GL_BLEND);
  glDisable(GL_DEPTH_TEST);

  program_.use();
  glActiveTexture(GL_TEXTURE0);
  glBindTexture(GL_TEXTURE_2D, src.texture);
  glBindSampler(0, sampler_);
  glBindVertexArray(vao_);
  glDrawArrays(GL_TRIANGLES, 0, 3);
  stats.drawCalls++;

  glBindVertexArray(0);
  glBindSampler(0, 0);
  glBindTexture(GL_TEXTURE_2D, 0);
  glUseProgram(0);
  glDisable(GL_SCISSOR_TEST);
  glViewport(0, 0, targetWidth, targetHeight);
}

} // namespace sc
