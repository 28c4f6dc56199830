#ifdef SC_HAS_GLFW

#include "sc/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <cstdio>

namespace sc {

GlfwContext::GlfwContext() = default;

GlfwContext::~GlfwContext() {
  if (window_) {
    glfwDestroyWindow(window_);
  }
  glfwTerminate();
}

bool GlfwContext::init(int width, int height) {
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwContext: glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, kGlMajorVersion);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, kGlMinorVersion);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);

  window_ = glfwCreateWindow(width, height, "SparseCanvas", nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwContext: glfwCreateWindow failed\n");
    glfwTerminate();
    return false;
  }

  glfwMakeContextCurrent(window_);

  int version = gladLoadGL((GLADloadfunc)glfwGetProcAddress);
  if (!version) {
    std::fprintf(stderr, "GlfwContext: gladLoadGL failed\n");
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
    return false;
  }

  glfwGetFramebufferSize(window_, &width_, &height_);

  glfwSetWindowUserPointer(window_, this);
  glfwSetScrollCallback(window_, scrollCallback);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);

  glfwGetCursorPos(window_, &lastCursorX_, &lastCursorY_);

  return true;
}

void GlfwContext::swapBuffers() {
  if (window_) {
    glfwSwapBuffers(window_);
  }
}

std::vector<std::uint8_t> GlfwContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glBindFramebuffer(GL_FRAMEBUFFER, 0);
  glPixelStorei(GL_PACK_ALIGNMENT, 1);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

bool GlfwContext::shouldClose() const {
  return window_ && glfwWindowShouldClose(window_);
}

InputState GlfwContext::pollInput() {
  glfwPollEvents();

  if (window_) {
    glfwGetFramebufferSize(window_, &width_, &height_);
  }

  InputState state;
  state.shouldClose = shouldClose();
  state.cursorX = lastCursorX_;
  state.cursorY = lastCursorY_;
  state.zoomDelta = scrollAccum_;
  state.panDx = dragDx_;
  state.panDy = dragDy_;
  state.rotateDx = rotateDx_;

  scrollAccum_ = 0;
  dragDx_ = 0;
  dragDy_ = 0;
  rotateDx_ = 0;

  return state;
}

void GlfwContext::scrollCallback(GLFWwindow* w, double /*xoff*/, double yoff) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (self) self->scrollAccum_ += yoff;
}

void GlfwContext::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  if (self->panning_) {
    self->dragDx_ += x - self->lastCursorX_;
    self->dragDy_ += y - self->lastCursorY_;
  }
  if (self->rotating_) {
    self->rotateDx_ += x - self->lastCursorX_;
  }
  self->lastCursorX_ = x;
  self->lastCursorY_ = y;
}

void GlfwContext::mouseButtonCallback(GLFWwindow* w, int button, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  if (button == GLFW_MOUSE_BUTTON_LEFT) {
    self->panning_ = (action == GLFW_PRESS);
  } else if (button == GLFW_MOUSE_BUTTON_RIGHT) {
    self->rotating_ = (action == GLFW_PRESS);
  }
}

} // namespace sc

#endif // SC_HAS_GLFW
