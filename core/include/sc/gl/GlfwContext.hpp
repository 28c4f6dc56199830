#pragma once
#include "sc/gl/GlContext.hpp"

#ifdef SC_HAS_GLFW

struct GLFWwindow;

namespace sc {

struct InputState {
  double cursorX{0};
  double cursorY{0};
  double panDx{0};       // left drag, pixels
  double panDy{0};
  double rotateDx{0};    // right drag, horizontal pixels
  double zoomDelta{0};   // scroll wheel
  bool shouldClose{false};
};

class GlfwContext : public GlContext {
public:
  GlfwContext();
  ~GlfwContext() override;

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height) override;
  void swapBuffers() override;

  int width() const override { return width_; }
  int height() const override { return height_; }

  std::vector<std::uint8_t> readPixels() const override;

  InputState pollInput();
  bool shouldClose() const;

private:
  GLFWwindow* window_{nullptr};
  int width_{0};
  int height_{0};

  // Input accumulation (set via callbacks)
  double scrollAccum_{0};
  double lastCursorX_{0};
  double lastCursorY_{0};
  double dragDx_{0};
  double dragDy_{0};
  double rotateDx_{0};
  bool panning_{false};
  bool rotating_{false};

  static void scrollCallback(GLFWwindow* w, double xoff, double yoff);
  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
};

} // namespace sc

#endif // SC_HAS_GLFW
