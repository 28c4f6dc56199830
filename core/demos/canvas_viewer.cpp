// Canvas viewer: decodes a procedural painting on a background thread, uploads
// it into sparse tiles and shows it through the composite + present passes.
// Uses GLFW if available (left drag pans, right drag rotates, scroll zooms),
// otherwise OSMesa (renders one frame and writes a PNG).
//
// Optional argument: path to an EngineConfig JSON file.

#include "sc/canvas/CanvasTransform.hpp"
#include "sc/config/EngineConfig.hpp"
#include "sc/export/SurfaceSnapshot.hpp"
#include "sc/gl/CanvasRenderer.hpp"
#include "sc/gl/GlContext.hpp"
#include "sc/gl/GlTileDevice.hpp"
#include "sc/image/Layer.hpp"
#include "sc/tiles/TileStorage.hpp"
#include "sc/tiles/UploadQueue.hpp"

#ifdef SC_HAS_GLFW
#include "sc/gl/GlfwContext.hpp"
#endif
#ifdef SC_HAS_OSMESA
#include "sc/gl/OsMesaContext.hpp"
#endif

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

static bool loadConfig(const char* path, sc::EngineConfig& cfg) {
  std::ifstream in(path);
  if (!in) {
    std::fprintf(stderr, "Cannot open config %s\n", path);
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  if (!sc::deserializeEngineConfig(ss.str(), cfg)) {
    std::fprintf(stderr, "Invalid config %s\n", path);
    return false;
  }
  return true;
}

// Soft radial strokes over a paper-colored background.
static sc::PixelBuffer paintCanvas(std::uint32_t w, std::uint32_t h) {
  sc::PixelBuffer px = sc::PixelBuffer::filled(w, h, 0.96f, 0.94f, 0.88f, 1.0f);
  std::uint32_t seed = 7;
  auto rng = [&]() -> float {
    seed = seed * 1103515245u + 12345u;
    return static_cast<float>((seed >> 16) & 0x7FFF) / 32767.0f;
  };

  for (int s = 0; s < 60; s++) {
    float cx = rng() * w, cy = rng() * h;
    float radius = 40.0f + rng() * 220.0f;
    float r = rng(), g = rng(), b = rng();
    int x0 = std::max(0, static_cast<int>(cx - radius));
    int x1 = std::min(static_cast<int>(w), static_cast<int>(cx + radius));
    int y0 = std::max(0, static_cast<int>(cy - radius));
    int y1 = std::min(static_cast<int>(h), static_cast<int>(cy + radius));
    for (int y = y0; y < y1; y++) {
      for (int x = x0; x < x1; x++) {
        float d = std::hypot(x - cx, y - cy) / radius;
        if (d >= 1.0f) continue;
        float a = 0.6f * (1.0f - d * d);
        float* p = px.at(static_cast<std::uint32_t>(x), static_cast<std::uint32_t>(y));
        p[0] = p[0] * (1.0f - a) + r * a;
        p[1] = p[1] * (1.0f - a) + g * a;
        p[2] = p[2] * (1.0f - a) + b * a;
      }
    }
  }
  return px;
}

int main(int argc, char** argv) {
  constexpr int W = 1024;
  constexpr int H = 768;
  constexpr std::uint32_t kCanvasW = 3000;
  constexpr std::uint32_t kCanvasH = 2000;

  sc::EngineConfig cfg;
  cfg.clearColor[0] = 0.18f;
  cfg.clearColor[1] = 0.18f;
  cfg.clearColor[2] = 0.2f;
  cfg.clearColor[3] = 1.0f;
  if (argc > 1 && !loadConfig(argv[1], cfg)) return 1;

  // 1. Create GL context
  std::unique_ptr<sc::GlContext> ctx;
#ifdef SC_HAS_GLFW
  bool useGlfw = true;
#else
  bool useGlfw = false;
#endif

#ifdef SC_HAS_GLFW
  if (useGlfw) {
    auto glfw = std::make_unique<sc::GlfwContext>();
    if (!glfw->init(W, H)) {
      std::fprintf(stderr, "GLFW init failed, falling back to OSMesa\n");
      useGlfw = false;
    } else {
      ctx = std::move(glfw);
    }
  }
#endif

#ifdef SC_HAS_OSMESA
  if (!ctx) {
    auto mesa = std::make_unique<sc::OsMesaContext>();
    if (!mesa->init(W, H)) {
      std::fprintf(stderr, "OSMesa init failed\n");
      return 1;
    }
    ctx = std::move(mesa);
    std::printf("Using OSMesa (headless)\n");
  }
#endif

  if (!ctx) {
    std::fprintf(stderr, "No GL context available\n");
    return 1;
  }

  // 2. Tile storage and renderer
  sc::GlTileDevice device(cfg.tileSize);
  if (!device.init()) return 1;
  sc::TileStorage storage(device, cfg);

  sc::CanvasRenderer renderer(cfg);
  if (!renderer.init()) {
    std::fprintf(stderr, "CanvasRenderer init failed\n");
    return 1;
  }

  // 3. Decode on a worker thread; the GL thread uploads when it arrives.
  sc::CanvasImage image(kCanvasW, kCanvasH);
  sc::UploadQueue uploads;
  std::thread decoder([&]() {
    sc::PendingUpload up{image.root().id, paintCanvas(kCanvasW, kCanvasH)};
    while (!uploads.submit(up)) std::this_thread::yield();
  });

  auto drainUploads = [&]() {
    for (const sc::CompletedUpload& done : uploads.drainInto(storage.uploader())) {
      if (!done.result.ok) {
        std::fprintf(stderr, "Upload failed: %s: %s\n", done.result.err.code.c_str(),
                     done.result.err.message.c_str());
      } else {
        std::printf("Uploaded %u tiles (%llu bytes) into %u piles\n", done.result.tilesWritten,
                    static_cast<unsigned long long>(done.result.bytesStaged),
                    storage.allocator().pileCount());
      }
    }
  };

  // 4. Fit the canvas into the window
  sc::CanvasTransform transform;
  transform.widgetSize = {static_cast<float>(W), static_cast<float>(H)};
  float fit = std::min(static_cast<float>(W) / kCanvasW, static_cast<float>(H) / kCanvasH);
  transform.scaleAround(fit, {0, 0});
  transform.translate({(W - kCanvasW * fit) * 0.5f, (H - kCanvasH * fit) * 0.5f});

#ifdef SC_HAS_GLFW
  if (useGlfw) {
    auto* glfwCtx = static_cast<sc::GlfwContext*>(ctx.get());
    std::printf("GLFW render loop: left drag pans, right drag rotates, scroll zooms\n");

    while (!glfwCtx->shouldClose()) {
      sc::InputState input = glfwCtx->pollInput();
      drainUploads();

      sc::Vec2 cursor{static_cast<float>(input.cursorX), static_cast<float>(input.cursorY)};
      if (input.panDx != 0 || input.panDy != 0) {
        transform.translate({static_cast<float>(input.panDx), static_cast<float>(input.panDy)});
      }
      if (input.rotateDx != 0) {
        transform.rotateAround(static_cast<float>(input.rotateDx) * 0.005f, cursor);
      }
      if (input.zoomDelta != 0) {
        transform.scaleAround(std::pow(1.1f, static_cast<float>(input.zoomDelta)), cursor);
      }

      int w = glfwCtx->width(), h = glfwCtx->height();
      transform.widgetSize = {static_cast<float>(w), static_cast<float>(h)};
      sc::URect view{0, 0, static_cast<std::uint32_t>(w), static_cast<std::uint32_t>(h)};

      glBindFramebuffer(GL_FRAMEBUFFER, 0);
      glViewport(0, 0, w, h);
      glClearColor(0, 0, 0, 1);
      glClear(GL_COLOR_BUFFER_BIT);
      renderer.renderFrame(storage, image, transform, view, 0, w, h, view);
      glfwCtx->swapBuffers();
    }
  } else
#endif
  {
    // OSMesa: wait for the decode, render once, write PNG
    decoder.join();
    drainUploads();

    sc::URect view{0, 0, W, H};
    sc::Stats stats = renderer.renderFrame(storage, image, transform, view, 0, W, H, view);
    ctx->swapBuffers();
    std::printf("Rendered: %u groups, %u tiles, %u dispatches, %.2f ms\n",
                stats.groups, stats.visibleTiles, stats.dispatches, stats.frameMs);

    sc::Rgba8Image shot{ctx->width(), ctx->height(), ctx->readPixels()};
    if (!sc::writePNG("canvas_viewer.png", shot, true)) return 1;
  }

  if (decoder.joinable()) decoder.join();
  std::printf("canvas_viewer complete\n");
  return 0;
}
