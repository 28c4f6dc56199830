#include "sc/image/Layer.hpp"

namespace sc {

Layer Layer::create(std::uint32_t width, std::uint32_t height) {
  return Layer{nextLayerId(), width, height};
}

UploadResult uploadLayer(const PixelBuffer& pixels, TileUploader& uploader,
                         Layer& layerOut) {
  layerOut = Layer::create(pixels.width, pixels.height);
  return uploader.upload(layerOut.id, pixels);
}

CanvasImage::CanvasImage(std::uint32_t width, std::uint32_t height)
    : width_(width), height_(height), root_(Layer::create(width, height)) {}

CanvasImage::CanvasImage(std::uint32_t width, std::uint32_t height, Layer root)
    : width_(width), height_(height), root_(root) {}

} // namespace sc
