#include "sc/export/SurfaceSnapshot.hpp"

#include <glad/gl.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>

namespace sc {

Rgba8Image toRgba8(const PixelBuffer& src) {
  Rgba8Image out;
  if (!src.valid()) return out;
  out.width = static_cast<int>(src.width);
  out.height = static_cast<int>(src.height);
  out.pixels.resize(src.rgba.size());
  for (std::size_t i = 0; i < src.rgba.size(); i++) {
    float v = std::min(1.0f, std::max(0.0f, src.rgba[i]));
    out.pixels[i] = static_cast<std::uint8_t>(std::lround(v * 255.0f));
  }
  return out;
}

PixelBuffer readCompositeSurface(const CompositeSurface& surface) {
  if (surface.texture == 0 || surface.width <= 0 || surface.height <= 0) return PixelBuffer{};

  PixelBuffer out(static_cast<std::uint32_t>(surface.width),
                  static_cast<std::uint32_t>(surface.height));
  glBindTexture(GL_TEXTURE_2D, surface.texture);
  glPixelStorei(GL_PACK_ALIGNMENT, 4);
  glGetTexImage(GL_TEXTURE_2D, 0, GL_RGBA, GL_FLOAT, out.rgba.data());
  glBindTexture(GL_TEXTURE_2D, 0);
  return out;
}

namespace {

const std::array<std::uint32_t, 256>& crcTable() {
  static const std::array<std::uint32_t, 256> table = [] {
    std::array<std::uint32_t, 256> t{};
    for (std::uint32_t n = 0; n < 256; n++) {
      std::uint32_t c = n;
      for (int k = 0; k < 8; k++) c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
      t[n] = c;
    }
    return t;
  }();
  return table;
}

std::uint32_t crc32(const std::uint8_t* data, std::size_t len) {
  const auto& table = crcTable();
  std::uint32_t c = 0xFFFFFFFFu;
  for (std::size_t i = 0; i < len; i++) c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return c ^ 0xFFFFFFFFu;
}

std::uint32_t adler32(const std::vector<std::uint8_t>& data) {
  constexpr std::uint32_t kMod = 65521u;
  std::uint32_t a = 1, b = 0;
  for (std::uint8_t byte : data) {
    a = (a + byte) % kMod;
    b = (b + a) % kMod;
  }
  return (b << 16) | a;
}

void appendBE32(std::vector<std::uint8_t>& buf, std::uint32_t v) {
  buf.push_back(static_cast<std::uint8_t>(v >> 24));
  buf.push_back(static_cast<std::uint8_t>(v >> 16));
  buf.push_back(static_cast<std::uint8_t>(v >> 8));
  buf.push_back(static_cast<std::uint8_t>(v));
}

void appendChunk(std::vector<std::uint8_t>& out, const char* type,
                 const std::vector<std::uint8_t>& data) {
  appendBE32(out, static_cast<std::uint32_t>(data.size()));
  std::size_t crcStart = out.size();
  out.insert(out.end(), type, type + 4);
  out.insert(out.end(), data.begin(), data.end());
  appendBE32(out, crc32(out.data() + crcStart, 4 + data.size()));
}

// Scanlines with filter byte 0, RGBA.
std::vector<std::uint8_t> scanlines(const Rgba8Image& image, bool flipRows) {
  const std::size_t rowBytes = static_cast<std::size_t>(image.width) * 4;
  std::vector<std::uint8_t> raw;
  raw.reserve(static_cast<std::size_t>(image.height) * (rowBytes + 1));
  for (int row = 0; row < image.height; row++) {
    int srcRow = flipRows ? image.height - 1 - row : row;
    const std::uint8_t* src = image.pixels.data() + static_cast<std::size_t>(srcRow) * rowBytes;
    raw.push_back(0);
    raw.insert(raw.end(), src, src + rowBytes);
  }
  return raw;
}

std::vector<std::uint8_t> zlibStored(const std::vector<std::uint8_t>& raw) {
  std::vector<std::uint8_t> z;
  z.push_back(0x78);
  z.push_back(0x01);

  std::size_t offset = 0;
  do {
    std::size_t len = std::min<std::size_t>(raw.size() - offset, 0xFFFF);
    bool last = offset + len == raw.size();
    std::uint16_t n = static_cast<std::uint16_t>(len);
    std::uint16_t nn = static_cast<std::uint16_t>(~n);
    z.push_back(last ? 1 : 0);
    z.push_back(static_cast<std::uint8_t>(n & 0xFF));
    z.push_back(static_cast<std::uint8_t>(n >> 8));
    z.push_back(static_cast<std::uint8_t>(nn & 0xFF));
    z.push_back(static_cast<std::uint8_t>(nn >> 8));
    z.insert(z.end(), raw.begin() + static_cast<std::ptrdiff_t>(offset),
             raw.begin() + static_cast<std::ptrdiff_t>(offset + len));
    offset += len;
  } while (offset < raw.size());

  appendBE32(z, adler32(raw));
  return z;
}

bool validImage(const Rgba8Image& image) {
  return image.width > 0 && image.height > 0 &&
         image.pixels.size() == static_cast<std::size_t>(image.width) * image.height * 4;
}

} // namespace

std::vector<std::uint8_t> encodePNG(const Rgba8Image& image, bool flipRows) {
  if (!validImage(image)) return {};

  std::vector<std::uint8_t> out = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

  std::vector<std::uint8_t> ihdr;
  appendBE32(ihdr, static_cast<std::uint32_t>(image.width));
  appendBE32(ihdr, static_cast<std::uint32_t>(image.height));
  ihdr.push_back(8); // bit depth
  ihdr.push_back(6); // RGBA
  ihdr.push_back(0);
  ihdr.push_back(0);
  ihdr.push_back(0);
  appendChunk(out, "IHDR", ihdr);
  appendChunk(out, "IDAT", zlibStored(scanlines(image, flipRows)));
  appendChunk(out, "IEND", {});
  return out;
}

bool writePNG(const std::string& path, const Rgba8Image& image, bool flipRows) {
  std::vector<std::uint8_t> bytes = encodePNG(image, flipRows);
  if (bytes.empty()) return false;

  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "SurfaceSnapshot: cannot open %s\n", path.c_str());
    return false;
  }
  std::size_t written = std::fwrite(bytes.data(), 1, bytes.size(), f);
  std::fclose(f);
  return written == bytes.size();
}

bool writePPM(const std::string& path, const Rgba8Image& image, bool flipRows) {
  if (!validImage(image)) return false;

  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "SurfaceSnapshot: cannot open %s\n", path.c_str());
    return false;
  }
  std::fprintf(f, "P6\n%d %d\n255\n", image.width, image.height);
  for (int row = 0; row < image.height; row++) {
    int srcRow = flipRows ? image.height - 1 - row : row;
    for (int x = 0; x < image.width; x++) {
      const std::uint8_t* p = image.pixels.data() +
          (static_cast<std::size_t>(srcRow) * image.width + x) * 4;
      std::fputc(p[0], f);
      std::fputc(p[1], f);
      std::fputc(p[2], f);
    }
  }
  bool ok = std::ferror(f) == 0;
  std::fclose(f);
  return ok;
}

} // namespace sc
