// M3.3 - Snapshot encoding: float to 8-bit, PNG and PPM output

#include "sc/export/SurfaceSnapshot.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static std::uint32_t readBE32(const std::vector<std::uint8_t>& b, std::size_t at) {
  return (static_cast<std::uint32_t>(b[at]) << 24) | (static_cast<std::uint32_t>(b[at + 1]) << 16) |
         (static_cast<std::uint32_t>(b[at + 2]) << 8) | b[at + 3];
}

static long fileSize(const char* path) {
  FILE* f = std::fopen(path, "rb");
  if (!f) return -1;
  std::fseek(f, 0, SEEK_END);
  long n = std::ftell(f);
  std::fclose(f);
  return n;
}

int main() {
  // --- toRgba8 ---
  {
    sc::PixelBuffer px(2, 1);
    px.setPixel(0, 0, 0.5f, -1.0f, 2.0f, 1.0f);
    px.setPixel(1, 0, 0.0f, 1.0f, 0.25f, 0.0f);
    sc::Rgba8Image img = sc::toRgba8(px);
    requireTrue(img.width == 2 && img.height == 1, "size");
    requireTrue(img.pixels[0] == 128, "0.5 -> 128");
    requireTrue(img.pixels[1] == 0, "negative clamps to 0");
    requireTrue(img.pixels[2] == 255, "over one clamps to 255");
    requireTrue(img.pixels[6] == 64, "0.25 -> 64");
    requireTrue(sc::toRgba8(sc::PixelBuffer{}).pixels.empty(), "invalid buffer -> empty image");
    std::printf("  toRgba8 PASS\n");
  }

  // Two rows: red on top, blue below.
  sc::Rgba8Image img;
  img.width = 3;
  img.height = 2;
  img.pixels.assign(3 * 2 * 4, 0);
  for (int x = 0; x < 3; x++) {
    img.pixels[x * 4 + 0] = 255;
    img.pixels[x * 4 + 3] = 255;
    img.pixels[(3 + x) * 4 + 2] = 255;
    img.pixels[(3 + x) * 4 + 3] = 255;
  }

  // --- PNG layout ---
  {
    std::vector<std::uint8_t> png = sc::encodePNG(img);
    const std::uint8_t sig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    requireTrue(png.size() > 57, "non-trivial output");
    requireTrue(std::memcmp(png.data(), sig, 8) == 0, "signature");
    requireTrue(readBE32(png, 8) == 13, "IHDR length");
    requireTrue(std::memcmp(png.data() + 12, "IHDR", 4) == 0, "IHDR first");
    requireTrue(readBE32(png, 16) == 3 && readBE32(png, 20) == 2, "dimensions");
    requireTrue(png[24] == 8 && png[25] == 6, "8-bit RGBA");

    // IEND with its fixed CRC closes the file.
    std::size_t end = png.size() - 12;
    requireTrue(readBE32(png, end) == 0, "IEND length");
    requireTrue(std::memcmp(png.data() + end + 4, "IEND", 4) == 0, "IEND last");
    requireTrue(readBE32(png, end + 8) == 0xAE426082u, "IEND crc");

    // IDAT: 8 sig + 25 IHDR, then length, type, 2 zlib bytes, 5 block bytes.
    std::size_t idat = 33;
    requireTrue(std::memcmp(png.data() + idat + 4, "IDAT", 4) == 0, "IDAT follows IHDR");
    std::size_t firstRow = idat + 8 + 2 + 5;
    requireTrue(png[idat + 8] == 0x78, "zlib header");
    requireTrue(png[firstRow] == 0, "filter byte none");
    requireTrue(png[firstRow + 1] == 255 && png[firstRow + 3] == 0, "top row red");

    std::vector<std::uint8_t> flipped = sc::encodePNG(img, true);
    requireTrue(flipped.size() == png.size(), "same size flipped");
    requireTrue(flipped[firstRow + 1] == 0 && flipped[firstRow + 3] == 255, "flipped top row blue");

    sc::Rgba8Image bad;
    bad.width = 2;
    bad.height = 2;
    requireTrue(sc::encodePNG(bad).empty(), "inconsistent image rejected");
    std::printf("  PNG layout PASS\n");
  }

  // --- Files ---
  {
    const char* pngPath = "m3_3_snapshot.png";
    const char* ppmPath = "m3_3_snapshot.ppm";
    requireTrue(sc::writePNG(pngPath, img), "writePNG");
    requireTrue(fileSize(pngPath) == static_cast<long>(sc::encodePNG(img).size()), "png size");
    requireTrue(sc::writePPM(ppmPath, img), "writePPM");
    // "P6\n3 2\n255\n" + 3 * 2 * 3 bytes
    requireTrue(fileSize(ppmPath) == 11 + 18, "ppm size");
    requireTrue(!sc::writePNG("no_such_dir/x.png", img), "unwritable path fails");
    std::remove(pngPath);
    std::remove(ppmPath);
    std::printf("  File output PASS\n");
  }

  std::printf("M3.3 png_export: ALL PASS\n");
  return 0;
}
