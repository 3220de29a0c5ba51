// P5.1 Rasterizer: grid -> RGBA blocks

#include "px/raster/Rasterizer.hpp"

#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  const px::Color red{255, 0, 0};

  // ---- Test 1: single red pixel at scale 10 ----
  {
    auto g = px::Grid::create().setCell(0, 0, red);
    px::PixelBuffer buf;
    requireTrue(px::renderGrid(g, 10, buf) == px::Status::Ok, "render ok");
    requireTrue(buf.width == 320 && buf.height == 320, "320x320");
    requireTrue(buf.rgba.size() == 320u * 320u * 4u, "RGBA size");

    for (int y = 0; y < buf.height; y++) {
      for (int x = 0; x < buf.width; x++) {
        const bool inBlock = x < 10 && y < 10;
        if (buf.colorAt(x, y) != (inBlock ? red : px::kWhite)) {
          std::fprintf(stderr, "pixel (%d,%d) wrong\n", x, y);
          std::exit(1);
        }
        requireTrue(buf.pixel(x, y)[3] == 255, "opaque");
      }
    }
    std::printf("  Test 1 (red pixel scale 10): PASS\n");
  }

  // ---- Test 2: row maps to y, col maps to x ----
  {
    const px::Color blue{0, 0, 255};
    auto g = px::Grid::create(4).setCell(1, 3, blue);  // row 1, col 3
    px::PixelBuffer buf;
    px::renderGrid(g, 5, buf);
    requireTrue(buf.width == 20, "20 wide");
    requireTrue(buf.colorAt(15, 5) == blue, "block top-left");
    requireTrue(buf.colorAt(19, 9) == blue, "block bottom-right");
    requireTrue(buf.colorAt(14, 5) == px::kWhite, "left of block");
    requireTrue(buf.colorAt(15, 10) == px::kWhite, "below block");
    requireTrue(buf.colorAt(5, 15) == px::kWhite, "transposed position untouched");
    std::printf("  Test 2 (row/col orientation): PASS\n");
  }

  // ---- Test 3: scale 1 is a 1:1 copy ----
  {
    auto g = px::Grid::create(3).setCell(2, 1, red);
    px::PixelBuffer buf;
    px::renderGrid(g, 1, buf);
    requireTrue(buf.width == 3 && buf.height == 3, "3x3");
    requireTrue(buf.colorAt(1, 2) == red, "cell copied");
    std::printf("  Test 3 (scale 1): PASS\n");
  }

  // ---- Test 4: invalid scale is rejected, buffer untouched ----
  {
    auto g = px::Grid::create(4);
    px::PixelBuffer buf;
    buf.width = 7;
    requireTrue(px::renderGrid(g, 0, buf) == px::Status::InvalidScale, "scale 0");
    requireTrue(px::renderGrid(g, -3, buf) == px::Status::InvalidScale, "negative scale");
    requireTrue(px::renderGrid(g, 1025, buf) == px::Status::InvalidScale,
                "oversized output");
    requireTrue(buf.width == 7 && buf.rgba.empty(), "buffer untouched");
    std::printf("  Test 4 (invalid scale): PASS\n");
  }

  // ---- Test 5: total pixel cap applies to tiny grids too ----
  {
    auto g = px::Grid::create(1);
    px::PixelBuffer buf;
    requireTrue(px::renderGrid(g, 16384, buf) == px::Status::InvalidScale, "1x1 at 16384");
    requireTrue(buf.rgba.empty(), "nothing allocated");
    requireTrue(px::rasterFits(1, 4096), "4096x4096 fits");
    requireTrue(!px::rasterFits(1, 4097), "4097x4097 does not");
    requireTrue(px::rasterFits(32, 128), "32 cells at 128");
    requireTrue(!px::rasterFits(32, 129), "32 cells at 129");
    requireTrue(!px::rasterFits(65536, 65536), "no overflow");
    std::printf("  Test 5 (pixel cap): PASS\n");
  }

  std::printf("P5.1 rasterizer: ALL PASS\n");
  return 0;
}
