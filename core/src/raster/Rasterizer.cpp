#include "px/raster/Rasterizer.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace px {

bool rasterFits(int side, int scale) {
  if (side < 1 || scale < 1) return false;
  const std::int64_t dim = static_cast<std::int64_t>(side) * scale;
  return dim <= kMaxRasterPixels / dim;
}

Status renderGrid(const Grid& grid, int scale, PixelBuffer& out) {
  const int side = grid.side();
  if (!rasterFits(side, scale)) {
    std::fprintf(stderr, "Rasterizer: invalid scale %d for %dx%d grid\n",
                 scale, side, side);
    return Status::InvalidScale;
  }

  const int dim = side * scale;
  const std::size_t rowBytes = static_cast<std::size_t>(dim) * 4;

  std::vector<std::uint8_t> pixels(rowBytes * static_cast<std::size_t>(dim));
  const Color* cells = grid.data();

  for (int r = 0; r < side; r++) {
    // Fill the first pixel row of this cell row, then replicate it.
    std::uint8_t* firstRow = pixels.data() +
        static_cast<std::size_t>(r) * static_cast<std::size_t>(scale) * rowBytes;
    std::uint8_t* p = firstRow;
    for (int c = 0; c < side; c++) {
      const Color& col = cells[static_cast<std::size_t>(r) * static_cast<std::size_t>(side) +
                               static_cast<std::size_t>(c)];
      for (int k = 0; k < scale; k++) {
        *p++ = col.r;
        *p++ = col.g;
        *p++ = col.b;
        *p++ = 255;
      }
    }
    for (int k = 1; k < scale; k++) {
      std::copy(firstRow, firstRow + rowBytes, firstRow + static_cast<std::size_t>(k) * rowBytes);
    }
  }

  out.width = dim;
  out.height = dim;
  out.rgba = std::move(pixels);
  return Status::Ok;
}

} // namespace px
