#pragma once
#include "px/color/Color.hpp"
#include "px/core/Status.hpp"
#include "px/grid/Grid.hpp"

#include <cstdint>
#include <vector>

namespace px {

// Largest pixel count a rendered grid may have (64 MiB of RGBA).
inline constexpr std::int64_t kMaxRasterPixels = 4096LL * 4096LL;

// True if a side x side grid at `scale` stays within kMaxRasterPixels.
bool rasterFits(int side, int scale);

// Top-down, row-major RGBA8 pixels.
struct PixelBuffer {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> rgba;

  const std::uint8_t* pixel(int x, int y) const {
    return rgba.data() + (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                          static_cast<std::size_t>(x)) * 4;
  }

  Color colorAt(int x, int y) const {
    const std::uint8_t* p = pixel(x, y);
    return Color{p[0], p[1], p[2]};
  }
};

// Render `grid` at `scale` pixels per cell: cell (r,c) fills rows
// [r*scale, (r+1)*scale) and columns [c*scale, (c+1)*scale), fully opaque.
// Returns InvalidScale (leaving `out` untouched) if scale < 1 or the
// result would exceed kMaxRasterPixels.
Status renderGrid(const Grid& grid, int scale, PixelBuffer& out);

} // namespace px
