#include "px/color/ColorConverter.hpp"

#include <algorithm>
#include <cmath>

namespace px {

int colorToHue(const Color& c) {
  const double r = c.r / 255.0;
  const double g = c.g / 255.0;
  const double b = c.b / 255.0;

  const double mx = std::max({r, g, b});
  const double mn = std::min({r, g, b});
  const double diff = mx - mn;
  if (diff == 0.0) return 0;

  double sextant;
  if (mx == r) {
    sextant = std::fmod((g - b) / diff, 6.0);
    if (sextant < 0.0) sextant += 6.0;
  } else if (mx == g) {
    sextant = (b - r) / diff + 2.0;
  } else {
    sextant = (r - g) / diff + 4.0;
  }

  int hue = static_cast<int>(std::floor(sextant * 60.0 + 0.5));
  if (hue >= 360) hue -= 360;
  return hue;
}

Color hueToColor(int hue) {
  hue %= 360;
  if (hue < 0) hue += 360;

  const double h = static_cast<double>(hue);
  const double chroma = 1.0;
  const double x = chroma * (1.0 - std::fabs(std::fmod(h / 60.0, 2.0) - 1.0));
  const double m = 0.5 - chroma / 2.0;

  double r = 0.0, g = 0.0, b = 0.0;
  switch (hue / 60) {
    case 0:  r = chroma; g = x;      b = 0.0;    break;
    case 1:  r = x;      g = chroma; b = 0.0;    break;
    case 2:  r = 0.0;    g = chroma; b = x;      break;
    case 3:  r = 0.0;    g = x;      b = chroma; break;
    case 4:  r = x;      g = 0.0;    b = chroma; break;
    default: r = chroma; g = 0.0;    b = x;      break;
  }

  return Color{clampChannel((r + m) * 255.0),
               clampChannel((g + m) * 255.0),
               clampChannel((b + m) * 255.0)};
}

Color adjustBrightness(const Color& c, int level) {
  level = std::clamp(level, 0, 100);
  if (level == 50) return c;

  auto apply = [level](std::uint8_t ch) -> std::uint8_t {
    const double v = static_cast<double>(ch);
    if (level < 50) {
      const double factor = level / 50.0;
      return clampChannel(v * factor);
    }
    const double factor = (level - 50) / 50.0;
    return clampChannel(v + (255.0 - v) * factor);
  };

  return Color{apply(c.r), apply(c.g), apply(c.b)};
}

} // namespace px
