#pragma once
#include "px/color/Color.hpp"

namespace px {

// Hue slider position for a color, in whole degrees [0, 360).
// Max/min channel chroma method; greys (zero chroma) map to 0.
int colorToHue(const Color& c);

// Fully saturated, 50% lightness color for a hue slider position.
// Not a general HSL conversion: saturation and lightness are fixed.
// Hues outside [0, 360) are wrapped first.
Color hueToColor(int hue);

// Brightness slider: level in [0, 100] (clamped), 50 returns `c` unchanged.
// Below 50 scales channels toward black, above 50 blends toward white.
// Works on raw RGB channels, so repeated moves compound.
Color adjustBrightness(const Color& c, int level);

} // namespace px
