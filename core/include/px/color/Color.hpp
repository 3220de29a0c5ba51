#pragma once
#include <cstdint>
#include <string>

namespace px {

// 24-bit opaque RGB color. Canonical text form is "#RRGGBB".
struct Color {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  constexpr bool operator==(const Color& o) const {
    return r == o.r && g == o.g && b == o.b;
  }
  constexpr bool operator!=(const Color& o) const { return !(*this == o); }
};

inline constexpr Color kWhite{255, 255, 255};
inline constexpr Color kBlack{0, 0, 0};

// Uppercase "#RRGGBB".
std::string toHex(const Color& c);

// Accepts exactly '#' followed by 6 hex digits (either case).
// Returns false and leaves `out` untouched on anything else.
bool parseHex(const std::string& text, Color& out);

// Rounds and clamps a channel value computed in floating point.
std::uint8_t clampChannel(double v);

} // namespace px
