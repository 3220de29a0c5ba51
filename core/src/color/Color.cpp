#include "px/color/Color.hpp"

#include <cmath>

namespace px {

namespace {

const char kHexDigits[] = "0123456789ABCDEF";

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void appendByte(std::string& s, std::uint8_t v) {
  s.push_back(kHexDigits[(v >> 4) & 0x0F]);
  s.push_back(kHexDigits[v & 0x0F]);
}

} // anonymous namespace

std::string toHex(const Color& c) {
  std::string s;
  s.reserve(7);
  s.push_back('#');
  appendByte(s, c.r);
  appendByte(s, c.g);
  appendByte(s, c.b);
  return s;
}

bool parseHex(const std::string& text, Color& out) {
  if (text.size() != 7 || text[0] != '#') return false;

  int nibbles[6];
  for (int i = 0; i < 6; i++) {
    nibbles[i] = hexValue(text[static_cast<std::size_t>(i) + 1]);
    if (nibbles[i] < 0) return false;
  }

  out.r = static_cast<std::uint8_t>(nibbles[0] * 16 + nibbles[1]);
  out.g = static_cast<std::uint8_t>(nibbles[2] * 16 + nibbles[3]);
  out.b = static_cast<std::uint8_t>(nibbles[4] * 16 + nibbles[5]);
  return true;
}

std::uint8_t clampChannel(double v) {
  // Half-up rounding, same as the slider math expects.
  double rounded = std::floor(v + 0.5);
  if (rounded < 0.0) return 0;
  if (rounded > 255.0) return 255;
  return static_cast<std::uint8_t>(rounded);
}

} // namespace px
