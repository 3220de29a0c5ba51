#pragma once
#include "px/core/Status.hpp"
#include "px/raster/Rasterizer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace px {

enum class ImageFormat : std::uint8_t {
  Png = 0,   // lossless, keeps the exact cell blocks and the alpha channel
  Jpeg       // lossy, composited over white first
};

inline constexpr int kDefaultJpegQuality = 90;

// "png" / "jpeg"
const char* formatExtension(ImageFormat f);

// Accepts "png", "jpeg", "jpg" and the long names "masked-lossless" / "lossy".
bool parseImageFormat(const std::string& text, ImageFormat& out);

// Encode an RGBA buffer as an 8-bit RGBA PNG.
// Self-contained encoder using stored deflate (no zlib/libpng dependency).
// Returns an empty vector for an empty buffer.
std::vector<std::uint8_t> encodePNG(const PixelBuffer& buf);

// Encode as baseline JPEG at quality [1, 100] (clamped).
// Alpha is flattened onto opaque white before encoding.
std::vector<std::uint8_t> encodeJPEG(const PixelBuffer& buf,
                                     int quality = kDefaultJpegQuality);

// Flatten RGBA onto white into a tightly packed RGB buffer.
std::vector<std::uint8_t> compositeOverWhite(const PixelBuffer& buf);

// Dispatch on format. EncodeFailed if the encoder produced nothing.
Status encodeImage(const PixelBuffer& buf, ImageFormat format, int quality,
                   std::vector<std::uint8_t>& out);

// Write an encoded image to disk. Returns false on any I/O failure.
bool writeBytes(const std::string& path, const std::vector<std::uint8_t>& bytes);

} // namespace px
