#include "px/export/ImageExport.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

// stb_image_write implementation must live in exactly one translation unit.
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace px {

const char* formatExtension(ImageFormat f) {
  return f == ImageFormat::Jpeg ? "jpeg" : "png";
}

bool parseImageFormat(const std::string& text, ImageFormat& out) {
  if (text == "png" || text == "masked-lossless") {
    out = ImageFormat::Png;
    return true;
  }
  if (text == "jpeg" || text == "jpg" || text == "lossy") {
    out = ImageFormat::Jpeg;
    return true;
  }
  return false;
}

// ---------------------------------------------------------------------------
// PNG export: self-contained, no zlib/libpng dependency.
// Uses stored deflate blocks (uncompressed) for simplicity.
// ---------------------------------------------------------------------------

namespace {

// CRC32 lookup table (PNG uses ISO 3309 / ITU-T V.42 polynomial).
static std::uint32_t sCrcTable[256];
static bool sCrcTableReady = false;

void initCrcTable() {
  if (sCrcTableReady) return;
  for (std::uint32_t n = 0; n < 256; n++) {
    std::uint32_t c = n;
    for (int k = 0; k < 8; k++) {
      c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    }
    sCrcTable[n] = c;
  }
  sCrcTableReady = true;
}

std::uint32_t computeCrc32(const std::uint8_t* data, std::size_t len) {
  std::uint32_t c = 0xFFFFFFFFu;
  for (std::size_t i = 0; i < len; i++) {
    c = sCrcTable[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  }
  return c ^ 0xFFFFFFFFu;
}

std::uint32_t computeAdler32(const std::uint8_t* data, std::size_t len) {
  // Modulus is the largest prime < 2^16; NMAX bytes fit before reducing (RFC 1950).
  constexpr std::uint32_t MOD = 65521u;
  constexpr std::size_t NMAX = 5552;
  std::uint32_t a = 1, b = 0;
  std::size_t offset = 0;
  while (offset < len) {
    std::size_t chunk = std::min(len - offset, NMAX);
    for (std::size_t i = 0; i < chunk; i++) {
      a += data[offset + i];
      b += a;
    }
    a %= MOD;
    b %= MOD;
    offset += chunk;
  }
  return (b << 16) | a;
}

void pushBE32(std::vector<std::uint8_t>& buf, std::uint32_t v) {
  buf.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void writeChunk(std::vector<std::uint8_t>& out, const char type[4],
                const std::uint8_t* data, std::size_t dataLen) {
  pushBE32(out, static_cast<std::uint32_t>(dataLen));

  std::size_t typeStart = out.size();
  out.insert(out.end(), type, type + 4);
  if (dataLen > 0 && data) {
    out.insert(out.end(), data, data + dataLen);
  }

  // CRC32 over type + data
  pushBE32(out, computeCrc32(&out[typeStart], 4 + dataLen));
}

// Scanlines with filter byte 0x00 (None) followed by RGBA.
std::vector<std::uint8_t> buildScanlines(const PixelBuffer& buf) {
  const std::size_t rowBytes = static_cast<std::size_t>(buf.width) * 4;
  std::vector<std::uint8_t> raw;
  raw.reserve(static_cast<std::size_t>(buf.height) * (1 + rowBytes));

  for (int y = 0; y < buf.height; y++) {
    raw.push_back(0x00);
    const std::uint8_t* row = buf.pixel(0, y);
    raw.insert(raw.end(), row, row + rowBytes);
  }
  return raw;
}

// Wrap raw data in zlib stored-block format (RFC 1950 / RFC 1951).
std::vector<std::uint8_t> wrapZlibStored(const std::uint8_t* data, std::size_t len) {
  std::vector<std::uint8_t> zlib;
  std::size_t numBlocks = std::max<std::size_t>(1, (len + 65534) / 65535);
  zlib.reserve(2 + numBlocks * 5 + len + 4);

  // CMF=0x78 (deflate, 32K window), FLG=0x01 (no dict, check bits)
  zlib.push_back(0x78);
  zlib.push_back(0x01);

  std::size_t offset = 0;
  do {
    std::size_t blockLen = std::min(len - offset, static_cast<std::size_t>(65535));
    bool last = offset + blockLen == len;
    zlib.push_back(last ? 0x01 : 0x00); // BFINAL | BTYPE=00

    auto len16 = static_cast<std::uint16_t>(blockLen);
    auto nlen16 = static_cast<std::uint16_t>(~len16);
    zlib.push_back(static_cast<std::uint8_t>(len16 & 0xFF));
    zlib.push_back(static_cast<std::uint8_t>((len16 >> 8) & 0xFF));
    zlib.push_back(static_cast<std::uint8_t>(nlen16 & 0xFF));
    zlib.push_back(static_cast<std::uint8_t>((nlen16 >> 8) & 0xFF));

    zlib.insert(zlib.end(), data + offset, data + offset + blockLen);
    offset += blockLen;
  } while (offset < len);

  pushBE32(zlib, computeAdler32(data, len));
  return zlib;
}

void appendToVector(void* ctx, void* data, int size) {
  auto* out = static_cast<std::vector<std::uint8_t>*>(ctx);
  auto* bytes = static_cast<std::uint8_t*>(data);
  out->insert(out->end(), bytes, bytes + size);
}

} // anonymous namespace

std::vector<std::uint8_t> encodePNG(const PixelBuffer& buf) {
  if (buf.width <= 0 || buf.height <= 0 ||
      buf.rgba.size() < static_cast<std::size_t>(buf.width) * static_cast<std::size_t>(buf.height) * 4) {
    return {};
  }

  initCrcTable();

  std::vector<std::uint8_t> out;
  out.reserve(128 + static_cast<std::size_t>(buf.height) *
                        (1 + static_cast<std::size_t>(buf.width) * 4) + 256);

  const std::uint8_t sig[8] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
  out.insert(out.end(), sig, sig + 8);

  std::vector<std::uint8_t> ihdr;
  ihdr.reserve(13);
  pushBE32(ihdr, static_cast<std::uint32_t>(buf.width));
  pushBE32(ihdr, static_cast<std::uint32_t>(buf.height));
  ihdr.push_back(8);  // bit depth
  ihdr.push_back(6);  // color type: RGBA
  ihdr.push_back(0);  // compression method: deflate
  ihdr.push_back(0);  // filter method: adaptive
  ihdr.push_back(0);  // interlace: none
  writeChunk(out, "IHDR", ihdr.data(), ihdr.size());

  auto scanlines = buildScanlines(buf);
  auto zlibData = wrapZlibStored(scanlines.data(), scanlines.size());
  writeChunk(out, "IDAT", zlibData.data(), zlibData.size());

  writeChunk(out, "IEND", nullptr, 0);
  return out;
}

std::vector<std::uint8_t> compositeOverWhite(const PixelBuffer& buf) {
  const std::size_t n = static_cast<std::size_t>(buf.width) * static_cast<std::size_t>(buf.height);
  if (buf.width <= 0 || buf.height <= 0 || buf.rgba.size() < n * 4) return {};
  std::vector<std::uint8_t> rgb(n * 3);
  for (std::size_t i = 0; i < n; i++) {
    const std::uint8_t* px = buf.rgba.data() + i * 4;
    const unsigned a = px[3];
    for (int ch = 0; ch < 3; ch++) {
      const unsigned c = px[ch];
      rgb[i * 3 + static_cast<std::size_t>(ch)] =
          static_cast<std::uint8_t>(c + (255u - c) * (255u - a) / 255u);
    }
  }
  return rgb;
}

std::vector<std::uint8_t> encodeJPEG(const PixelBuffer& buf, int quality) {
  if (buf.width <= 0 || buf.height <= 0 ||
      buf.rgba.size() < static_cast<std::size_t>(buf.width) * static_cast<std::size_t>(buf.height) * 4) {
    return {};
  }

  quality = std::clamp(quality, 1, 100);

  // JPEG has no alpha channel.
  auto rgb = compositeOverWhite(buf);

  std::vector<std::uint8_t> out;
  if (!stbi_write_jpg_to_func(appendToVector, &out, buf.width, buf.height, 3,
                              rgb.data(), quality)) {
    std::fprintf(stderr, "ImageExport: stbi_write_jpg_to_func failed\n");
    return {};
  }
  return out;
}

Status encodeImage(const PixelBuffer& buf, ImageFormat format, int quality,
                   std::vector<std::uint8_t>& out) {
  std::vector<std::uint8_t> bytes = format == ImageFormat::Jpeg
      ? encodeJPEG(buf, quality)
      : encodePNG(buf);
  if (bytes.empty()) return Status::EncodeFailed;
  out = std::move(bytes);
  return Status::Ok;
}

bool writeBytes(const std::string& path, const std::vector<std::uint8_t>& bytes) {
  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "ImageExport: cannot open %s for writing\n", path.c_str());
    return false;
  }
  std::size_t written = std::fwrite(bytes.data(), 1, bytes.size(), f);
  bool closed = std::fclose(f) == 0;
  return written == bytes.size() && closed;
}

} // namespace px
