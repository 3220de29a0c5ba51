#include "px/config/EditorConfig.hpp"
#include "px/raster/Rasterizer.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>
#include <utility>

namespace px {

// -------------------- Built-in presets --------------------

std::vector<Color> defaultPalette() {
  return {
    {0x00, 0x00, 0x00},  // black
    {0xFF, 0xFF, 0xFF},  // white
    {0xFF, 0x00, 0x00},  // red
    {0x00, 0xFF, 0x00},  // lime
    {0x00, 0x00, 0xFF},  // blue
    {0xFF, 0xFF, 0x00},  // yellow
    {0xFF, 0x00, 0xFF},  // magenta
    {0x00, 0xFF, 0xFF},  // cyan
    {0xFF, 0xA5, 0x00},  // orange
    {0x80, 0x00, 0x80},  // purple
    {0xFF, 0xC0, 0xCB},  // pink
    {0xA5, 0x2A, 0x2A},  // brown
    {0x80, 0x80, 0x80},  // gray
    {0xC0, 0xC0, 0xC0},  // silver
    {0x80, 0x00, 0x00},  // maroon
    {0x00, 0x80, 0x00}   // green
  };
}

std::vector<Color> defaultQuickColors() {
  auto p = defaultPalette();
  p.resize(8);
  return p;
}

// -------------------- Validation --------------------

static bool reject(std::string* why, const char* reason) {
  if (why) *why = reason;
  return false;
}

bool validateEditorConfig(const EditorConfig& cfg, std::string* why) {
  if (cfg.gridSide <= 0)
    return reject(why, "gridSide must be positive");
  if (cfg.minExportScale < 1)
    return reject(why, "minExportScale must be at least 1");
  if (cfg.minExportScale > cfg.maxExportScale)
    return reject(why, "minExportScale exceeds maxExportScale");
  if (cfg.defaultExportScale < cfg.minExportScale ||
      cfg.defaultExportScale > cfg.maxExportScale)
    return reject(why, "defaultExportScale outside export scale range");
  if (!rasterFits(cfg.gridSide, cfg.maxExportScale))
    return reject(why, "maxExportScale too large for gridSide");
  if (cfg.jpegQuality < 1 || cfg.jpegQuality > 100)
    return reject(why, "jpegQuality must be in [1,100]");
  if (cfg.palette.size() < kMinPaletteSize || cfg.palette.size() > kMaxPaletteSize)
    return reject(why, "palette must hold 8 to 16 colors");
  if (cfg.quickColors.size() > cfg.palette.size())
    return reject(why, "quickColors larger than palette");
  return true;
}

// -------------------- JSON --------------------

static rapidjson::Value colorArray(const std::vector<Color>& colors,
                                   rapidjson::Document::AllocatorType& alloc) {
  rapidjson::Value arr(rapidjson::kArrayType);
  for (const auto& c : colors) {
    arr.PushBack(rapidjson::Value(toHex(c).c_str(), alloc), alloc);
  }
  return arr;
}

static bool readColor(const rapidjson::Value& v, Color& out) {
  return v.IsString() && parseHex(v.GetString(), out);
}

static bool readColorArray(const rapidjson::Value& v, std::vector<Color>& out) {
  if (!v.IsArray()) return false;
  std::vector<Color> colors;
  colors.reserve(v.Size());
  for (const auto& e : v.GetArray()) {
    Color c;
    if (!readColor(e, c)) return false;
    colors.push_back(c);
  }
  out = std::move(colors);
  return true;
}

static bool readInt(const rapidjson::Value& doc, const char* key, int& out) {
  auto it = doc.FindMember(key);
  if (it == doc.MemberEnd()) return true;
  if (!it->value.IsInt()) return false;
  out = it->value.GetInt();
  return true;
}

std::string serializeEditorConfig(const EditorConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("gridSide", cfg.gridSide, alloc);
  doc.AddMember("backgroundColor",
                rapidjson::Value(toHex(cfg.backgroundColor).c_str(), alloc), alloc);
  doc.AddMember("initialColor",
                rapidjson::Value(toHex(cfg.initialColor).c_str(), alloc), alloc);
  doc.AddMember("palette", colorArray(cfg.palette, alloc), alloc);
  doc.AddMember("quickColors", colorArray(cfg.quickColors, alloc), alloc);

  rapidjson::Value exp(rapidjson::kObjectType);
  exp.AddMember("minScale", cfg.minExportScale, alloc);
  exp.AddMember("maxScale", cfg.maxExportScale, alloc);
  exp.AddMember("defaultScale", cfg.defaultExportScale, alloc);
  exp.AddMember("format",
                rapidjson::Value(formatExtension(cfg.defaultExportFormat), alloc), alloc);
  exp.AddMember("jpegQuality", cfg.jpegQuality, alloc);
  doc.AddMember("export", exp, alloc);

  doc.AddMember("coalesceStrokes",
                cfg.strokeGranularity == StrokeGranularity::PerStroke, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeEditorConfig(const std::string& json, EditorConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  // Work on a copy so a bad field leaves `out` untouched.
  EditorConfig cfg = out;

  if (!readInt(doc, "gridSide", cfg.gridSide)) return false;

  if (doc.HasMember("backgroundColor") &&
      !readColor(doc["backgroundColor"], cfg.backgroundColor)) return false;
  if (doc.HasMember("initialColor") &&
      !readColor(doc["initialColor"], cfg.initialColor)) return false;

  if (doc.HasMember("palette") &&
      !readColorArray(doc["palette"], cfg.palette)) return false;
  if (doc.HasMember("quickColors") &&
      !readColorArray(doc["quickColors"], cfg.quickColors)) return false;

  if (doc.HasMember("export")) {
    const auto& exp = doc["export"];
    if (!exp.IsObject()) return false;
    if (!readInt(exp, "minScale", cfg.minExportScale)) return false;
    if (!readInt(exp, "maxScale", cfg.maxExportScale)) return false;
    if (!readInt(exp, "defaultScale", cfg.defaultExportScale)) return false;
    if (!readInt(exp, "jpegQuality", cfg.jpegQuality)) return false;
    if (exp.HasMember("format")) {
      if (!exp["format"].IsString() ||
          !parseImageFormat(exp["format"].GetString(), cfg.defaultExportFormat))
        return false;
    }
  }

  if (doc.HasMember("coalesceStrokes")) {
    if (!doc["coalesceStrokes"].IsBool()) return false;
    cfg.strokeGranularity = doc["coalesceStrokes"].GetBool()
        ? StrokeGranularity::PerStroke
        : StrokeGranularity::PerCell;
  }

  out = std::move(cfg);
  return true;
}

bool loadEditorConfigFile(const std::string& path, EditorConfig& out) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    std::fprintf(stderr, "EditorConfig: cannot open %s\n", path.c_str());
    return false;
  }

  std::string json;
  char buf[4096];
  std::size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
    json.append(buf, n);
  }
  bool readOk = !std::ferror(f);
  std::fclose(f);

  if (!readOk) {
    std::fprintf(stderr, "EditorConfig: read error on %s\n", path.c_str());
    return false;
  }
  if (!deserializeEditorConfig(json, out)) {
    std::fprintf(stderr, "EditorConfig: malformed config in %s\n", path.c_str());
    return false;
  }
  return true;
}

} // namespace px
