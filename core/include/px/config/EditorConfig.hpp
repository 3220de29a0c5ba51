#pragma once
#include "px/color/Color.hpp"
#include "px/export/ImageExport.hpp"
#include "px/grid/Grid.hpp"
#include "px/paint/PaintSession.hpp"

#include <string>
#include <vector>

namespace px {

// Built-in presets
std::vector<Color> defaultPalette();      // 16 named colors
std::vector<Color> defaultQuickColors();  // first 8 of the palette

inline constexpr std::size_t kMinPaletteSize = 8;
inline constexpr std::size_t kMaxPaletteSize = 16;

struct EditorConfig {
  int gridSide{kDefaultGridSide};
  Color backgroundColor{kWhite};  // blank cell color, also used by clear
  Color initialColor{kBlack};     // selected color at startup

  std::vector<Color> palette{defaultPalette()};
  std::vector<Color> quickColors{defaultQuickColors()};

  // Export
  int minExportScale{5};
  int maxExportScale{20};
  int defaultExportScale{10};
  ImageFormat defaultExportFormat{ImageFormat::Png};
  int jpegQuality{kDefaultJpegQuality};

  // JSON "coalesceStrokes": true selects PerStroke.
  StrokeGranularity strokeGranularity{StrokeGranularity::PerCell};
};

// Checks ranges. On failure, writes a short reason to `why` if given.
bool validateEditorConfig(const EditorConfig& cfg, std::string* why = nullptr);

// Serialize EditorConfig to a JSON string.
std::string serializeEditorConfig(const EditorConfig& cfg);

// Overlay the fields present in `json` onto `out`.
// Returns false (leaving `out` unchanged) on parse errors or malformed values.
bool deserializeEditorConfig(const std::string& json, EditorConfig& out);

// Read a JSON file and deserialize it. Returns false on I/O or parse error.
bool loadEditorConfigFile(const std::string& path, EditorConfig& out);

} // namespace px
