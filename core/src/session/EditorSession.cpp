#include "px/session/EditorSession.hpp"

#include "px/color/ColorConverter.hpp"
#include "px/raster/Rasterizer.hpp"

#include <cstdio>
#include <stdexcept>
#include <utility>

namespace px {

static EditorConfig validated(EditorConfig cfg) {
  std::string why;
  if (!validateEditorConfig(cfg, &why)) {
    throw std::invalid_argument("EditorSession: invalid config: " + why);
  }
  return cfg;
}

EditorSession::EditorSession(EditorConfig config)
  : config_(validated(std::move(config))),
    history_(Grid::create(config_.gridSide, config_.backgroundColor)),
    paint_(config_.strokeGranularity),
    selected_(config_.initialColor) {}

// -------------------- pointer --------------------

Status EditorSession::press(int row, int col) {
  return paint_.onPress(row, col, selected_, history_);
}

Status EditorSession::hover(int row, int col) {
  return paint_.onHover(row, col, selected_, history_);
}

void EditorSession::release() {
  paint_.onRelease();
}

void EditorSession::pointerLeave() {
  paint_.onPointerLeave();
}

// -------------------- color --------------------

void EditorSession::selectHue(int hue) {
  selected_ = hueToColor(hue);
}

void EditorSession::selectBrightness(int level) {
  selected_ = adjustBrightness(selected_, level);
}

Status EditorSession::setHex(const std::string& text) {
  Color c;
  if (!parseHex(text, c)) return Status::InvalidHexFormat;
  selected_ = c;
  return Status::Ok;
}

void EditorSession::pickPreset(const Color& color) {
  selected_ = color;
}

int EditorSession::hue() const {
  return colorToHue(selected_);
}

// -------------------- history --------------------

Status EditorSession::requestUndo() {
  return history_.undo();
}

Status EditorSession::requestRedo() {
  return history_.redo();
}

void EditorSession::requestClear() {
  paint_.onRelease();
  history_.commit(Grid::create(config_.gridSide, config_.backgroundColor));
}

// -------------------- export --------------------

Status EditorSession::requestExport(ImageFormat format, int scale,
                                    ExportResult& out) const {
  if (scale < config_.minExportScale || scale > config_.maxExportScale) {
    std::fprintf(stderr, "EditorSession: export scale %d outside [%d,%d]\n",
                 scale, config_.minExportScale, config_.maxExportScale);
    return Status::InvalidScale;
  }

  // Snapshots are immutable, so holding a copy keeps this export consistent.
  const Grid snapshot = history_.current();

  PixelBuffer buf;
  Status st = renderGrid(snapshot, scale, buf);
  if (st != Status::Ok) return st;

  std::vector<std::uint8_t> bytes;
  st = encodeImage(buf, format, config_.jpegQuality, bytes);
  if (st != Status::Ok) {
    std::fprintf(stderr, "EditorSession: %s encoding failed\n", formatExtension(format));
    return st;
  }

  out.bytes = std::move(bytes);
  out.width = buf.width;
  out.height = buf.height;
  out.format = format;
  out.fileName = std::string("pixel-art.") + formatExtension(format);
  return Status::Ok;
}

} // namespace px
