#pragma once
#include "px/color/Color.hpp"
#include "px/config/EditorConfig.hpp"
#include "px/core/Status.hpp"
#include "px/export/ImageExport.hpp"
#include "px/history/GridHistory.hpp"
#include "px/paint/PaintSession.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace px {

struct ExportResult {
  std::vector<std::uint8_t> bytes;
  int width{0};
  int height{0};
  ImageFormat format{ImageFormat::Png};
  std::string fileName;   // suggested name, e.g. "pixel-art.png"
};

// Owns everything one drawing session needs: the snapshot history, the
// drag-paint state machine and the selected color. Each host input event
// maps to one method; recoverable failures come back as a Status and leave
// the session unchanged.
class EditorSession {
public:
  // Throws std::invalid_argument if the config does not validate.
  explicit EditorSession(EditorConfig config = EditorConfig{});

  // ---- pointer ----
  Status press(int row, int col);
  Status hover(int row, int col);
  void release();
  void pointerLeave();

  // ---- color ----
  void selectHue(int hue);
  void selectBrightness(int level);
  Status setHex(const std::string& text);
  void pickPreset(const Color& color);

  // ---- history ----
  Status requestUndo();
  Status requestRedo();
  void requestClear();

  // ---- export ----
  // scale must lie in [minExportScale, maxExportScale] of the config.
  Status requestExport(ImageFormat format, int scale, ExportResult& out) const;

  // ---- outputs ----
  const Grid& currentGrid() const { return history_.current(); }
  const Color& selectedColor() const { return selected_; }
  int hue() const;
  bool canUndo() const { return history_.canUndo(); }
  bool canRedo() const { return history_.canRedo(); }

  const GridHistory& history() const { return history_; }
  const PaintSession& paintSession() const { return paint_; }
  const EditorConfig& config() const { return config_; }

private:
  EditorConfig config_;
  GridHistory history_;
  PaintSession paint_;
  Color selected_;
};

} // namespace px
