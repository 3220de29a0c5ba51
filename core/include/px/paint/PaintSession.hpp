#pragma once
#include "px/color/Color.hpp"
#include "px/core/Status.hpp"
#include "px/history/GridHistory.hpp"

#include <cstddef>
#include <cstdint>

namespace px {

// Drag-to-paint state machine.
// States: Idle -> Drawing (press) -> Drawing (hover) -> Idle (release/leave)
enum class PaintMode : std::uint8_t {
  Idle = 0,
  Drawing
};

// How many undo steps a stroke produces.
enum class StrokeGranularity : std::uint8_t {
  PerCell = 0,   // every painted cell is its own undo step
  PerStroke      // all cells between press and release form one step
};

class PaintSession {
public:
  explicit PaintSession(StrokeGranularity granularity = StrokeGranularity::PerCell)
    : granularity_(granularity) {}

  // Paint (row, col) with `color` and enter Drawing.
  // A press outside the grid is ignored and returns OutOfBounds.
  Status onPress(int row, int col, const Color& color, GridHistory& history);

  // Paint (row, col) if Drawing; no-op while Idle.
  Status onHover(int row, int col, const Color& color, GridHistory& history);

  void onRelease();

  // Leaving the drawable surface ends the stroke exactly like a release.
  void onPointerLeave() { onRelease(); }

  PaintMode mode() const { return mode_; }
  bool isDrawing() const { return mode_ == PaintMode::Drawing; }

  StrokeGranularity granularity() const { return granularity_; }

  // Cells whose color actually changed during the current/last stroke.
  std::size_t strokeCellCount() const { return strokeCells_; }

  int lastRow() const { return lastRow_; }
  int lastCol() const { return lastCol_; }

private:
  Status paint(int row, int col, const Color& color, GridHistory& history);

  PaintMode mode_{PaintMode::Idle};
  StrokeGranularity granularity_;

  int lastRow_{-1}, lastCol_{-1};
  std::size_t strokeCells_{0};

  // Cursor of the snapshot this stroke owns in PerStroke mode.
  bool strokeCommitted_{false};
  std::size_t strokeCursor_{0};
};

} // namespace px
