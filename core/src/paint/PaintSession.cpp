#include "px/paint/PaintSession.hpp"

#include <cstdio>
#include <utility>

namespace px {

Status PaintSession::onPress(int row, int col, const Color& color,
                             GridHistory& history) {
  if (!history.current().inBounds(row, col)) {
    std::fprintf(stderr, "PaintSession: press outside grid at (%d,%d), ignored\n",
                 row, col);
    return Status::OutOfBounds;
  }

  // A press without a preceding release starts a fresh stroke.
  mode_ = PaintMode::Drawing;
  strokeCommitted_ = false;
  strokeCells_ = 0;
  return paint(row, col, color, history);
}

Status PaintSession::onHover(int row, int col, const Color& color,
                             GridHistory& history) {
  if (mode_ != PaintMode::Drawing) return Status::Ok;

  if (!history.current().inBounds(row, col)) {
    std::fprintf(stderr, "PaintSession: hover outside grid at (%d,%d), ignored\n",
                 row, col);
    return Status::OutOfBounds;
  }
  return paint(row, col, color, history);
}

void PaintSession::onRelease() {
  mode_ = PaintMode::Idle;
  strokeCommitted_ = false;
}

Status PaintSession::paint(int row, int col, const Color& color,
                           GridHistory& history) {
  lastRow_ = row;
  lastCol_ = col;

  const Grid& current = history.current();

  // Repainting a cell with the color it already has would only grow history.
  if (current.getCell(row, col) == color) return Status::Ok;

  Grid next = current.setCell(row, col, color);
  ++strokeCells_;

  // PerStroke: keep folding into the stroke's snapshot as long as nobody
  // moved the cursor underneath us (e.g. an undo mid-drag).
  const bool fold = granularity_ == StrokeGranularity::PerStroke &&
                    strokeCommitted_ &&
                    history.cursor() == strokeCursor_ &&
                    !history.canRedo();
  if (fold) {
    history.replaceCurrent(std::move(next));
  } else {
    history.commit(std::move(next));
    strokeCommitted_ = true;
    strokeCursor_ = history.cursor();
  }
  return Status::Ok;
}

} // namespace px
