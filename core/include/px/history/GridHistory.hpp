#pragma once
#include "px/core/Status.hpp"
#include "px/grid/Grid.hpp"

#include <cstddef>
#include <vector>

namespace px {

// Linear undo/redo log of grid snapshots with a cursor.
// Always holds at least one snapshot; the one at the cursor is the grid
// being displayed and edited. Committing after an undo drops the redo
// branch (no tree history).
class GridHistory {
public:
  explicit GridHistory(Grid initial);

  // Truncate everything after the cursor, append, move cursor to the end.
  void commit(Grid grid);

  // Overwrite the snapshot at the cursor (stroke coalescing only).
  void replaceCurrent(Grid grid);

  // AtHistoryStart / AtHistoryEnd when there is nothing to do.
  Status undo();
  Status redo();

  const Grid& current() const { return snapshots_[cursor_]; }

  bool canUndo() const { return cursor_ > 0; }
  bool canRedo() const { return cursor_ + 1 < snapshots_.size(); }

  std::size_t size() const { return snapshots_.size(); }
  std::size_t cursor() const { return cursor_; }

  // Number of steps available each way (useful for UI display)
  std::size_t undoCount() const { return cursor_; }
  std::size_t redoCount() const { return snapshots_.size() - 1 - cursor_; }

  const Grid& at(std::size_t index) const { return snapshots_.at(index); }

private:
  std::vector<Grid> snapshots_;
  std::size_t cursor_{0};
};

} // namespace px
