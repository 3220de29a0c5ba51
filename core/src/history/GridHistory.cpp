#include "px/history/GridHistory.hpp"

#include <utility>

namespace px {

GridHistory::GridHistory(Grid initial) {
  snapshots_.push_back(std::move(initial));
}

void GridHistory::commit(Grid grid) {
  snapshots_.erase(snapshots_.begin() + static_cast<std::ptrdiff_t>(cursor_ + 1),
                   snapshots_.end());
  snapshots_.push_back(std::move(grid));
  cursor_ = snapshots_.size() - 1;
}

void GridHistory::replaceCurrent(Grid grid) {
  snapshots_[cursor_] = std::move(grid);
}

Status GridHistory::undo() {
  if (!canUndo()) return Status::AtHistoryStart;
  --cursor_;
  return Status::Ok;
}

Status GridHistory::redo() {
  if (!canRedo()) return Status::AtHistoryEnd;
  ++cursor_;
  return Status::Ok;
}

} // namespace px
