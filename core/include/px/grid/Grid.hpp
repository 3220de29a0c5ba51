#pragma once
#include "px/color/Color.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace px {

inline constexpr int kDefaultGridSide = 32;

// Immutable side x side matrix of colors.
// Copies are cheap: snapshots share cell storage until setCell() produces
// a new grid, which gets its own copy. Dimensions never change.
class Grid {
public:
  // Throws std::invalid_argument if side <= 0.
  static Grid create(int side = kDefaultGridSide, Color fill = kWhite);

  int side() const { return side_; }
  std::size_t cellCount() const { return cells_->size(); }

  bool inBounds(int row, int col) const {
    return row >= 0 && row < side_ && col >= 0 && col < side_;
  }

  // Both throw std::out_of_range outside [0, side).
  const Color& getCell(int row, int col) const;
  Grid setCell(int row, int col, const Color& color) const;

  // Row-major, side() * side() entries.
  const Color* data() const { return cells_->data(); }

  bool sharesStorageWith(const Grid& other) const {
    return cells_ == other.cells_;
  }

  bool operator==(const Grid& o) const;
  bool operator!=(const Grid& o) const { return !(*this == o); }

private:
  Grid(int side, std::shared_ptr<const std::vector<Color>> cells)
    : side_(side), cells_(std::move(cells)) {}

  std::size_t index(int row, int col) const {
    return static_cast<std::size_t>(row) * static_cast<std::size_t>(side_) +
           static_cast<std::size_t>(col);
  }

  void requireInBounds(int row, int col, const char* op) const;

  int side_;
  std::shared_ptr<const std::vector<Color>> cells_;
};

} // namespace px
