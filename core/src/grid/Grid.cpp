#include "px/grid/Grid.hpp"

#include <stdexcept>
#include <string>

namespace px {

Grid Grid::create(int side, Color fill) {
  if (side <= 0) {
    throw std::invalid_argument("Grid::create: side must be positive, got " +
                                std::to_string(side));
  }
  const std::size_t n = static_cast<std::size_t>(side) * static_cast<std::size_t>(side);
  return Grid(side, std::make_shared<std::vector<Color>>(n, fill));
}

void Grid::requireInBounds(int row, int col, const char* op) const {
  if (inBounds(row, col)) return;
  throw std::out_of_range(std::string(op) + ": cell (" + std::to_string(row) +
                          "," + std::to_string(col) + ") outside " +
                          std::to_string(side_) + "x" + std::to_string(side_) + " grid");
}

const Color& Grid::getCell(int row, int col) const {
  requireInBounds(row, col, "Grid::getCell");
  return (*cells_)[index(row, col)];
}

Grid Grid::setCell(int row, int col, const Color& color) const {
  requireInBounds(row, col, "Grid::setCell");
  auto copy = std::make_shared<std::vector<Color>>(*cells_);
  (*copy)[index(row, col)] = color;
  return Grid(side_, std::move(copy));
}

bool Grid::operator==(const Grid& o) const {
  if (side_ != o.side_) return false;
  if (cells_ == o.cells_) return true;
  return *cells_ == *o.cells_;
}

} // namespace px
