#ifndef SWEEPER_GAME_GRID_H_
#define SWEEPER_GAME_GRID_H_

#include <cstddef>
#include <vector>

namespace sweeper {

// Represents the row/col location of a cell.
struct CellLocation {
  std::size_t row;
  std::size_t col;
};

inline bool operator==(const CellLocation& a, const CellLocation& b) {
  return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const CellLocation& a, const CellLocation& b) {
  return !(a == b);
}

// Represents a two dimensional grid of Cells stored in row-major order.
template <typename Cell>
class Grid {
 public:
  Grid() : Grid(0, 0) {}

  Grid(std::size_t rows, std::size_t cols) { Reset(rows, cols); }

  ~Grid() = default;

  // Copyable.
  Grid(const Grid&) = default;
  Grid& operator=(const Grid&) = default;

  // Movable.
  Grid(Grid&&) = default;
  Grid& operator=(Grid&&) = default;

  // Resets the grid to default constructed cells at the specified dimensions.
  void Reset(std::size_t rows, std::size_t cols) {
    rows_ = rows;
    cols_ = cols;
    cells_.assign(rows * cols, Cell());
  }

  // Returns the number of rows.
  std::size_t GetRows() const { return rows_; }

  // Returns the number of columns.
  std::size_t GetCols() const { return cols_; }

  // Returns the total number of cells.
  std::size_t GetSize() const { return cells_.size(); }

  // Returns true if the given row and column are valid.
  bool IsValid(std::size_t row, std::size_t col) const {
    return row < rows_ && col < cols_;
  }

  // Returns the Cell at the specified row and column.
  const Cell& operator()(std::size_t row, std::size_t col) const {
    return cells_[row * cols_ + col];
  }

  // Returns the Cell at the specified row and column.
  Cell& operator()(std::size_t row, std::size_t col) {
    return cells_[row * cols_ + col];
  }

  // Calls the provided function object for each Cell in row-major order.
  //
  // The function should be callable as:
  //   fn(row, col, cell);
  template <class Fn>
  void ForEach(Fn fn) {
    for (std::size_t row = 0; row < rows_; ++row) {
      for (std::size_t col = 0; col < cols_; ++col) {
        fn(row, col, (*this)(row, col));
      }
    }
  }

  template <class Fn>
  void ForEach(Fn fn) const {
    for (std::size_t row = 0; row < rows_; ++row) {
      for (std::size_t col = 0; col < cols_; ++col) {
        fn(row, col, (*this)(row, col));
      }
    }
  }

  // Calls the provided function object for each of the valid adjacent cells,
  // in row-major order.
  //
  // The function should be callable as:
  //   bool v = fn(row, col);
  //
  // Returns the number of function calls that returned true.
  template <class Fn>
  std::size_t ForEachAdjacent(std::size_t row, std::size_t col, Fn fn) const {
    // Note: This relies on the fact that unsigned underflow is well defined.
    std::size_t count = 0;
    for (std::size_t r = row - 1; r != row + 2; ++r) {
      for (std::size_t c = col - 1; c != col + 2; ++c) {
        if ((r != row || c != col) && IsValid(r, c) && fn(r, c)) {
          ++count;
        }
      }
    }
    return count;
  }

 private:
  std::size_t rows_;
  std::size_t cols_;
  std::vector<Cell> cells_;
};

}  // namespace sweeper

#endif  // SWEEPER_GAME_GRID_H_
