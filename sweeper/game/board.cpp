#include "sweeper/game/board.h"

#include <glib.h>

#include <climits>
#include <functional>
#include <memory>
#include <queue>
#include <random>
#include <tuple>
#include <utility>

namespace sweeper {

namespace {

// A single cell in a board.
class Cell {
 public:
  // Returns true if the cell contains a mine.
  bool IsMine() const { return is_mine_; }

  // Sets this cell as a mine.
  //
  // Returns false if the cell was already a mine.
  bool SetMine() {
    if (is_mine_) {
      return false;
    }
    is_mine_ = true;
    return true;
  }

  std::size_t GetAdjacentMines() const { return adjacent_mines_; }

  void SetAdjacentMines(std::size_t adjacent_mines) {
    adjacent_mines_ = adjacent_mines;
  }

  bool IsFlagged() const { return state_ == State::FLAGGED; }

  bool IsCovered() const { return state_ == State::COVERED; }

  bool IsRevealed() const { return state_ == State::REVEALED; }

  // Flags a covered cell.
  //
  // Returns false if the cell is not covered.
  bool SetFlagged() {
    if (state_ != State::COVERED) {
      return false;
    }
    state_ = State::FLAGGED;
    return true;
  }

  // Removes the flag from a flagged cell.
  //
  // Returns false if the cell is not flagged.
  bool ClearFlagged() {
    if (state_ != State::FLAGGED) {
      return false;
    }
    state_ = State::COVERED;
    return true;
  }

  // Reveals the cell if it is covered.
  //
  // Returns false (and does nothing) if the cell is flagged or revealed.
  bool Reveal() {
    if (state_ != State::COVERED) {
      return false;
    }
    state_ = State::REVEALED;
    return true;
  }

 private:
  enum class State {
    // The cell is covered.
    COVERED,

    // The cell is revealed.
    REVEALED,

    // The cell is flagged.
    FLAGGED,
  };

  bool is_mine_ = false;
  std::size_t adjacent_mines_ = 0;
  State state_ = State::COVERED;
};

// The board implementation.
class BoardImpl : public Board {
 public:
  BoardImpl(std::size_t rows, std::size_t cols, std::size_t mines)
      : mines_(mines),
        state_(State::PLAYING),
        remaining_covered_(rows * cols - mines),
        grid_(rows, cols) {}

  ~BoardImpl() final = default;

  // Places mines uniformly at random. Must be called exactly once.
  void PlaceRandomMines(unsigned seed) {
    const std::size_t rows = grid_.GetRows();
    const std::size_t cols = grid_.GetCols();

    std::default_random_engine g;
    g.seed(seed);
    std::uniform_int_distribution<std::size_t> d(0, rows * cols - 1);
    auto rng = std::bind(d, g);

    for (std::size_t remaining_mines = mines_; remaining_mines > 0;) {
      const std::size_t rnd = rng();
      if (grid_(rnd / cols, rnd % cols).SetMine()) {
        --remaining_mines;
      }
    }
    ComputeAdjacentMines();
  }

  // Places mines at the given locations. Must be called exactly once.
  //
  // Returns false if a location is out of range or repeated.
  bool PlaceMines(const std::vector<CellLocation>& locations) {
    for (const CellLocation& location : locations) {
      if (!grid_.IsValid(location.row, location.col) ||
          !grid_(location.row, location.col).SetMine()) {
        return false;
      }
    }
    ComputeAdjacentMines();
    return true;
  }

  bool Reveal(std::size_t row, std::size_t col) final {
    CheckLocation(row, col);
    if (IsGameOver()) {
      return true;
    }

    Cell& cell = grid_(row, col);
    if (!cell.IsCovered()) {
      return true;
    }

    if (cell.IsMine()) {
      cell.Reveal();
      state_ = State::LOSS;
      return false;
    }

    RevealRegion(row, col);

    if (remaining_covered_ == 0) {
      state_ = State::WIN;
    }
    return true;
  }

  void Flag(std::size_t row, std::size_t col) final {
    CheckLocation(row, col);
    if (!IsGameOver()) {
      grid_(row, col).SetFlagged();
    }
  }

  void Unflag(std::size_t row, std::size_t col) final {
    CheckLocation(row, col);
    if (!IsGameOver()) {
      grid_(row, col).ClearFlagged();
    }
  }

  bool IsMine(std::size_t row, std::size_t col) const final {
    CheckLocation(row, col);
    return grid_(row, col).IsMine();
  }

  std::size_t GetAdjacentMines(std::size_t row, std::size_t col) const final {
    CheckLocation(row, col);
    const Cell& cell = grid_(row, col);
    return cell.IsMine() ? kMineAdjacency : cell.GetAdjacentMines();
  }

  bool IsRevealed(std::size_t row, std::size_t col) const final {
    CheckLocation(row, col);
    return grid_(row, col).IsRevealed();
  }

  bool IsFlagged(std::size_t row, std::size_t col) const final {
    CheckLocation(row, col);
    return grid_(row, col).IsFlagged();
  }

  std::vector<CellLocation> GetCoveredCells() const final {
    std::vector<CellLocation> covered;
    grid_.ForEach(
        [&covered](std::size_t row, std::size_t col, const Cell& cell) {
          if (cell.IsCovered()) {
            covered.push_back({row, col});
          }
        });
    return covered;
  }

  std::size_t GetRevealedCount() const final {
    return grid_.GetSize() - mines_ - remaining_covered_;
  }

  std::size_t GetRows() const final { return grid_.GetRows(); }

  std::size_t GetCols() const final { return grid_.GetCols(); }

  std::size_t GetMines() const final { return mines_; }

  State GetState() const final { return state_; }

 private:
  void CheckLocation(std::size_t row, std::size_t col) const {
    if (!grid_.IsValid(row, col)) {
      g_error("cell (%zu, %zu) is outside of a %zux%zu board", row, col,
              grid_.GetRows(), grid_.GetCols());
    }
  }

  void ComputeAdjacentMines() {
    grid_.ForEach([this](std::size_t row, std::size_t col, Cell& cell) {
      cell.SetAdjacentMines(grid_.ForEachAdjacent(
          row, col, [this](std::size_t row, std::size_t col) {
            return grid_(row, col).IsMine();
          }));
    });
  }

  // Reveals cells in a breadth first manner starting at a non-mine cell.
  //
  // If a revealed cell has zero adjacent mines, its adjacent cells are also
  // revealed. Flagged cells are skipped.
  void RevealRegion(std::size_t row, std::size_t col) {
    std::queue<std::tuple<std::size_t, std::size_t>> reveal_queue;
    auto queue_cell = [this, &reveal_queue](std::size_t row, std::size_t col) {
      if (grid_(row, col).IsCovered()) {
        reveal_queue.push(std::make_tuple(row, col));
      }
      return false;
    };
    reveal_queue.push(std::make_tuple(row, col));

    while (!reveal_queue.empty()) {
      std::tie(row, col) = reveal_queue.front();
      reveal_queue.pop();
      Cell& cell = grid_(row, col);

      // Neighbors of a zero cell are never mines, so only the starting cell
      // could be one and the caller has already excluded that.
      if (cell.IsMine() || !cell.Reveal()) {
        continue;
      }
      --remaining_covered_;

      // Automatically expand empty areas.
      if (cell.GetAdjacentMines() == 0) {
        grid_.ForEachAdjacent(row, col, queue_cell);
      }
    }
  }

  const std::size_t mines_;
  State state_;
  std::size_t remaining_covered_;
  Grid<Cell> grid_;
};

bool IsValidConfiguration(std::size_t rows, std::size_t cols,
                          std::size_t mines) {
  return rows > 0 && cols > 0 && mines >= 1 && mines < rows * cols;
}

}  // namespace

std::unique_ptr<Board> NewBoard(std::size_t rows, std::size_t cols,
                                std::size_t mines, unsigned seed) {
  if (!IsValidConfiguration(rows, cols, mines)) {
    return nullptr;
  }
  auto board = std::make_unique<BoardImpl>(rows, cols, mines);
  board->PlaceRandomMines(seed);
  return std::move(board);
}

int NewRandomSeed() {
  std::random_device rd;
  std::uniform_int_distribution<int> d(0, INT_MAX);
  return d(rd);
}

std::unique_ptr<Board> NewBoard(std::size_t rows, std::size_t cols,
                                std::size_t mines) {
  return NewBoard(rows, cols, mines, static_cast<unsigned>(NewRandomSeed()));
}

std::unique_ptr<Board> NewBoardWithMines(
    std::size_t rows, std::size_t cols,
    const std::vector<CellLocation>& mine_locations) {
  if (!IsValidConfiguration(rows, cols, mine_locations.size())) {
    return nullptr;
  }
  auto board = std::make_unique<BoardImpl>(rows, cols, mine_locations.size());
  if (!board->PlaceMines(mine_locations)) {
    return nullptr;
  }
  return std::move(board);
}

}  // namespace sweeper
