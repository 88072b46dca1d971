#ifndef SWEEPER_GAME_BOARD_H_
#define SWEEPER_GAME_BOARD_H_

#include <cstddef>
#include <limits>
#include <memory>
#include <vector>

#include "sweeper/game/grid.h"

namespace sweeper {

// The adjacency count reported for a cell that contains a mine.
constexpr std::size_t kMineAdjacency = std::numeric_limits<std::size_t>::max();

// Represents the actions that may be performed on a Board.
struct Action {
  enum class Type {
    // Reveal a cell.
    REVEAL,

    // Place a flag on a cell.
    FLAG,
  };

  Type type;
  std::size_t row;
  std::size_t col;
};

inline bool operator==(const Action& a, const Action& b) {
  return a.type == b.type && a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Action& a, const Action& b) { return !(a == b); }

// A Minesweeper board: the hidden mine layout together with the player visible
// state of each cell.
//
// All coordinates passed to a Board must be valid. An out of range coordinate
// is a programming error and terminates the process.
class Board {
 public:
  // Current board state.
  enum class State {
    // The game is ongoing.
    PLAYING,

    // The game ended in a win.
    WIN,

    // The game ended in a loss.
    LOSS,
  };

  virtual ~Board() = default;

  // Reveals the specified cell.
  //
  // Does nothing if the game is over, or the cell is flagged or already
  // revealed. Revealing a cell with zero adjacent mines also reveals the
  // connected region of zero cells and the numbered cells bordering it.
  //
  // Returns false if a mine was revealed, true otherwise.
  virtual bool Reveal(std::size_t row, std::size_t col) = 0;

  // Flags the specified cell.
  //
  // Does nothing if the game is over or the cell is revealed.
  virtual void Flag(std::size_t row, std::size_t col) = 0;

  // Removes a flag from the specified cell.
  //
  // Does nothing if the game is over or the cell is revealed.
  virtual void Unflag(std::size_t row, std::size_t col) = 0;

  // Applies the supplied action.
  //
  // Returns false if the action revealed a mine.
  bool Execute(const Action& action) {
    switch (action.type) {
      case Action::Type::REVEAL:
        return Reveal(action.row, action.col);
      case Action::Type::FLAG:
        Flag(action.row, action.col);
        return true;
    }
    return true;
  }

  // Returns true if the cell contains a mine.
  virtual bool IsMine(std::size_t row, std::size_t col) const = 0;

  // Returns the number of mines adjacent to the cell, or kMineAdjacency if the
  // cell is itself a mine.
  virtual std::size_t GetAdjacentMines(std::size_t row,
                                       std::size_t col) const = 0;

  // Returns true if the cell has been revealed.
  virtual bool IsRevealed(std::size_t row, std::size_t col) const = 0;

  // Returns true if the cell is flagged.
  virtual bool IsFlagged(std::size_t row, std::size_t col) const = 0;

  // Returns all cells that are neither revealed nor flagged, in row-major
  // order.
  virtual std::vector<CellLocation> GetCoveredCells() const = 0;

  // Returns the number of revealed cells that do not contain a mine.
  virtual std::size_t GetRevealedCount() const = 0;

  // Returns the number of rows in the board.
  virtual std::size_t GetRows() const = 0;

  // Returns the number of columns in the board.
  virtual std::size_t GetCols() const = 0;

  // Returns the number of mines in the board.
  virtual std::size_t GetMines() const = 0;

  // Returns the current board state.
  virtual State GetState() const = 0;

  // Returns true if the game is over.
  bool IsGameOver() const { return GetState() != State::PLAYING; }

  // Returns true if the game ended in a win.
  bool HasWon() const { return GetState() == State::WIN; }
};

// Creates a new board.
//   rows - The number of rows.
//   cols - The number of columns.
//   mines - The number of mines. Must be at least 1 and less than rows * cols.
//   seed - Seed for the PRNG to generate the mine locations.
//
// Returns nullptr if the configuration is invalid.
std::unique_ptr<Board> NewBoard(std::size_t rows, std::size_t cols,
                                std::size_t mines, unsigned seed);

// Returns a non-deterministic seed in [0, INT_MAX].
int NewRandomSeed();

// As above, with a seed from NewRandomSeed().
std::unique_ptr<Board> NewBoard(std::size_t rows, std::size_t cols,
                                std::size_t mines);

// Creates a new board with mines at exactly the given locations.
//
// Returns nullptr if the number of mines is invalid, or a location is out of
// range or repeated.
std::unique_ptr<Board> NewBoardWithMines(
    std::size_t rows, std::size_t cols,
    const std::vector<CellLocation>& mine_locations);

}  // namespace sweeper

#endif  // SWEEPER_GAME_BOARD_H_
