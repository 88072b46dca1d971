#ifndef SWEEPER_SOLVER_KNOWLEDGE_H_
#define SWEEPER_SOLVER_KNOWLEDGE_H_

#include <cstddef>
#include <vector>

#include "sweeper/game/board.h"
#include "sweeper/game/grid.h"

namespace sweeper {
namespace solver {

// The state of a cell from a player's point of view.
enum class CellState {
  // The cell is covered (but not flagged).
  COVERED,

  // The cell is revealed.
  REVEALED,

  // The cell is flagged.
  FLAGGED,
};

// A revealed cell and the number of mines adjacent to it.
struct NumberedCell {
  CellLocation location;
  std::size_t adjacent_mines;
};

// Represents what a player is allowed to see of a board at one instant.
//
// Every list is in row-major order. A Knowledge is only consistent with the
// board it was extracted from until the board is next mutated.
struct Knowledge {
  std::size_t rows = 0;
  std::size_t cols = 0;

  // Revealed cells, including those with zero adjacent mines.
  std::vector<NumberedCell> numbers;

  // Cells that are neither revealed nor flagged.
  std::vector<CellLocation> covered;

  // Flagged cells.
  std::vector<CellLocation> flagged;

  // The state of every cell, for neighbor lookups.
  Grid<CellState> states;
};

// The unrevealed neighbors of a revealed cell.
struct Neighborhood {
  // Covered neighbors in row-major order.
  std::vector<CellLocation> covered;

  // The number of flagged neighbors.
  std::size_t flagged = 0;
};

// Returns the unrevealed neighbors of the given location.
Neighborhood GetNeighborhood(const Knowledge& knowledge,
                             const CellLocation& location);

// Computes the number of mines that remain among the covered neighbors of a
// numbered cell.
//
// Returns false if more neighbors are flagged than the cell has adjacent
// mines, in which case no count is consistent with the flags.
bool GetRemainingMines(const NumberedCell& cell,
                       const Neighborhood& neighborhood,
                       std::size_t* remaining);

// Extracts the player visible state of the board.
Knowledge ExtractKnowledge(const Board& board);

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_KNOWLEDGE_H_
