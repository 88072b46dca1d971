#include "sweeper/solver/knowledge.h"

namespace sweeper {
namespace solver {

Knowledge ExtractKnowledge(const Board& board) {
  Knowledge knowledge;
  knowledge.rows = board.GetRows();
  knowledge.cols = board.GetCols();
  knowledge.states.Reset(knowledge.rows, knowledge.cols);

  for (std::size_t row = 0; row < knowledge.rows; ++row) {
    for (std::size_t col = 0; col < knowledge.cols; ++col) {
      CellState& state = knowledge.states(row, col);
      if (board.IsFlagged(row, col)) {
        state = CellState::FLAGGED;
        knowledge.flagged.push_back({row, col});
      } else if (board.IsRevealed(row, col)) {
        state = CellState::REVEALED;
        // A revealed mine ends the game and carries no number.
        if (!board.IsMine(row, col)) {
          knowledge.numbers.push_back(
              {{row, col}, board.GetAdjacentMines(row, col)});
        }
      } else {
        state = CellState::COVERED;
        knowledge.covered.push_back({row, col});
      }
    }
  }
  return knowledge;
}

Neighborhood GetNeighborhood(const Knowledge& knowledge,
                             const CellLocation& location) {
  Neighborhood neighborhood;
  knowledge.states.ForEachAdjacent(
      location.row, location.col,
      [&knowledge, &neighborhood](std::size_t row, std::size_t col) {
        switch (knowledge.states(row, col)) {
          case CellState::COVERED:
            neighborhood.covered.push_back({row, col});
            break;
          case CellState::FLAGGED:
            ++neighborhood.flagged;
            break;
          case CellState::REVEALED:
            break;
        }
        return false;
      });
  return neighborhood;
}

bool GetRemainingMines(const NumberedCell& cell,
                       const Neighborhood& neighborhood,
                       std::size_t* remaining) {
  if (neighborhood.flagged > cell.adjacent_mines) {
    return false;
  }
  *remaining = cell.adjacent_mines - neighborhood.flagged;
  return true;
}

}  // namespace solver
}  // namespace sweeper
