#include "sweeper/play.h"

#include <glib.h>

namespace sweeper {

GameOutcome PlayGame(Board& board, solver::Solver& solver,
                     const PlayOptions& options) {
  GameOutcome outcome;

  if (options.first_move && !board.IsGameOver() &&
      board.GetRevealedCount() == 0) {
    board.Reveal(0, 0);
    ++outcome.moves;
  }

  while (!board.IsGameOver()) {
    const solver::Decision decision = solver.Decide(board);
    if (!decision.HasAction()) {
      break;
    }

    const Action& action = decision.action;
    g_debug("%s (%zu, %zu)",
            action.type == Action::Type::FLAG ? "flag" : "reveal", action.row,
            action.col);

    ++outcome.moves;
    if (action.type == Action::Type::FLAG) {
      ++outcome.flags_set;
    }
    if (decision.type == solver::Decision::Type::CERTAIN) {
      ++outcome.logic_moves;
    } else {
      ++outcome.guess_moves;
    }

    if (!board.Execute(action)) {
      break;
    }
  }

  outcome.won = board.HasWon();
  return outcome;
}

}  // namespace sweeper
