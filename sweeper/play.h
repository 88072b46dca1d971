#ifndef SWEEPER_PLAY_H_
#define SWEEPER_PLAY_H_

#include <cstddef>

#include "sweeper/game/board.h"
#include "sweeper/solver/solver.h"

namespace sweeper {

struct PlayOptions {
  // Reveal the top left cell before consulting the solver if nothing has been
  // revealed yet.
  bool first_move = true;
};

// Statistics for a single game.
struct GameOutcome {
  bool won = false;

  // Every action applied, including the first move.
  std::size_t moves = 0;

  // Flags and certain reveals. The first move is not counted.
  std::size_t logic_moves = 0;

  // Reveals that were guesses. The first move is not counted.
  std::size_t guess_moves = 0;

  std::size_t flags_set = 0;
};

// Plays the board to completion, applying one solver decision at a time.
//
// Stops early if the solver has no action to offer.
GameOutcome PlayGame(Board& board, solver::Solver& solver,
                     const PlayOptions& options);

}  // namespace sweeper

#endif  // SWEEPER_PLAY_H_
