#ifndef SWEEPER_SOLVER_LOCAL_H_
#define SWEEPER_SOLVER_LOCAL_H_

#include <memory>
#include <random>
#include <vector>

#include "sweeper/game/grid.h"
#include "sweeper/solver/knowledge.h"
#include "sweeper/solver/solver.h"

namespace sweeper {
namespace solver {
namespace local {

// Applies rules to each revealed cell and its immediate neighbors in
// isolation:
//  - Flags a neighbor when the number of covered neighbors matches the number
//    of adjacent mines not yet flagged.
//  - Reveals a neighbor when the number of flagged neighbors matches the
//    number of adjacent mines.
//
// Every revealed cell is checked against the first rule before any is checked
// against the second. At most one action is produced.
//
// Returns a CERTAIN decision, or a NONE decision if neither rule applies.
Decision Deduce(const Knowledge& knowledge);

// Chooses a covered cell uniformly at random to reveal.
//
// Returns a NONE decision if there are no covered cells.
Decision GuessUniformly(const std::vector<CellLocation>& covered,
                        std::default_random_engine& rng);

// Provides a solver that uses Deduce, and guesses uniformly when it is stuck.
//
// This solver will not find solutions that require reasoning about two or more
// cells simultaneously.
std::unique_ptr<Solver> New(unsigned seed);

}  // namespace local
}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_LOCAL_H_
