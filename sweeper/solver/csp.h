#ifndef SWEEPER_SOLVER_CSP_H_
#define SWEEPER_SOLVER_CSP_H_

#include <memory>

#include "sweeper/solver/knowledge.h"
#include "sweeper/solver/solver.h"

namespace sweeper {
namespace solver {
namespace csp {

// Computes the exact probability that each covered cell bordering a revealed
// number is a mine, one component at a time.
//
// Components are evaluated in row-major order of their first cell. Components
// larger than options.max_component_size, without constraints, or without any
// consistent assignment are skipped. Evaluation stops at the first component
// containing a cell that is certainly a mine (flagged) or certainly safe
// (revealed), preferring a mine, then the first such cell in row-major order.
//
// Otherwise returns a GUESS revealing the cell with the lowest probability of
// being a mine, ties going to the earliest cell evaluated. Returns a NONE
// decision if no component could be evaluated.
Decision Infer(const Knowledge& knowledge, const Options& options);

// Provides a solver that applies local::Deduce, then Infer, then guesses
// uniformly at random.
std::unique_ptr<Solver> New(const Options& options, unsigned seed);

}  // namespace csp
}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_CSP_H_
