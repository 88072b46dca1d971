#ifndef SWEEPER_SOLVER_ENUMERATOR_H_
#define SWEEPER_SOLVER_ENUMERATOR_H_

#include <cstddef>
#include <vector>

#include "sweeper/solver/frontier.h"

namespace sweeper {
namespace solver {

// Counts of the models in which one variable holds a mine.
struct VariableTally {
  std::size_t mine_models = 0;
  std::size_t total_models = 0;

  // Returns the fraction of models in which the variable is a mine.
  //
  // Only meaningful when total_models is non-zero.
  double GetMineProbability() const {
    return static_cast<double>(mine_models) /
           static_cast<double>(total_models);
  }
};

// The result of enumerating every assignment of mines to the cells of one
// component.
struct Enumeration {
  // The number of assignments satisfying every constraint.
  std::size_t models = 0;

  // The number of partial assignments visited, including pruned ones.
  std::size_t nodes = 0;

  // The number of partial assignments abandoned because some constraint could
  // no longer be satisfied.
  std::size_t pruned = 0;

  // One tally per component location, in the same order.
  std::vector<VariableTally> tallies;
};

// Enumerates every assignment of mines to the component's cells that satisfies
// all of its constraints.
//
// Variables are assigned in order, mine before safe, using an explicit stack.
// The cost grows as 2^n in the number of cells, so callers are expected to
// bound the component size.
Enumeration Enumerate(const Component& component);

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_ENUMERATOR_H_
