#ifndef SWEEPER_SOLVER_FRONTIER_H_
#define SWEEPER_SOLVER_FRONTIER_H_

#include <cstddef>
#include <utility>
#include <vector>

#include "sweeper/game/grid.h"
#include "sweeper/solver/knowledge.h"

namespace sweeper {
namespace solver {

// Represents a known constraint on a component. Each constraint represents a
// set of cells and the number of mines that must be in those cells.
class Constraint {
 public:
  Constraint(std::vector<std::size_t> variables, std::size_t mines)
      : variables_(std::move(variables)), mines_(mines) {}

  // Returns the cells affected by the constraint.
  //
  // These are indexes into the locations of the owning component, in
  // ascending order.
  const std::vector<std::size_t>& GetVariables() const { return variables_; }

  // Returns the number of mines in the affected cells.
  std::size_t GetMines() const { return mines_; }

 private:
  std::vector<std::size_t> variables_;
  std::size_t mines_;
};

// Represents a set of covered cells whose constraints are disjoint in effect
// from every other component. Components may be analyzed separately.
class Component {
 public:
  Component() = default;
  Component(std::vector<CellLocation> locations,
            std::vector<Constraint> constraints)
      : locations_(std::move(locations)),
        constraints_(std::move(constraints)) {}

  // Returns the cells in this component in row-major order.
  const std::vector<CellLocation>& GetLocations() const { return locations_; }

  // Returns the constraints in this component.
  const std::vector<Constraint>& GetConstraints() const { return constraints_; }

  void AddLocation(const CellLocation& location) {
    locations_.push_back(location);
  }

  void AddConstraint(Constraint constraint) {
    constraints_.push_back(std::move(constraint));
  }

 private:
  std::vector<CellLocation> locations_;
  std::vector<Constraint> constraints_;
};

// Partitions the covered cells bordering revealed numbers into components.
//
// Two covered cells share a component if they are both neighbors of one
// revealed number. A revealed number contributes a constraint to the component
// holding all of its covered neighbors. A number whose flagged neighbors
// outnumber its adjacent mines contributes nothing.
//
// Components are ordered by their first cell in row-major order. An empty
// result means no constraints exist.
std::vector<Component> PartitionFrontier(const Knowledge& knowledge);

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_FRONTIER_H_
