#include "sweeper/solver/frontier.h"

#include <glib.h>

#include <limits>
#include <utility>

namespace sweeper {
namespace solver {

namespace {

constexpr std::size_t kNoComponent = std::numeric_limits<std::size_t>::max();

// A revealed number and its covered neighbors.
struct Rule {
  NumberedCell cell;
  Neighborhood neighborhood;
};

class FrontierPartitioner {
 public:
  explicit FrontierPartitioner(const Knowledge& knowledge)
      : knowledge_(knowledge), grid_(knowledge.rows, knowledge.cols) {}

  std::vector<Component> Partition() {
    // Collect every number that still borders covered cells.
    std::vector<Rule> rules;
    for (const NumberedCell& cell : knowledge_.numbers) {
      Neighborhood neighborhood = GetNeighborhood(knowledge_, cell.location);
      if (neighborhood.covered.empty()) {
        continue;
      }
      for (const CellLocation& location : neighborhood.covered) {
        Cell& frontier_cell = grid_(location.row, location.col);
        if (!frontier_cell.in_frontier) {
          frontier_cell.in_frontier = true;
          frontier_cell.ds_parent = location;
          frontier_cell.ds_rank = 0;
        }
      }
      rules.push_back(Rule{cell, std::move(neighborhood)});
    }

    // Union all of the covered neighbors of each number.
    // This builds the disjoint set tree in place within the grid.
    for (const Rule& rule : rules) {
      const std::vector<CellLocation>& covered = rule.neighborhood.covered;
      for (auto it = covered.begin() + 1; it != covered.end(); ++it) {
        Union(covered.front(), *it);
      }
    }

    // Number the components in row-major order of their first cell.
    std::vector<Component> components;
    grid_.ForEach([this, &components](std::size_t row, std::size_t col,
                                      Cell& cell) {
      if (!cell.in_frontier) {
        return;
      }
      Cell& root = At(Find({row, col}));
      if (root.component == kNoComponent) {
        root.component = components.size();
        components.push_back(Component());
      }
      Component& component = components[root.component];
      cell.variable = component.GetLocations().size();
      component.AddLocation({row, col});
    });

    // Attach each number to the component holding its covered neighbors.
    for (const Rule& rule : rules) {
      const std::vector<CellLocation>& covered = rule.neighborhood.covered;
      const CellLocation root = Find(covered.front());
      bool straddles = false;
      for (const CellLocation& location : covered) {
        straddles = straddles || Find(location) != root;
      }
      if (straddles) {
        g_debug("dropping constraint at (%zu, %zu): spans components",
                rule.cell.location.row, rule.cell.location.col);
        continue;
      }

      std::size_t mines;
      if (!GetRemainingMines(rule.cell, rule.neighborhood, &mines)) {
        g_debug("dropping constraint at (%zu, %zu): too many flags",
                rule.cell.location.row, rule.cell.location.col);
        continue;
      }

      std::vector<std::size_t> variables;
      variables.reserve(covered.size());
      for (const CellLocation& location : covered) {
        variables.push_back(At(location).variable);
      }
      components[At(root).component].AddConstraint(
          Constraint(std::move(variables), mines));
    }

    return components;
  }

 private:
  struct Cell {
    bool in_frontier = false;

    CellLocation ds_parent{0, 0};
    std::size_t ds_rank = 0;

    // Only valid for a root.
    std::size_t component = kNoComponent;

    // The index of this cell within its component.
    std::size_t variable = 0;
  };

  Cell& At(const CellLocation& location) {
    return grid_(location.row, location.col);
  }

  CellLocation Find(const CellLocation& location) {
    Cell& cell = At(location);
    if (cell.ds_parent != location) {
      cell.ds_parent = Find(cell.ds_parent);
    }
    return cell.ds_parent;
  }

  void Union(const CellLocation& x, const CellLocation& y) {
    CellLocation x_root = Find(x);
    CellLocation y_root = Find(y);

    // Already part of the same set.
    if (x_root == y_root) {
      return;
    }

    Cell& x_root_cell = At(x_root);
    Cell& y_root_cell = At(y_root);

    // Attach the shorter tree to the longer one.
    if (x_root_cell.ds_rank < y_root_cell.ds_rank) {
      x_root_cell.ds_parent = y_root;
    } else if (x_root_cell.ds_rank > y_root_cell.ds_rank) {
      y_root_cell.ds_parent = x_root;
    } else {
      x_root_cell.ds_parent = y_root;
      ++y_root_cell.ds_rank;
    }
  }

  const Knowledge& knowledge_;
  Grid<Cell> grid_;
};

}  // namespace

std::vector<Component> PartitionFrontier(const Knowledge& knowledge) {
  return FrontierPartitioner(knowledge).Partition();
}

}  // namespace solver
}  // namespace sweeper
