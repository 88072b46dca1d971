#include "sweeper/solver/enumerator.h"

namespace sweeper {
namespace solver {

namespace {

class Enumerator {
 public:
  explicit Enumerator(const Component& component)
      : constraints_(component.GetConstraints()),
        variable_constraints_(component.GetLocations().size()),
        assignment_(component.GetLocations().size(), Value::UNASSIGNED),
        assigned_mines_(constraints_.size(), 0),
        unassigned_(constraints_.size(), 0) {
    for (std::size_t i = 0; i < constraints_.size(); ++i) {
      const std::vector<std::size_t>& variables =
          constraints_[i].GetVariables();
      unassigned_[i] = variables.size();
      for (std::size_t variable : variables) {
        variable_constraints_[variable].push_back(i);
      }
    }
    result_.tallies.resize(assignment_.size());
  }

  Enumeration Run() {
    if (assignment_.empty()) {
      return result_;
    }

    std::vector<Frame> stack;
    stack.reserve(assignment_.size());
    stack.push_back(Frame{0, Value::MINE});

    while (!stack.empty()) {
      Frame& frame = stack.back();
      const std::size_t variable = frame.variable;

      if (assignment_[variable] != Value::UNASSIGNED) {
        Unassign(variable);
      }
      if (frame.next == Value::UNASSIGNED) {
        // Both values have been tried.
        stack.pop_back();
        continue;
      }

      const Value value = frame.next;
      frame.next = value == Value::MINE ? Value::SAFE : Value::UNASSIGNED;
      Assign(variable, value);
      ++result_.nodes;

      if (!IsFeasible(variable)) {
        ++result_.pruned;
        continue;
      }

      if (variable + 1 < assignment_.size()) {
        stack.push_back(Frame{variable + 1, Value::MINE});
      } else if (IsSatisfied()) {
        RecordModel();
      }
    }

    return result_;
  }

 private:
  enum class Value {
    UNASSIGNED,
    MINE,
    SAFE,
  };

  // One level of the search. Holds the value to try next for the variable, or
  // UNASSIGNED once both values have been tried.
  struct Frame {
    std::size_t variable;
    Value next;
  };

  void Assign(std::size_t variable, Value value) {
    assignment_[variable] = value;
    for (std::size_t i : variable_constraints_[variable]) {
      --unassigned_[i];
      if (value == Value::MINE) {
        ++assigned_mines_[i];
      }
    }
  }

  void Unassign(std::size_t variable) {
    for (std::size_t i : variable_constraints_[variable]) {
      ++unassigned_[i];
      if (assignment_[variable] == Value::MINE) {
        --assigned_mines_[i];
      }
    }
    assignment_[variable] = Value::UNASSIGNED;
  }

  // Returns true if every constraint on the variable can still be met.
  //
  // Constraints not involving the variable are unchanged since they were last
  // checked.
  bool IsFeasible(std::size_t variable) const {
    for (std::size_t i : variable_constraints_[variable]) {
      const std::size_t mines = constraints_[i].GetMines();
      if (assigned_mines_[i] > mines ||
          assigned_mines_[i] + unassigned_[i] < mines) {
        return false;
      }
    }
    return true;
  }

  // Returns true if every constraint is met exactly.
  bool IsSatisfied() const {
    for (std::size_t i = 0; i < constraints_.size(); ++i) {
      if (unassigned_[i] != 0 ||
          assigned_mines_[i] != constraints_[i].GetMines()) {
        return false;
      }
    }
    return true;
  }

  void RecordModel() {
    ++result_.models;
    for (std::size_t variable = 0; variable < assignment_.size(); ++variable) {
      VariableTally& tally = result_.tallies[variable];
      ++tally.total_models;
      if (assignment_[variable] == Value::MINE) {
        ++tally.mine_models;
      }
    }
  }

  const std::vector<Constraint>& constraints_;

  // The constraints in which each variable appears.
  std::vector<std::vector<std::size_t>> variable_constraints_;

  std::vector<Value> assignment_;

  // Per constraint, the mines assigned and the variables still unassigned.
  std::vector<std::size_t> assigned_mines_;
  std::vector<std::size_t> unassigned_;

  Enumeration result_;
};

}  // namespace

Enumeration Enumerate(const Component& component) {
  return Enumerator(component).Run();
}

}  // namespace solver
}  // namespace sweeper
