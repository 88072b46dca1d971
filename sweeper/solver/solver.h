#ifndef SWEEPER_SOLVER_SOLVER_H_
#define SWEEPER_SOLVER_SOLVER_H_

#include <cstddef>
#include <memory>

#include "sweeper/game/board.h"

namespace sweeper {
namespace solver {

// Solving algorithms.
enum class Algorithm {
  // Single cell deduction, guessing uniformly at random when it is stuck.
  LOCAL,

  // Single cell deduction, falling back to exact enumeration of the
  // constraints around the revealed region when it is stuck.
  CSP,
};

// Tuning parameters shared by the solvers.
struct Options {
  // Regions with more unknown cells than this are not enumerated.
  std::size_t max_component_size = 14;
};

// Marks a guess whose risk was not estimated.
constexpr double kUnknownProbability = -1.0;

// The outcome of analyzing a board.
struct Decision {
  enum class Type {
    // No action is possible because no covered cells remain.
    NONE,

    // The action is logically certain to be correct.
    CERTAIN,

    // The action is a guess.
    GUESS,
  };

  // Identifies which analysis produced the action.
  enum class Source {
    NONE,

    // Rules applied to one revealed cell and its neighbors.
    SINGLE_POINT,

    // Enumeration of all consistent mine assignments in a region.
    CSP,

    // Uniform choice among all covered cells.
    RANDOM,
  };

  Type type;
  Source source;
  Action action;

  // The estimated probability that the action reveals a mine. Zero for a
  // certain decision, kUnknownProbability for a random guess.
  double mine_probability;

  bool HasAction() const { return type != Type::NONE; }
};

// Convenience function to create a decision without an action.
inline Decision NoDecision() {
  return Decision{Decision::Type::NONE, Decision::Source::NONE,
                  Action{Action::Type::REVEAL, 0, 0}, 0.0};
}

// Convenience function to create a certain decision.
inline Decision CertainDecision(Decision::Source source, Action action) {
  return Decision{Decision::Type::CERTAIN, source, action, 0.0};
}

// Convenience function to create a guess that reveals a cell.
inline Decision GuessDecision(Decision::Source source, std::size_t row,
                              std::size_t col, double mine_probability) {
  return Decision{Decision::Type::GUESS, source,
                  Action{Action::Type::REVEAL, row, col}, mine_probability};
}

class Solver {
 public:
  virtual ~Solver() = default;

  // Chooses the next action for the board in its current state.
  //
  // The board is never modified. Returns a decision of type NONE when the game
  // is over or no covered cells remain.
  virtual Decision Decide(const Board& board) = 0;
};

// Creates a new solver for the specified algorithm.
//
// The seed drives the random guesses made when no logical action exists, so
// identical seeds produce identical decisions for identical boards.
std::unique_ptr<Solver> New(Algorithm alg, const Options& options,
                            unsigned seed);

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_SOLVER_H_
