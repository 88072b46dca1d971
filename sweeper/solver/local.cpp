#include "sweeper/solver/local.h"

#include <cstddef>
#include <memory>

namespace sweeper {
namespace solver {
namespace local {

namespace {

class LocalSolver : public Solver {
 public:
  explicit LocalSolver(unsigned seed) : rng_(seed) {}

  ~LocalSolver() final = default;

  Decision Decide(const Board& board) final {
    if (board.IsGameOver()) {
      return NoDecision();
    }
    const Knowledge knowledge = ExtractKnowledge(board);
    const Decision decision = Deduce(knowledge);
    if (decision.HasAction()) {
      return decision;
    }
    return GuessUniformly(knowledge.covered, rng_);
  }

 private:
  std::default_random_engine rng_;
};

}  // namespace

Decision Deduce(const Knowledge& knowledge) {
  // If all the covered cells around a number are mines then those may be
  // flagged.
  for (const NumberedCell& cell : knowledge.numbers) {
    const Neighborhood neighborhood = GetNeighborhood(knowledge, cell.location);
    std::size_t mines;
    if (!neighborhood.covered.empty() &&
        GetRemainingMines(cell, neighborhood, &mines) &&
        mines == neighborhood.covered.size()) {
      const CellLocation& target = neighborhood.covered.front();
      return CertainDecision(
          Decision::Source::SINGLE_POINT,
          Action{Action::Type::FLAG, target.row, target.col});
    }
  }

  // If no mines remain around a number, the covered cells may be revealed.
  for (const NumberedCell& cell : knowledge.numbers) {
    const Neighborhood neighborhood = GetNeighborhood(knowledge, cell.location);
    std::size_t mines;
    if (!neighborhood.covered.empty() &&
        GetRemainingMines(cell, neighborhood, &mines) && mines == 0) {
      const CellLocation& target = neighborhood.covered.front();
      return CertainDecision(
          Decision::Source::SINGLE_POINT,
          Action{Action::Type::REVEAL, target.row, target.col});
    }
  }

  return NoDecision();
}

Decision GuessUniformly(const std::vector<CellLocation>& covered,
                        std::default_random_engine& rng) {
  if (covered.empty()) {
    return NoDecision();
  }
  std::uniform_int_distribution<std::size_t> d(0, covered.size() - 1);
  const CellLocation& target = covered[d(rng)];
  return GuessDecision(Decision::Source::RANDOM, target.row, target.col,
                       kUnknownProbability);
}

std::unique_ptr<Solver> New(unsigned seed) {
  return std::make_unique<LocalSolver>(seed);
}

}  // namespace local
}  // namespace solver
}  // namespace sweeper
