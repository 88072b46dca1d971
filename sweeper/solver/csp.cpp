#include "sweeper/solver/csp.h"

#include <glib.h>

#include <cstddef>
#include <memory>
#include <random>
#include <vector>

#include "sweeper/solver/enumerator.h"
#include "sweeper/solver/frontier.h"
#include "sweeper/solver/local.h"

namespace sweeper {
namespace solver {
namespace csp {

namespace {

class CspSolver : public Solver {
 public:
  CspSolver(const Options& options, unsigned seed)
      : options_(options), rng_(seed) {}

  ~CspSolver() final = default;

  Decision Decide(const Board& board) final {
    if (board.IsGameOver()) {
      return NoDecision();
    }
    const Knowledge knowledge = ExtractKnowledge(board);

    Decision decision = local::Deduce(knowledge);
    if (decision.HasAction() || knowledge.covered.empty()) {
      return decision;
    }

    decision = Infer(knowledge, options_);
    if (decision.HasAction()) {
      return decision;
    }

    return local::GuessUniformly(knowledge.covered, rng_);
  }

 private:
  const Options options_;
  std::default_random_engine rng_;
};

}  // namespace

Decision Infer(const Knowledge& knowledge, const Options& options) {
  Decision best = NoDecision();

  for (const Component& component : PartitionFrontier(knowledge)) {
    const std::vector<CellLocation>& locations = component.GetLocations();
    const CellLocation& first = locations.front();

    if (locations.size() > options.max_component_size) {
      g_debug("skipping component at (%zu, %zu): %zu cells exceeds limit %zu",
              first.row, first.col, locations.size(),
              options.max_component_size);
      continue;
    }
    if (component.GetConstraints().empty()) {
      continue;
    }

    const Enumeration enumeration = Enumerate(component);
    if (enumeration.models == 0) {
      g_debug("component at (%zu, %zu) has no consistent assignment",
              first.row, first.col);
      continue;
    }

    const CellLocation* certain_mine = nullptr;
    const CellLocation* certain_safe = nullptr;
    for (std::size_t i = 0; i < locations.size(); ++i) {
      const VariableTally& tally = enumeration.tallies[i];
      if (tally.mine_models == tally.total_models) {
        certain_mine = certain_mine ? certain_mine : &locations[i];
      } else if (tally.mine_models == 0) {
        certain_safe = certain_safe ? certain_safe : &locations[i];
      }

      const double probability = tally.GetMineProbability();
      if (!best.HasAction() || probability < best.mine_probability) {
        best = GuessDecision(Decision::Source::CSP, locations[i].row,
                             locations[i].col, probability);
      }
    }

    if (certain_mine) {
      return CertainDecision(
          Decision::Source::CSP,
          Action{Action::Type::FLAG, certain_mine->row, certain_mine->col});
    }
    if (certain_safe) {
      return CertainDecision(
          Decision::Source::CSP,
          Action{Action::Type::REVEAL, certain_safe->row, certain_safe->col});
    }
  }

  if (best.HasAction()) {
    g_debug("guessing (%zu, %zu) with mine probability %.3f", best.action.row,
            best.action.col, best.mine_probability);
  }
  return best;
}

std::unique_ptr<Solver> New(const Options& options, unsigned seed) {
  return std::make_unique<CspSolver>(options, seed);
}

}  // namespace csp
}  // namespace solver
}  // namespace sweeper
