#include "sweeper/solver/solver.h"

#include "sweeper/solver/csp.h"
#include "sweeper/solver/local.h"

namespace sweeper {
namespace solver {

std::unique_ptr<Solver> New(Algorithm alg, const Options& options,
                            unsigned seed) {
  switch (alg) {
    case Algorithm::LOCAL:
      return local::New(seed);
    case Algorithm::CSP:
      return csp::New(options, seed);
  }
  return nullptr;
}

}  // namespace solver
}  // namespace sweeper
