#pragma once

// biokin
#include "solver.hpp"

namespace biokin {

/**
 * @brief Forward Euler integrator
 */
class ExplicitSolver : public Solver {
 public:
  using Solver::Solver;

  torch::Tensor step(RateFn const& f, torch::Tensor x, torch::Tensor h,
                     torch::optional<torch::Tensor> correction) const override;
};

}  // namespace biokin
