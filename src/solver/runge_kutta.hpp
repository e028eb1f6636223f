#pragma once

// biokin
#include "solver.hpp"

namespace biokin {

/**
 * @brief Classic 4th-order Runge-Kutta integrator
 *
 * The correction, if any, is added to the rate at every stage.
 */
class RungeKuttaSolver : public Solver {
 public:
  using Solver::Solver;

  torch::Tensor step(RateFn const& f, torch::Tensor x, torch::Tensor h,
                     torch::optional<torch::Tensor> correction) const override;
};

}  // namespace biokin
