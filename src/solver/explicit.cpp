// biokin
#include "explicit.hpp"

namespace biokin {

torch::Tensor ExplicitSolver::step(
    RateFn const& f, torch::Tensor x, torch::Tensor h,
    torch::optional<torch::Tensor> correction) const {
  auto dxdt = f(x);
  if (correction.has_value()) {
    dxdt = dxdt + correction.value();
  }
  return x + h * dxdt;
}

}  // namespace biokin
