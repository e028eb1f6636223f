// biokin
#include "runge_kutta.hpp"

namespace biokin {

torch::Tensor RungeKuttaSolver::step(
    RateFn const& f, torch::Tensor x, torch::Tensor h,
    torch::optional<torch::Tensor> correction) const {
  auto rate = [&](torch::Tensor y) {
    auto dydt = f(y);
    return correction.has_value() ? dydt + correction.value() : dydt;
  };

  auto k1 = rate(x);
  auto k2 = rate(x + 0.5 * h * k1);
  auto k3 = rate(x + 0.5 * h * k2);
  auto k4 = rate(x + h * k3);

  return x + h / 6. * (k1 + 2. * k2 + 2. * k3 + k4);
}

}  // namespace biokin
