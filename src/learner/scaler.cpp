// biokin
#include <biokin/errors.hpp>

#include "scaler.hpp"

namespace biokin {

ScalerImpl::ScalerImpl(int64_t nchannel_) : nchannel(nchannel_) { reset(); }

void ScalerImpl::reset() {
  mean = register_buffer("mean", torch::zeros({nchannel}, torch::kFloat64));
  scale = register_buffer("scale", torch::ones({nchannel}, torch::kFloat64));
}

void ScalerImpl::pretty_print(std::ostream& os) const {
  os << "Scaler(nchannel=" << nchannel << ")";
}

void ScalerImpl::fit(torch::Tensor states) {
  BIOKIN_CHECK(states.size(-1) == nchannel, DataShapeError,
               "scaler expects ", nchannel, " channels, got ",
               states.size(-1));

  torch::NoGradGuard no_grad;
  auto flat = states.reshape({-1, nchannel}).to(mean.dtype());
  auto m = flat.mean(0);
  auto s = (flat - m).square().mean(0).sqrt();

  // constant channels are left unscaled
  s = torch::where(s > 1e-8, s, torch::ones_like(s));

  mean.copy_(m);
  scale.copy_(s);
}

}  // namespace biokin
