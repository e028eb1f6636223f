#pragma once

// torch
#include <torch/nn/cloneable.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/common.h>

namespace biokin {

//! Per-channel standard scaling fitted on training states
class ScalerImpl : public torch::nn::Cloneable<ScalerImpl> {
 public:
  //! channel means, shape (nchannel,)
  torch::Tensor mean;

  //! channel standard deviations (1 for constant channels), shape (nchannel,)
  torch::Tensor scale;

  //! number of channels
  int64_t nchannel = 0;

  ScalerImpl() = default;
  explicit ScalerImpl(int64_t nchannel_);
  void reset() override;
  void pretty_print(std::ostream& os) const override;

  //! \brief Fit mean and scale to `states`, shape (..., nchannel)
  void fit(torch::Tensor states);

  torch::Tensor forward(torch::Tensor x) const { return (x - mean) / scale; }
  torch::Tensor inverse(torch::Tensor z) const { return z * scale + mean; }
};
TORCH_MODULE(Scaler);

}  // namespace biokin
