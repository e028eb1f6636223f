#pragma once

// torch
#include <torch/nn/cloneable.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/common.h>

// arg
#include <biokin/add_arg.h>

namespace YAML {
class Node;
}

namespace biokin {

struct PhysicsLossOptions {
  static PhysicsLossOptions from_yaml(const YAML::Node& node);

  //! weight of the data-fit term
  ADD_ARG(double, lambda_data) = 1.0;

  //! weight of the ODE-residual term
  ADD_ARG(double, lambda_physics) = 1.0;
};

//! scalar loss and its components, each of shape ()
struct LossTerms {
  torch::Tensor total;
  torch::Tensor data;
  torch::Tensor physics;
};

class PhysicsLossImpl : public torch::nn::Cloneable<PhysicsLossImpl> {
 public:
  //! per-channel divisor of state errors, shape (nchannel,) or (1,)
  torch::Tensor data_scale;

  //! per-channel divisor of rate residuals, shape (nchannel,) or (1,)
  torch::Tensor rate_scale;

  //! options with which this `PhysicsLossImpl` was constructed
  PhysicsLossOptions options;

  PhysicsLossImpl() : PhysicsLossImpl(PhysicsLossOptions()) {}
  explicit PhysicsLossImpl(PhysicsLossOptions const& options_);
  void reset() override;

  //! \brief Set the per-channel error scales
  void set_scales(torch::Tensor data_scale_, torch::Tensor rate_scale_);

  //! Evaluate the physics-informed loss
  /*!
   * data    = MSE(pred[:, 1:], observed)
   * physics = MSE(diff(pred) / diff(time), (rate[:, :-1] + rate[:, 1:]) / 2)
   * total   = lambda_data * data + lambda_physics * physics
   *
   * Raises NumericalError if any input or the result is non-finite.
   *
   * \param pred predicted trajectory starting with its anchor state,
   *        shape (batch, T, nchannel)
   * \param time trajectory times, shape (batch, T)
   * \param observed observed states at time[:, 1:], shape (batch, T-1,
   *        nchannel)
   * \param rate mechanistic rate evaluated on `pred`, shape of `pred`
   */
  LossTerms forward(torch::Tensor pred, torch::Tensor time,
                    torch::Tensor observed, torch::Tensor rate);
};
TORCH_MODULE(PhysicsLoss);

}  // namespace biokin

#undef ADD_ARG
