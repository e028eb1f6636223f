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

//! Options to initialize the Monod growth/production kinetics
struct MonodOptions {
  static MonodOptions from_yaml(const YAML::Node& node);

  //! \brief Check that all parameters are positive
  /*!
   * Raises ConfigurationError naming the offending parameter.
   */
  void validate() const;

  //! Maximum specific growth rate [1/h]
  ADD_ARG(double, mu_max) = 0.5;

  //! Substrate saturation constant [g/L]
  ADD_ARG(double, Ks) = 0.1;

  //! Biomass yield on substrate [g/g]
  ADD_ARG(double, Yxs) = 0.5;

  //! Product yield on substrate [g/g]
  ADD_ARG(double, Yps) = 0.3;

  //! Maximum specific production rate [g/g/h]
  ADD_ARG(double, qp_max) = 0.1;

  //! Optimize the parameters (in log space) together with the learner
  ADD_ARG(bool, trainable) = false;
};

//! \brief Saturating specific rate vmax * S / (Ks + S), exactly 0 for S <= 0
torch::Tensor saturation_rate(torch::Tensor S, torch::Tensor vmax,
                              torch::Tensor Ks);

class MonodImpl : public torch::nn::Cloneable<MonodImpl> {
 public:
  //! log of maximum specific growth rate, shape ()
  torch::Tensor log_mu_max;

  //! log of saturation constant, shape ()
  torch::Tensor log_Ks;

  //! log of biomass yield, shape ()
  torch::Tensor log_Yxs;

  //! log of product yield, shape ()
  torch::Tensor log_Yps;

  //! log of maximum specific production rate, shape ()
  torch::Tensor log_qp_max;

  //! options with which this `MonodImpl` was constructed
  MonodOptions options;

  //! Constructor to initialize the layer
  MonodImpl() = default;
  explicit MonodImpl(MonodOptions const& options_);
  void reset() override;
  void pretty_print(std::ostream& os) const override;

  //! current parameter values in linear space
  MonodOptions current() const;

  //! Specific growth rate mu(S) [1/h], shape of `S`
  torch::Tensor growth_rate(torch::Tensor S) const;

  //! Specific production rate qp(S) [g/g/h], shape of `S`
  torch::Tensor production_rate(torch::Tensor S) const;

  //! Compute rates of change of the state
  /*!
   * \param state (X, S, P, aux...), shape (..., nchannel), nchannel >= 3
   * \return (dX/dt, dS/dt, dP/dt, 0...), shape (..., nchannel)
   */
  torch::Tensor forward(torch::Tensor state);
};
TORCH_MODULE(Monod);

}  // namespace biokin

#undef ADD_ARG
