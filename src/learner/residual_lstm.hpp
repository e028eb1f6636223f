#pragma once

// torch
#include <torch/nn/cloneable.h>
#include <torch/nn/init.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/common.h>
#include <torch/nn/modules/linear.h>
#include <torch/nn/modules/rnn.h>

// arg
#include <biokin/add_arg.h>

namespace YAML {
class Node;
}

namespace biokin {

struct ResidualLearnerOptions {
  static ResidualLearnerOptions from_yaml(const YAML::Node& node);

  //! correction dimension, `input_dim` when unset
  int64_t correction_dim() const {
    return output_dim() > 0 ? output_dim() : input_dim();
  }

  //! channels per time step of the input window
  ADD_ARG(int64_t, input_dim) = 3;

  //! LSTM hidden width
  ADD_ARG(int64_t, hidden_dim) = 64;

  //! number of stacked LSTM layers
  ADD_ARG(int64_t, num_layers) = 2;

  //! dropout between LSTM layers, only used with num_layers > 1
  ADD_ARG(double, dropout) = 0.1;

  //! correction dimension; 0 means one correction per input channel
  ADD_ARG(int64_t, output_dim) = 0;
};

//! LSTM encoder over a state window with a linear correction head
class ResidualLearnerImpl : public torch::nn::Cloneable<ResidualLearnerImpl> {
 public:
  //! sequence encoder
  torch::nn::LSTM lstm = nullptr;

  //! projection of the last hidden state to the correction
  torch::nn::Linear head = nullptr;

  //! options with which this `ResidualLearnerImpl` was constructed
  ResidualLearnerOptions options;

  ResidualLearnerImpl() = default;
  explicit ResidualLearnerImpl(ResidualLearnerOptions const& options_);
  void reset() override;

  //! Compute corrections for a batch of windows
  /*!
   * The head starts at zero so an untrained learner returns zero corrections.
   *
   * \param window normalized states, shape (batch, L, input_dim)
   * \return correction, shape (batch, correction_dim), in input order
   */
  torch::Tensor forward(torch::Tensor window);
};
TORCH_MODULE(ResidualLearner);

}  // namespace biokin

#undef ADD_ARG
