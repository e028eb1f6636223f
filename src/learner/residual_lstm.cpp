// yaml
#include <yaml-cpp/yaml.h>

// biokin
#include <biokin/errors.hpp>

#include "residual_lstm.hpp"

namespace biokin {

ResidualLearnerOptions ResidualLearnerOptions::from_yaml(
    const YAML::Node& node) {
  ResidualLearnerOptions options;

  if (node["input_dim"]) options.input_dim(node["input_dim"].as<int64_t>());
  if (node["hidden_dim"]) options.hidden_dim(node["hidden_dim"].as<int64_t>());
  if (node["num_layers"]) options.num_layers(node["num_layers"].as<int64_t>());
  if (node["dropout"]) options.dropout(node["dropout"].as<double>());
  if (node["output_dim"]) options.output_dim(node["output_dim"].as<int64_t>());

  return options;
}

ResidualLearnerImpl::ResidualLearnerImpl(
    ResidualLearnerOptions const& options_)
    : options(options_) {
  BIOKIN_CHECK(options.input_dim() > 0, ConfigurationError,
               "input_dim = ", options.input_dim(), " must be > 0");
  BIOKIN_CHECK(options.hidden_dim() > 0, ConfigurationError,
               "hidden_dim = ", options.hidden_dim(), " must be > 0");
  BIOKIN_CHECK(options.num_layers() > 0, ConfigurationError,
               "num_layers = ", options.num_layers(), " must be > 0");
  BIOKIN_CHECK(options.dropout() >= 0. && options.dropout() < 1.,
               ConfigurationError, "dropout = ", options.dropout(),
               " must be in [0, 1)");
  reset();
}

void ResidualLearnerImpl::reset() {
  double dropout = options.num_layers() > 1 ? options.dropout() : 0.;

  lstm = register_module(
      "lstm", torch::nn::LSTM(torch::nn::LSTMOptions(options.input_dim(),
                                                     options.hidden_dim())
                                  .num_layers(options.num_layers())
                                  .dropout(dropout)
                                  .batch_first(true)));

  head = register_module(
      "head",
      torch::nn::Linear(options.hidden_dim(), options.correction_dim()));

  // same precision as the kinetics and scaler
  lstm->to(torch::kFloat64);
  head->to(torch::kFloat64);

  torch::NoGradGuard no_grad;
  torch::nn::init::zeros_(head->weight);
  torch::nn::init::zeros_(head->bias);
}

torch::Tensor ResidualLearnerImpl::forward(torch::Tensor window) {
  BIOKIN_CHECK(window.dim() == 3, DataShapeError,
               "window must be (batch, L, channels), got ", window.sizes());
  BIOKIN_CHECK(window.size(-1) == options.input_dim(), DataShapeError,
               "window has ", window.size(-1),
               " channels. Expected input_dim = ", options.input_dim());

  auto out = std::get<0>(lstm->forward(window));
  return head->forward(out.select(1, -1));
}

}  // namespace biokin
