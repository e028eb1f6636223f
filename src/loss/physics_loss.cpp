// yaml
#include <yaml-cpp/yaml.h>

// biokin
#include <biokin/errors.hpp>

#include "physics_loss.hpp"

namespace biokin {

namespace {

void check_finite(torch::Tensor t, char const* name) {
  BIOKIN_CHECK(torch::isfinite(t).all().item<bool>(), NumericalError, name,
               " contains non-finite values");
}

}  // namespace

PhysicsLossOptions PhysicsLossOptions::from_yaml(const YAML::Node& node) {
  PhysicsLossOptions options;
  if (node["lambda_data"]) options.lambda_data(node["lambda_data"].as<double>());
  if (node["lambda_physics"])
    options.lambda_physics(node["lambda_physics"].as<double>());
  return options;
}

PhysicsLossImpl::PhysicsLossImpl(PhysicsLossOptions const& options_)
    : options(options_) {
  BIOKIN_CHECK(options.lambda_data() >= 0., ConfigurationError,
               "lambda_data = ", options.lambda_data(), " must be >= 0");
  BIOKIN_CHECK(options.lambda_physics() >= 0., ConfigurationError,
               "lambda_physics = ", options.lambda_physics(), " must be >= 0");
  reset();
}

void PhysicsLossImpl::reset() {
  data_scale = register_buffer("data_scale", torch::ones({1}, torch::kFloat64));
  rate_scale = register_buffer("rate_scale", torch::ones({1}, torch::kFloat64));
}

void PhysicsLossImpl::set_scales(torch::Tensor data_scale_,
                                 torch::Tensor rate_scale_) {
  torch::NoGradGuard no_grad;
  data_scale.set_(data_scale_.detach().clone().to(data_scale.options()));
  rate_scale.set_(rate_scale_.detach().clone().to(rate_scale.options()));
}

LossTerms PhysicsLossImpl::forward(torch::Tensor pred, torch::Tensor time,
                                   torch::Tensor observed, torch::Tensor rate) {
  TORCH_CHECK(pred.dim() == 3 && pred.size(1) >= 2,
              "pred must be (batch, T >= 2, nchannel), got ", pred.sizes());
  TORCH_CHECK(observed.size(1) == pred.size(1) - 1,
              "observed must cover pred[:, 1:], got ", observed.sizes());
  TORCH_CHECK(rate.sizes() == pred.sizes(), "rate shape ", rate.sizes(),
              " differs from pred shape ", pred.sizes());

  check_finite(pred, "predicted states");
  check_finite(time, "time");
  check_finite(observed, "observed states");
  check_finite(rate, "mechanistic rate");

  int64_t nt = pred.size(1);

  auto data_err = (pred.narrow(1, 1, nt - 1) - observed) / data_scale;
  auto data = data_err.square().mean();

  // trapezoidal ODE residual between consecutive points
  auto dxdt = pred.diff(1, 1) / time.diff(1, 1).unsqueeze(-1);
  auto avg = 0.5 * (rate.narrow(1, 0, nt - 1) + rate.narrow(1, 1, nt - 1));
  auto physics = ((dxdt - avg) / rate_scale).square().mean();

  auto total = options.lambda_data() * data + options.lambda_physics() * physics;
  check_finite(total, "total loss");

  return {total, data, physics};
}

}  // namespace biokin
