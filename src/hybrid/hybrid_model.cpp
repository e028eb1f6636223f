// yaml
#include <yaml-cpp/yaml.h>

// biokin
#include <biokin/errors.hpp>
#include <biokin/state.hpp>

#include "hybrid_model.hpp"

namespace biokin {

HybridMode parse_hybrid_mode(std::string const& name) {
  if (name == "mechanistic_only") {
    return HybridMode::mechanistic_only;
  } else if (name == "residual_hybrid") {
    return HybridMode::residual_hybrid;
  }
  throw ConfigurationError("unknown hybrid mode '" + name +
                           "'. Expected 'mechanistic_only' or "
                           "'residual_hybrid'");
}

std::string to_string(HybridMode mode) {
  return mode == HybridMode::mechanistic_only ? "mechanistic_only"
                                              : "residual_hybrid";
}

HybridModelOptions HybridModelOptions::from_yaml(const YAML::Node& node) {
  HybridModelOptions options;

  if (node["nchannel"]) options.nchannel(node["nchannel"].as<int64_t>());

  if (node["mode"]) {
    options.mode(parse_hybrid_mode(node["mode"].as<std::string>()));
  }

  // learning switch, equivalent to mode: mechanistic_only
  if (node["use_learning"] && !node["use_learning"].as<bool>()) {
    options.mode(HybridMode::mechanistic_only);
  }

  if (node["kinetics"]) {
    options.kinetics(MonodOptions::from_yaml(node["kinetics"]));
  }

  if (node["learner"]) {
    options.learner(ResidualLearnerOptions::from_yaml(node["learner"]));
  }

  if (node["integrator"]) {
    options.integrator(IntegratorOptions::from_yaml(node["integrator"]));
  }

  return options;
}

HybridModelImpl::HybridModelImpl(HybridModelOptions const& options_)
    : options(options_) {
  int64_t nchannel = options.nchannel();

  BIOKIN_CHECK(nchannel >= kNumKineticChannels, DataShapeError,
               "nchannel = ", nchannel, " must be >= ", kNumKineticChannels);

  BIOKIN_CHECK(options.learner().input_dim() == nchannel, DataShapeError,
               "learner input_dim = ", options.learner().input_dim(),
               ". Expected nchannel = ", nchannel);

  BIOKIN_CHECK(options.learner().correction_dim() == nchannel, DataShapeError,
               "learner output_dim = ", options.learner().correction_dim(),
               ". Expected nchannel = ", nchannel);

  reset();
}

void HybridModelImpl::reset() {
  kinetics = register_module("kinetics", Monod(options.kinetics()));
  learner = register_module("learner", ResidualLearner(options.learner()));
  scaler = register_module("scaler", Scaler(options.nchannel()));
  time_scale =
      register_buffer("time_scale", torch::tensor(1., torch::kFloat64));
  solver = make_solver(options.integrator());
}

void HybridModelImpl::pretty_print(std::ostream& os) const {
  os << "HybridModel(mode=" << to_string(options.mode())
     << ", nchannel=" << options.nchannel()
     << ", integrator=" << options.integrator().type() << ")";
}

void HybridModelImpl::fit_normalization(WindowSet const& train) {
  BIOKIN_CHECK(!train.empty(), ConfigurationError,
               "cannot fit normalization without training windows");
  check_window(train.input, train.input_time);

  scaler->fit(torch::cat({train.input, train.target}, 1));

  torch::NoGradGuard no_grad;
  auto dt = train.target_time.select(1, 0) - train.input_time.select(1, -1);
  time_scale.copy_(dt.mean());
}

torch::Tensor HybridModelImpl::rate_scale() const {
  return scaler->scale / time_scale;
}

torch::Tensor HybridModelImpl::mechanistic_rate(torch::Tensor state) {
  return kinetics->forward(state);
}

torch::optional<torch::Tensor> HybridModelImpl::correction(
    torch::Tensor window) {
  if (options.mode() == HybridMode::mechanistic_only) {
    return torch::nullopt;
  }
  return learner->forward(scaler->forward(window)) * rate_scale();
}

torch::Tensor HybridModelImpl::advance(
    torch::Tensor state, torch::Tensor dt,
    torch::optional<torch::Tensor> correction) {
  auto rate = [this](torch::Tensor x) { return kinetics->forward(x); };
  return solver->advance(rate, state, dt, correction);
}

torch::Tensor HybridModelImpl::forward(torch::Tensor window,
                                       torch::Tensor window_time,
                                       torch::Tensor target,
                                       torch::Tensor target_time) {
  check_window(window, window_time);
  BIOKIN_CHECK(target.dim() == 3 && target.size(-1) == options.nchannel(),
               DataShapeError, "target must be (batch, h, ", options.nchannel(),
               "), got ", target.sizes());

  status_ = RunStatus::integrating;

  int64_t len = window.size(1);
  int64_t horizon = target.size(1);

  // true trajectory: window followed by targets
  auto seq = torch::cat({window, target}, 1);
  auto tseq = torch::cat({window_time, target_time}, 1);

  std::vector<torch::Tensor> pred;
  for (int64_t k = 0; k < horizon; ++k) {
    auto x = seq.select(1, len - 1 + k);
    auto dt = tseq.select(1, len + k) - tseq.select(1, len - 1 + k);
    pred.push_back(advance(x, dt, correction(seq.narrow(1, k, len))));
  }

  status_ = RunStatus::done;
  return torch::stack(pred, 1);
}

torch::Tensor HybridModelImpl::rollout(torch::Tensor window,
                                       torch::Tensor window_time,
                                       torch::Tensor future_time) {
  check_window(window, window_time);
  BIOKIN_CHECK(future_time.dim() == 2 && future_time.size(0) == window.size(0),
               DataShapeError, "future_time must be (batch, T), got ",
               future_time.sizes());

  status_ = RunStatus::integrating;

  int64_t len = window.size(1);
  auto x = window.select(1, -1);
  auto t_prev = window_time.select(1, -1);

  std::vector<torch::Tensor> pred;
  for (int64_t k = 0; k < future_time.size(1); ++k) {
    auto t = future_time.select(1, k);
    x = advance(x, t - t_prev, correction(window));
    pred.push_back(x);

    // slide the window over the prediction
    window = torch::cat({window.narrow(1, 1, len - 1), x.unsqueeze(1)}, 1);
    t_prev = t;
  }

  status_ = RunStatus::done;
  return torch::stack(pred, 1);
}

torch::Tensor HybridModelImpl::simulate(torch::Tensor x0, torch::Tensor time) {
  BIOKIN_CHECK(x0.size(-1) == options.nchannel(), DataShapeError,
               "x0 has ", x0.size(-1),
               " channels. Expected = ", options.nchannel());

  status_ = RunStatus::integrating;
  auto rate = [this](torch::Tensor x) { return kinetics->forward(x); };
  auto traj = integrate(*solver, rate, x0, time);
  status_ = RunStatus::done;

  return traj;
}

void HybridModelImpl::check_window(torch::Tensor window,
                                   torch::Tensor window_time) const {
  BIOKIN_CHECK(window.dim() == 3 && window.size(-1) == options.nchannel(),
               DataShapeError, "window must be (batch, L, ",
               options.nchannel(), "), got ", window.sizes());
  BIOKIN_CHECK(window_time.dim() == 2 &&
                   window_time.size(0) == window.size(0) &&
                   window_time.size(1) == window.size(1),
               DataShapeError, "window_time must be (batch, L), got ",
               window_time.sizes());
}

}  // namespace biokin
