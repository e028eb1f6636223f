// C/C++
#include <cmath>

// yaml
#include <yaml-cpp/yaml.h>

// biokin
#include <biokin/errors.hpp>
#include <biokin/state.hpp>

#include "monod.hpp"

namespace biokin {

MonodOptions MonodOptions::from_yaml(const YAML::Node& node) {
  MonodOptions options;

  if (node["mu_max"]) options.mu_max(node["mu_max"].as<double>());
  if (node["Ks"]) options.Ks(node["Ks"].as<double>());
  if (node["Yxs"]) options.Yxs(node["Yxs"].as<double>());
  if (node["Yps"]) options.Yps(node["Yps"].as<double>());
  if (node["qp_max"]) options.qp_max(node["qp_max"].as<double>());
  if (node["trainable"]) options.trainable(node["trainable"].as<bool>());

  return options;
}

void MonodOptions::validate() const {
  BIOKIN_CHECK(mu_max() > 0., ConfigurationError, "mu_max = ", mu_max(),
               " must be > 0");
  BIOKIN_CHECK(Ks() > 0., ConfigurationError, "Ks = ", Ks(), " must be > 0");
  BIOKIN_CHECK(Yxs() > 0., ConfigurationError, "Yxs = ", Yxs(),
               " must be > 0");
  BIOKIN_CHECK(Yps() > 0., ConfigurationError, "Yps = ", Yps(),
               " must be > 0");
  BIOKIN_CHECK(qp_max() > 0., ConfigurationError, "qp_max = ", qp_max(),
               " must be > 0");
}

torch::Tensor saturation_rate(torch::Tensor S, torch::Tensor vmax,
                              torch::Tensor Ks) {
  // clamping first keeps the rate (and its gradient) exactly zero for S <= 0
  auto Sp = S.clamp_min(0.);
  return vmax * Sp / (Ks + Sp);
}

MonodImpl::MonodImpl(MonodOptions const& options_) : options(options_) {
  options.validate();
  reset();
}

void MonodImpl::reset() {
  auto init = [this](std::string const& name, double value) {
    auto t = torch::tensor(std::log(value), torch::kFloat64);
    if (options.trainable()) {
      return register_parameter(name, t);
    }
    return register_buffer(name, t);
  };

  log_mu_max = init("log_mu_max", options.mu_max());
  log_Ks = init("log_Ks", options.Ks());
  log_Yxs = init("log_Yxs", options.Yxs());
  log_Yps = init("log_Yps", options.Yps());
  log_qp_max = init("log_qp_max", options.qp_max());
}

void MonodImpl::pretty_print(std::ostream& os) const {
  auto p = current();
  os << "Monod Kinetics: mu_max = " << p.mu_max() << ", Ks = " << p.Ks()
     << ", Yxs = " << p.Yxs() << ", Yps = " << p.Yps()
     << ", qp_max = " << p.qp_max()
     << (options.trainable() ? " (trainable)" : "");
}

MonodOptions MonodImpl::current() const {
  torch::NoGradGuard no_grad;
  auto p = options;
  p.mu_max(log_mu_max.exp().item<double>());
  p.Ks(log_Ks.exp().item<double>());
  p.Yxs(log_Yxs.exp().item<double>());
  p.Yps(log_Yps.exp().item<double>());
  p.qp_max(log_qp_max.exp().item<double>());
  return p;
}

torch::Tensor MonodImpl::growth_rate(torch::Tensor S) const {
  return saturation_rate(S, log_mu_max.exp(), log_Ks.exp());
}

torch::Tensor MonodImpl::production_rate(torch::Tensor S) const {
  return saturation_rate(S, log_qp_max.exp(), log_Ks.exp());
}

torch::Tensor MonodImpl::forward(torch::Tensor state) {
  TORCH_CHECK(state.size(-1) >= kNumKineticChannels,
              "state must carry at least ", kNumKineticChannels,
              " channels, got ", state.size(-1));

  auto X = state.select(-1, BIOMASS);
  auto S = state.select(-1, SUBSTRATE);

  auto mu = growth_rate(S);
  auto dXdt = mu * X;
  auto dSdt = -dXdt / log_Yxs.exp();
  auto dPdt = production_rate(S) * X;

  auto rates = torch::stack({dXdt, dSdt, dPdt}, -1);

  int64_t naux = state.size(-1) - kNumKineticChannels;
  if (naux > 0) {
    auto shape = state.sizes().vec();
    shape.back() = naux;
    rates = torch::cat({rates, torch::zeros(shape, state.options())}, -1);
  }

  return rates;
}

}  // namespace biokin
