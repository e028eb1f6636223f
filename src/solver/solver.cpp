// C/C++
#include <cmath>

// yaml
#include <yaml-cpp/yaml.h>

// biokin
#include <biokin/errors.hpp>

#include "explicit.hpp"
#include "runge_kutta.hpp"
#include "solver.hpp"

namespace biokin {

IntegratorOptions IntegratorOptions::from_yaml(const YAML::Node& node) {
  IntegratorOptions options;
  if (node["type"]) options.type(node["type"].as<std::string>());
  if (node["max_step"]) options.max_step(node["max_step"].as<double>());
  return options;
}

torch::Tensor Solver::advance(RateFn const& f, torch::Tensor x,
                              torch::Tensor dt,
                              torch::optional<torch::Tensor> correction) const {
  BIOKIN_CHECK((dt > 0.).all().item<bool>(), ConfigurationError,
               "time step must be > 0, got min(dt) = ",
               dt.min().item<double>());

  // each element takes the sub-steps it would take on its own
  auto nsub = torch::ones_like(dt);
  if (options.max_step() > 0.) {
    nsub = (dt / options.max_step() - 1e-9).ceil().clamp_min(1.);
  }
  int64_t nmin = static_cast<int64_t>(nsub.min().item<double>());
  int64_t nmax = static_cast<int64_t>(nsub.max().item<double>());

  // broadcast the step over the channel dimension
  auto h = (dt / nsub).unsqueeze(-1);
  auto active = nsub.unsqueeze(-1);

  for (int64_t i = 0; i < nmax; ++i) {
    auto next = step(f, x, h, correction).clamp_min(0.);
    x = i < nmin ? next : torch::where(active > i, next, x);
  }

  BIOKIN_CHECK(torch::isfinite(x).all().item<bool>(), NumericalError,
               "non-finite state after integrating over dt = ",
               dt.max().item<double>());

  return x;
}

torch::Tensor Solver::advance(RateFn const& f, torch::Tensor x, double dt,
                              torch::optional<torch::Tensor> correction) const {
  BIOKIN_CHECK(dt > 0., ConfigurationError, "time step dt = ", dt,
               " must be > 0");
  return advance(f, x, torch::tensor(dt, x.options()), correction);
}

std::shared_ptr<Solver> make_solver(IntegratorOptions const& options) {
  if (options.type() == "rk4") {
    return std::make_shared<RungeKuttaSolver>(options);
  } else if (options.type() == "euler") {
    return std::make_shared<ExplicitSolver>(options);
  }
  throw ConfigurationError("unknown integrator type '" + options.type() +
                           "'. Expected 'rk4' or 'euler'");
}

void check_time_axis(torch::Tensor time, std::string const& what) {
  BIOKIN_CHECK(time.dim() == 1, ConfigurationError, what,
               " must be 1-D, got ", time.sizes());
  if (time.size(0) > 1) {
    BIOKIN_CHECK((time.diff() > 0.).all().item<bool>(), ConfigurationError,
                 what, " is not strictly increasing");
  }
}

torch::Tensor integrate(Solver const& solver, RateFn const& f,
                        torch::Tensor x0, torch::Tensor time) {
  check_time_axis(time);

  std::vector<torch::Tensor> traj = {x0};
  auto x = x0;
  for (int64_t i = 1; i < time.size(0); ++i) {
    double dt = (time[i] - time[i - 1]).item<double>();
    x = solver.advance(f, x, dt);
    traj.push_back(x);
  }

  return torch::stack(traj, -2);
}

}  // namespace biokin
