#pragma once

// C/C++
#include <functional>
#include <memory>
#include <string>

// torch
#include <torch/torch.h>

// arg
#include <biokin/add_arg.h>

namespace YAML {
class Node;
}

namespace biokin {

//! Rate function dx/dt = f(x), x of shape (..., nchannel)
using RateFn = std::function<torch::Tensor(torch::Tensor)>;

struct IntegratorOptions {
  static IntegratorOptions from_yaml(const YAML::Node& node);

  //! fixed-step scheme, "rk4" or "euler"
  ADD_ARG(std::string, type) = "rk4";

  //! largest sub-step [h]; each interval is split into equal sub-steps.
  //! A non-positive value disables sub-stepping.
  ADD_ARG(double, max_step) = 1.0;
};

/**
 * @brief Base class for fixed-step explicit integrators
 */
class Solver {
 public:
  explicit Solver(IntegratorOptions const& options_ = {})
      : options(options_) {}
  virtual ~Solver() = default;

  /**
   * @brief One step of the scheme, without clamping
   * @param f rate function
   * @param x state, shape (..., nchannel)
   * @param h step size, shape (...) or ()
   * @param correction additive rate correction held constant over the step,
   *        shape (..., nchannel)
   */
  virtual torch::Tensor step(
      RateFn const& f, torch::Tensor x, torch::Tensor h,
      torch::optional<torch::Tensor> correction) const = 0;

  /**
   * @brief Advance the state across one interval dt
   *
   * Each element's interval is divided into ceil(dt / max_step) equal
   * sub-steps, independently of the rest of the batch, and the state is
   * clamped to >= 0 after every sub-step.
   *
   * @param dt interval length, shape (...) or (), must be > 0
   * @return state at t + dt, shape (..., nchannel)
   */
  torch::Tensor advance(RateFn const& f, torch::Tensor x, torch::Tensor dt,
                        torch::optional<torch::Tensor> correction = {}) const;

  torch::Tensor advance(RateFn const& f, torch::Tensor x, double dt,
                        torch::optional<torch::Tensor> correction = {}) const;

  //! options with which this solver was constructed
  IntegratorOptions options;
};

//! \brief Create the solver named by `options.type()`
/*!
 * Raises ConfigurationError for an unknown type.
 */
std::shared_ptr<Solver> make_solver(IntegratorOptions const& options);

//! \brief Raise ConfigurationError unless `time` is strictly increasing
void check_time_axis(torch::Tensor time, std::string const& what = "time");

//! \brief Integrate a trajectory on a given time axis
/*!
 * \param x0 initial state at time[0], shape (..., nchannel)
 * \param time time axis, shape (ntime,)
 * \return trajectory including x0, shape (..., ntime, nchannel)
 */
torch::Tensor integrate(Solver const& solver, RateFn const& f,
                        torch::Tensor x0, torch::Tensor time);

}  // namespace biokin

#undef ADD_ARG
