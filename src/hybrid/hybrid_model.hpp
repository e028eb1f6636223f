#pragma once

// C/C++
#include <memory>
#include <string>

// torch
#include <torch/nn/cloneable.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/common.h>

// biokin
#include <biokin/kinetics/monod.hpp>
#include <biokin/learner/residual_lstm.hpp>
#include <biokin/learner/scaler.hpp>
#include <biokin/sequence/sequence_builder.hpp>
#include <biokin/solver/solver.hpp>

// arg
#include <biokin/add_arg.h>

namespace YAML {
class Node;
}

namespace biokin {

//! How the effective rate is formed
enum class HybridMode {
  //! rate = mechanistic rate
  mechanistic_only,
  //! rate = mechanistic rate + learned correction
  residual_hybrid
};

//! Progress of the most recent simulation call
enum class RunStatus { uninitialized, integrating, done };

HybridMode parse_hybrid_mode(std::string const& name);
std::string to_string(HybridMode mode);

struct HybridModelOptions {
  static HybridModelOptions from_yaml(const YAML::Node& node);

  //! channels of the state vector (>= 3, auxiliary channels after product)
  ADD_ARG(int64_t, nchannel) = 3;

  ADD_ARG(HybridMode, mode) = HybridMode::residual_hybrid;

  ADD_ARG(MonodOptions, kinetics);
  ADD_ARG(ResidualLearnerOptions, learner);
  ADD_ARG(IntegratorOptions, integrator);
};

class HybridModelImpl : public torch::nn::Cloneable<HybridModelImpl> {
 public:
  //! mechanistic rate law
  Monod kinetics = nullptr;

  //! learned rate correction
  ResidualLearner learner = nullptr;

  //! normalization of learner inputs and of corrections
  Scaler scaler = nullptr;

  //! characteristic observation interval [h], shape ()
  torch::Tensor time_scale;

  //! fixed-step integrator
  std::shared_ptr<Solver> solver;

  //! options with which this `HybridModelImpl` was constructed
  HybridModelOptions options;

  //! Constructor to initialize the layer
  /*!
   * Raises DataShapeError if the learner dimensions disagree with
   * `nchannel` or `nchannel` is smaller than the kinetic channel count.
   */
  HybridModelImpl() = default;
  explicit HybridModelImpl(HybridModelOptions const& options_);
  void reset() override;
  void pretty_print(std::ostream& os) const override;

  HybridMode mode() const { return options.mode(); }
  void set_mode(HybridMode mode) { options.mode(mode); }

  RunStatus status() const { return status_; }

  //! \brief Fit the input scaler and time scale to training windows
  void fit_normalization(WindowSet const& train);

  //! conversion of learner output to rate units, shape (nchannel,)
  torch::Tensor rate_scale() const;

  //! mechanistic rate at `state`, shape (..., nchannel)
  torch::Tensor mechanistic_rate(torch::Tensor state);

  //! \brief Learned correction for a batch of windows
  /*!
   * \param window physical states, shape (batch, L, nchannel)
   * \return correction in rate units, shape (batch, nchannel), or nullopt in
   *         mechanistic-only mode
   */
  torch::optional<torch::Tensor> correction(torch::Tensor window);

  //! \brief Advance states by dt with an optional additive rate correction
  torch::Tensor advance(torch::Tensor state, torch::Tensor dt,
                        torch::optional<torch::Tensor> correction);

  //! \brief One-step-ahead prediction of the target states
  /*!
   * Step k starts from the true state preceding target k and corrects with
   * the true trailing window ending there.
   *
   * \param window states, shape (batch, L, nchannel)
   * \param window_time times, shape (batch, L)
   * \param target true target states, shape (batch, h, nchannel)
   * \param target_time target times, shape (batch, h)
   * \return predicted states, shape (batch, h, nchannel)
   */
  torch::Tensor forward(torch::Tensor window, torch::Tensor window_time,
                        torch::Tensor target, torch::Tensor target_time);

  //! \brief Autoregressive (open-loop) prediction
  /*!
   * Each prediction is appended to the trailing window used for the next
   * step.
   *
   * \param future_time times to predict, shape (batch, T)
   * \return predicted states, shape (batch, T, nchannel)
   */
  torch::Tensor rollout(torch::Tensor window, torch::Tensor window_time,
                        torch::Tensor future_time);

  //! \brief Mechanistic trajectory on a shared time axis
  /*!
   * \param x0 initial state, shape (..., nchannel)
   * \param time shape (ntime,)
   * \return trajectory including x0, shape (..., ntime, nchannel)
   */
  torch::Tensor simulate(torch::Tensor x0, torch::Tensor time);

 private:
  void check_window(torch::Tensor window, torch::Tensor window_time) const;

  RunStatus status_ = RunStatus::uninitialized;
};
TORCH_MODULE(HybridModel);

}  // namespace biokin

#undef ADD_ARG
