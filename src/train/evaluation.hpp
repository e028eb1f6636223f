#pragma once

// C/C++
#include <map>
#include <string>
#include <vector>

// torch
#include <torch/torch.h>

// biokin
#include <biokin/hybrid/hybrid_model.hpp>
#include <biokin/sequence/sequence_builder.hpp>
#include <biokin/state.hpp>

#include "trainer.hpp"

namespace biokin {

//! targets with a magnitude below this are excluded from MAPE
constexpr double kMapeEpsilon = 1.e-6;

struct Metrics {
  double rmse = 0.;
  double mae = 0.;
  double r2 = 0.;

  //! mean absolute percentage error [%], NaN if every target was excluded
  double mape = 0.;

  //! false if any target was excluded from MAPE
  bool mape_reliable = true;

  //! number of compared values
  int64_t count = 0;
};

//! \brief Compare predictions with observations
/*!
 * R^2 = 1 - SS_res / SS_tot with SS_tot taken about the per-channel mean of
 * the observations (NaN when SS_tot is zero).
 *
 * \param predicted shape (..., nchannel)
 * \param observed shape of `predicted`
 */
Metrics compute_metrics(torch::Tensor predicted, torch::Tensor observed,
                        double eps = kMapeEpsilon);

struct EvaluationResult {
  //! mode the predictions were made in
  HybridMode mode = HybridMode::residual_hybrid;

  //! predictions and observations, shape (nwindow, horizon, nchannel)
  torch::Tensor predicted;
  torch::Tensor observed;

  //! metrics over all channels and per channel
  Metrics overall;
  std::vector<Metrics> per_channel;
};

//! \brief One-step-ahead predictions over a window set, without gradients
EvaluationResult evaluate(HybridModel model, WindowSet const& windows,
                          int64_t batch_size);

//! \brief Evaluate the same windows in both modes
/*!
 * The model's mode is restored afterwards.
 */
std::map<HybridMode, EvaluationResult> compare_modes(HybridModel model,
                                                     WindowSet const& windows,
                                                     int64_t batch_size);

//! \brief Open-loop predictions of whole experiments
/*!
 * Each experiment is seeded with its first `window_length` observations and
 * rolled out over the remaining time points; experiments with no remaining
 * points are skipped. Predictions are concatenated in experiment id order
 * into shape (1, npoint, nchannel).
 */
EvaluationResult evaluate_rollout(HybridModel model, Dataset const& data,
                                  int64_t window_length);

//! \brief Write the results of a training run to `dir`
/*!
 * Files: model.pt (best parameters), history.csv and history.pt (epoch
 * records), predictions.pt (predicted/observed), metrics.yaml (metrics and
 * fitted kinetic parameters).
 */
void export_results(std::string const& dir, HybridModel model,
                    std::vector<EpochRecord> const& history,
                    EvaluationResult const& result);

}  // namespace biokin
