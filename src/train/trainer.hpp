#pragma once

// C/C++
#include <limits>
#include <memory>
#include <string>
#include <vector>

// torch
#include <torch/optim/adam.h>
#include <torch/optim/schedulers/reduce_on_plateau_scheduler.h>

// biokin
#include <biokin/hybrid/hybrid_model.hpp>
#include <biokin/loss/physics_loss.hpp>
#include <biokin/sequence/sequence_builder.hpp>

// arg
#include <biokin/add_arg.h>

namespace YAML {
class Node;
}

namespace biokin {

struct TrainerOptions {
  static TrainerOptions from_yaml(const YAML::Node& node);

  ADD_ARG(double, learning_rate) = 1.e-3;
  ADD_ARG(double, weight_decay) = 1.e-5;

  //! epoch budget
  ADD_ARG(int64_t, epochs) = 100;

  //! epochs without validation improvement before the learning rate drops
  ADD_ARG(int64_t, lr_patience) = 10;

  //! factor applied to the learning rate on a plateau
  ADD_ARG(double, lr_factor) = 0.5;

  //! seed of the per-epoch shuffle and of dropout; epoch k uses seed + k
  ADD_ARG(uint64_t, seed) = 42;

  //! print one line per epoch
  ADD_ARG(bool, verbose) = true;

  //! write `checkpoint.pt` here after every epoch; disabled when empty
  ADD_ARG(std::string, checkpoint_dir) = "";
};

//! losses and learning rate of one epoch
struct EpochRecord {
  int64_t epoch = 0;
  double train_total = 0.;
  double train_data = 0.;
  double train_physics = 0.;
  double val_total = 0.;
  double val_data = 0.;
  double val_physics = 0.;
  double lr = 0.;
};

//! (nepoch, 8) table of epoch records and its inverse
torch::Tensor history_to_tensor(std::vector<EpochRecord> const& history);
std::vector<EpochRecord> history_from_tensor(torch::Tensor table);

class Trainer {
 public:
  //! model being optimized; holds the best parameters after `fit`
  HybridModel model;

  //! training objective
  PhysicsLoss loss;

  //! copy of the model at the best validation epoch
  HybridModel best_model = nullptr;

  std::unique_ptr<torch::optim::Adam> optimizer;
  std::unique_ptr<torch::optim::ReduceLROnPlateauScheduler> scheduler;

  //! one record per completed epoch
  std::vector<EpochRecord> history;

  //! lowest monitored loss and the epoch it was reached
  double best_loss = std::numeric_limits<double>::infinity();
  int64_t best_epoch = -1;

  //! options with which this `Trainer` was constructed
  TrainerOptions options;

  Trainer(HybridModel model_, PhysicsLossOptions const& loss_options,
          TrainerOptions const& options_);

  //! \brief Train until the epoch budget is spent
  /*!
   * Fits the model normalization to the training windows, then runs the
   * remaining epochs (all of them, or those left after `resume`) and finally
   * loads the best parameters into `model`. Raises NumericalError (with
   * epoch and batch index) on a non-finite loss.
   */
  std::vector<EpochRecord> const& fit(SequenceData const& data);

  //! \brief One training pass and one validation pass
  EpochRecord run_epoch(int64_t epoch, WindowSet const& train,
                        WindowSet const& val, int64_t batch_train,
                        int64_t batch_val);

  //! \brief Order in which the training windows are visited in `epoch`
  /*!
   * A permutation of [0, n) that depends only on the seed and the epoch.
   */
  torch::Tensor shuffle_order(int64_t epoch, int64_t n) const;

  //! \brief Batch-averaged loss over a window set without gradients
  LossTerms evaluate_loss(WindowSet const& windows, int64_t batch_size);

  //! current learning rate
  double learning_rate() const;

  //! \brief Write model, optimizer, best model and history to `path`
  void save_checkpoint(std::string const& path) const;

  //! \brief Restore the state written by `save_checkpoint`
  /*!
   * \return false if `path` does not exist
   */
  bool resume(std::string const& path);

 private:
  LossTerms batch_loss(WindowSet const& batch);
  void keep_best();
  void restore_best();
};

}  // namespace biokin

#undef ADD_ARG
