#pragma once

// C/C++
#include <map>
#include <string>
#include <vector>

// torch
#include <torch/torch.h>

// biokin
#include <biokin/state.hpp>

// arg
#include <biokin/add_arg.h>

namespace YAML {
class Node;
}

namespace biokin {

struct SequenceOptions {
  static SequenceOptions from_yaml(const YAML::Node& node);

  //! \brief Check requested values
  /*!
   * Raises ConfigurationError for a non-positive window length, batch size
   * or horizon and for split ratios outside [0, 1] or summing outside (0, 1].
   */
  void validate() const;

  //! requested input window length
  ADD_ARG(int64_t, window_length) = 10;

  //! requested batch size
  ADD_ARG(int64_t, batch_size) = 32;

  //! number of target states following each window
  ADD_ARG(int64_t, horizon) = 1;

  //! split ratios, normalized by their sum
  ADD_ARG(double, train_ratio) = 0.7;
  ADD_ARG(double, val_ratio) = 0.15;
  ADD_ARG(double, test_ratio) = 0.15;

  //! seed of the split permutation
  ADD_ARG(uint64_t, seed) = 42;
};

//! number of windows in each split
struct SplitSizes {
  int64_t train = 0;
  int64_t val = 0;
  int64_t test = 0;

  int64_t total() const { return train + val + test; }
};

//! Window length, batch sizes and split sizes actually used
struct SequencePlan {
  //! effective input window length
  int64_t window_length = 1;

  //! target length
  int64_t horizon = 1;

  //! windows contributed by each included experiment
  std::map<std::string, int64_t> windows;

  //! experiments too short to contribute a window
  std::vector<std::string> excluded;

  //! split sizes, summing to the window total
  SplitSizes split;

  //! batch size per split, at least 1 and at most the split size
  int64_t batch_train = 1;
  int64_t batch_val = 1;
  int64_t batch_test = 1;

  int64_t total_windows() const { return split.total(); }
};

//! \brief Effective window length for a set of experiment lengths
/*!
 * L_eff = max(1, min(L_requested, n_min - 1, n_min / 4)), where the last term
 * only applies when it is at least 1.
 */
int64_t effective_window_length(int64_t requested,
                                std::vector<int64_t> const& lengths);

//! \brief Clip a batch size to the number of available windows
int64_t effective_batch_size(int64_t requested, int64_t available);

//! \brief Allocate `total` windows to train/validation/test
/*!
 * Validation and test counts are rounded from the normalized ratios and the
 * training split receives the remainder. With at least 3 windows every split
 * with a nonzero ratio receives at least one window, borrowed from the
 * currently largest split.
 */
SplitSizes allocate_splits(int64_t total, SequenceOptions const& options);

//! \brief Derive the effective sequence configuration from dataset shape
/*!
 * Pure function of the experiment lengths and the requested options.
 * Experiments yielding no window are listed in `excluded` and reported on
 * stderr. Raises ConfigurationError if no experiment yields a window.
 *
 * \param lengths number of observations per experiment id
 */
SequencePlan adapt_sequence_config(std::map<std::string, int64_t> const& lengths,
                                   SequenceOptions const& options);

//! A batch of (input window, target) pairs
struct WindowSet {
  //! input states, shape (nwindow, L, nchannel)
  torch::Tensor input;

  //! input times, shape (nwindow, L)
  torch::Tensor input_time;

  //! target states, shape (nwindow, horizon, nchannel)
  torch::Tensor target;

  //! target times, shape (nwindow, horizon)
  torch::Tensor target_time;

  //! source experiment id of each window
  std::vector<std::string> experiment;

  //! index of the first input state within its experiment
  std::vector<int64_t> offset;

  int64_t size() const { return input.defined() ? input.size(0) : 0; }
  bool empty() const { return size() == 0; }

  //! windows at `index` (1-D long tensor), in that order
  WindowSet select(torch::Tensor index) const;

  //! contiguous windows [begin, end)
  WindowSet slice(int64_t begin, int64_t end) const;
};

//! \brief Slide a window of length `window_length` over every experiment
/*!
 * Stride 1, never crossing experiment boundaries; experiments are visited in
 * id order and skipped when too short.
 */
WindowSet build_windows(Dataset const& data, int64_t window_length,
                        int64_t horizon = 1);

//! Output of the sequence builder
struct SequenceData {
  SequencePlan plan;
  WindowSet train;
  WindowSet val;
  WindowSet test;
};

//! \brief Build windows and split them with a seeded permutation
/*!
 * Validates every experiment, adapts the configuration with
 * `adapt_sequence_config` and assigns windows to splits. Identical inputs
 * and seed give identical assignments.
 */
SequenceData build_sequences(Dataset const& data,
                             SequenceOptions const& options);

}  // namespace biokin

#undef ADD_ARG
