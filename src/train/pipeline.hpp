#pragma once

// C/C++
#include <map>
#include <string>
#include <vector>

// biokin
#include <biokin/biokin_options.hpp>
#include <biokin/state.hpp>

#include "evaluation.hpp"
#include "trainer.hpp"

namespace biokin {

//! Everything produced by one training run
struct PipelineResult {
  //! effective sequence configuration
  SequencePlan plan;

  //! trained model holding the best parameters
  HybridModel model = nullptr;

  //! one record per epoch
  std::vector<EpochRecord> history;

  //! held-out predictions in the configured mode
  EvaluationResult evaluation;

  //! held-out predictions in both modes
  std::map<HybridMode, EvaluationResult> comparison;
};

//! \brief Build sequences, train and evaluate a hybrid model
/*!
 * The channel count is taken from the data. Metrics are computed on the test
 * split, or on the validation or training split when the test split is
 * empty. Results are exported to `output_dir` unless it is empty.
 */
PipelineResult run_pipeline(Dataset const& data, BiokinOptions options,
                            std::string const& output_dir = "");

}  // namespace biokin
