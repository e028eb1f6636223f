// fmt
#include <fmt/format.h>

// biokin
#include <biokin/biokin_formatter.hpp>

#include "pipeline.hpp"

namespace biokin {

PipelineResult run_pipeline(Dataset const& data, BiokinOptions options,
                            std::string const& output_dir) {
  int64_t nchannel = dataset_channels(data);
  auto& model_options = options.model();
  model_options.nchannel(nchannel);
  model_options.learner().input_dim(nchannel);
  model_options.kinetics().validate();

  bool verbose = options.trainer().verbose();
  if (verbose) {
    fmt::print("Options: {}\n", options);
  }

  PipelineResult result;

  auto seq = build_sequences(data, options.sequence());
  result.plan = seq.plan;
  if (verbose) {
    fmt::print("Sequences: {}\n", seq.plan);
  }

  // seeds the learner initialization
  torch::manual_seed(options.trainer().seed());
  result.model = HybridModel(model_options);

  Trainer trainer(result.model, options.loss(), options.trainer());
  if (!options.trainer().checkpoint_dir().empty()) {
    trainer.resume(options.trainer().checkpoint_dir() + "/checkpoint.pt");
  }
  result.history = trainer.fit(seq);

  WindowSet const* held_out = &seq.test;
  int64_t batch = seq.plan.batch_test;
  if (held_out->empty()) {
    fmt::print(stderr, "Warning: test split is empty, evaluating on {}\n",
               seq.val.empty() ? "training windows" : "validation windows");
    held_out = seq.val.empty() ? &seq.train : &seq.val;
    batch = seq.val.empty() ? seq.plan.batch_train : seq.plan.batch_val;
  }

  result.comparison = compare_modes(result.model, *held_out, batch);
  result.evaluation = result.comparison.at(result.model->mode());

  if (verbose) {
    for (auto const& [mode, eval] : result.comparison) {
      fmt::print("{:>16}: {}\n", to_string(mode), eval.overall);
    }
  }

  if (!output_dir.empty()) {
    export_results(output_dir, result.model, result.history,
                   result.evaluation);
  }

  return result;
}

}  // namespace biokin
