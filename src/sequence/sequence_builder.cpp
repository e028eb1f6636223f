// C/C++
#include <algorithm>
#include <array>
#include <cmath>

// torch
#include <ATen/CPUGeneratorImpl.h>

// yaml
#include <yaml-cpp/yaml.h>

// fmt
#include <fmt/format.h>

// biokin
#include <biokin/errors.hpp>

#include "sequence_builder.hpp"

namespace biokin {

SequenceOptions SequenceOptions::from_yaml(const YAML::Node& node) {
  SequenceOptions options;

  if (node["window_length"])
    options.window_length(node["window_length"].as<int64_t>());
  if (node["batch_size"]) options.batch_size(node["batch_size"].as<int64_t>());
  if (node["horizon"]) options.horizon(node["horizon"].as<int64_t>());

  if (node["split"]) {
    auto split = node["split"];
    if (split["train"]) options.train_ratio(split["train"].as<double>());
    if (split["val"]) options.val_ratio(split["val"].as<double>());
    if (split["test"]) options.test_ratio(split["test"].as<double>());
  }

  if (node["seed"]) options.seed(node["seed"].as<uint64_t>());

  return options;
}

void SequenceOptions::validate() const {
  BIOKIN_CHECK(window_length() >= 1, ConfigurationError,
               "window_length = ", window_length(), " must be >= 1");
  BIOKIN_CHECK(batch_size() >= 1, ConfigurationError,
               "batch_size = ", batch_size(), " must be >= 1");
  BIOKIN_CHECK(horizon() >= 1, ConfigurationError, "horizon = ", horizon(),
               " must be >= 1");

  for (auto [name, r] : {std::make_pair("train_ratio", train_ratio()),
                         std::make_pair("val_ratio", val_ratio()),
                         std::make_pair("test_ratio", test_ratio())}) {
    BIOKIN_CHECK(r >= 0. && r <= 1., ConfigurationError, name, " = ", r,
                 " must be in [0, 1]");
  }

  double sum = train_ratio() + val_ratio() + test_ratio();
  BIOKIN_CHECK(sum > 0. && sum <= 1. + 1e-9, ConfigurationError,
               "split ratios sum to ", sum, ". Expected a sum in (0, 1]");
}

int64_t effective_window_length(int64_t requested,
                                std::vector<int64_t> const& lengths) {
  TORCH_CHECK(!lengths.empty(), "no experiment lengths given");

  int64_t nmin = *std::min_element(lengths.begin(), lengths.end());
  int64_t len = std::min(requested, nmin - 1);

  // leave room for several windows per experiment
  if (nmin / 4 >= 1) {
    len = std::min(len, nmin / 4);
  }

  return std::max<int64_t>(1, len);
}

int64_t effective_batch_size(int64_t requested, int64_t available) {
  return std::max<int64_t>(1, std::min(requested, available));
}

SplitSizes allocate_splits(int64_t total, SequenceOptions const& options) {
  options.validate();
  TORCH_CHECK(total >= 0, "negative window count ", total);

  double sum =
      options.train_ratio() + options.val_ratio() + options.test_ratio();
  std::array<double, 3> ratio = {options.train_ratio() / sum,
                                 options.val_ratio() / sum,
                                 options.test_ratio() / sum};

  std::array<int64_t, 3> count;
  count[1] = std::llround(total * ratio[1]);
  count[2] = std::llround(total * ratio[2]);

  // rounding must never push train below zero
  while (count[1] + count[2] > total) {
    --count[count[1] >= count[2] ? 1 : 2];
  }
  count[0] = total - count[1] - count[2];

  if (total >= 3) {
    for (int i = 0; i < 3; ++i) {
      if (ratio[i] > 0. && count[i] == 0) {
        auto largest = std::max_element(count.begin(), count.end());
        --(*largest);
        ++count[i];
      }
    }
  }

  return {count[0], count[1], count[2]};
}

SequencePlan adapt_sequence_config(std::map<std::string, int64_t> const& lengths,
                                   SequenceOptions const& options) {
  options.validate();
  BIOKIN_CHECK(!lengths.empty(), ConfigurationError,
               "no experiments to build windows from");

  std::vector<int64_t> ns;
  for (auto const& [id, n] : lengths) ns.push_back(n);

  SequencePlan plan;
  plan.horizon = options.horizon();
  plan.window_length = effective_window_length(options.window_length(), ns);

  if (plan.window_length != options.window_length()) {
    fmt::print("Adapted window length from {} to {} (shortest experiment has "
               "{} points)\n",
               options.window_length(), plan.window_length,
               *std::min_element(ns.begin(), ns.end()));
  }

  int64_t total = 0;
  for (auto const& [id, n] : lengths) {
    int64_t nwin = std::max<int64_t>(0, n - plan.window_length - plan.horizon + 1);
    if (nwin == 0) {
      fmt::print(stderr,
                 "Warning: experiment '{}' ({} points) is too short for "
                 "window length {} and horizon {}; excluded\n",
                 id, n, plan.window_length, plan.horizon);
      plan.excluded.push_back(id);
      continue;
    }
    plan.windows[id] = nwin;
    total += nwin;
  }

  BIOKIN_CHECK(total > 0, ConfigurationError, "window_length = ",
               plan.window_length, " (requested ", options.window_length(),
               ") with horizon = ", plan.horizon,
               " leaves no usable experiment");

  plan.split = allocate_splits(total, options);
  plan.batch_train = effective_batch_size(options.batch_size(), plan.split.train);
  plan.batch_val = effective_batch_size(options.batch_size(), plan.split.val);
  plan.batch_test = effective_batch_size(options.batch_size(), plan.split.test);

  return plan;
}

WindowSet WindowSet::select(torch::Tensor index) const {
  WindowSet out;
  out.input = input.index_select(0, index);
  out.input_time = input_time.index_select(0, index);
  out.target = target.index_select(0, index);
  out.target_time = target_time.index_select(0, index);

  auto idx = index.to(torch::kCPU).contiguous();
  auto ptr = idx.data_ptr<int64_t>();
  for (int64_t i = 0; i < idx.numel(); ++i) {
    out.experiment.push_back(experiment[ptr[i]]);
    out.offset.push_back(offset[ptr[i]]);
  }
  return out;
}

WindowSet WindowSet::slice(int64_t begin, int64_t end) const {
  WindowSet out;
  out.input = input.slice(0, begin, end);
  out.input_time = input_time.slice(0, begin, end);
  out.target = target.slice(0, begin, end);
  out.target_time = target_time.slice(0, begin, end);
  out.experiment.assign(experiment.begin() + begin, experiment.begin() + end);
  out.offset.assign(offset.begin() + begin, offset.begin() + end);
  return out;
}

WindowSet build_windows(Dataset const& data, int64_t window_length,
                        int64_t horizon) {
  std::vector<torch::Tensor> input, input_time, target, target_time;
  WindowSet out;

  for (auto const& [id, exp] : data) {
    int64_t nwin = exp.size() - window_length - horizon + 1;
    for (int64_t i = 0; i < nwin; ++i) {
      input.push_back(exp.state.slice(0, i, i + window_length));
      input_time.push_back(exp.time.slice(0, i, i + window_length));
      target.push_back(
          exp.state.slice(0, i + window_length, i + window_length + horizon));
      target_time.push_back(
          exp.time.slice(0, i + window_length, i + window_length + horizon));
      out.experiment.push_back(id);
      out.offset.push_back(i);
    }
  }

  if (input.empty()) return out;

  out.input = torch::stack(input);
  out.input_time = torch::stack(input_time);
  out.target = torch::stack(target);
  out.target_time = torch::stack(target_time);
  return out;
}

SequenceData build_sequences(Dataset const& data,
                             SequenceOptions const& options) {
  int64_t nchannel = dataset_channels(data);

  std::map<std::string, int64_t> lengths;
  for (auto const& [id, exp] : data) {
    validate_experiment(exp, nchannel);
    lengths[id] = exp.size();
  }

  SequenceData result;
  result.plan = adapt_sequence_config(lengths, options);

  auto all = build_windows(data, result.plan.window_length,
                           result.plan.horizon);
  TORCH_CHECK(all.size() == result.plan.total_windows(), "built ",
              all.size(), " windows, planned ", result.plan.total_windows());

  auto gen = at::make_generator<at::CPUGeneratorImpl>(options.seed());
  auto perm = torch::randperm(all.size(), gen, torch::kLong);

  auto const& split = result.plan.split;
  auto take = [&](int64_t begin, int64_t n) {
    auto index = std::get<0>(perm.slice(0, begin, begin + n).sort());
    return all.select(index.to(all.input.device()));
  };

  result.train = take(0, split.train);
  result.val = take(split.train, split.val);
  result.test = take(split.train + split.val, split.test);

  return result;
}

}  // namespace biokin
