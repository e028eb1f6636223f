// C/C++
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>

// yaml
#include <yaml-cpp/yaml.h>

// fmt
#include <fmt/format.h>

// biokin
#include <biokin/errors.hpp>
#include <biokin/utils/serialize.hpp>

#include "evaluation.hpp"

namespace biokin {

Metrics compute_metrics(torch::Tensor predicted, torch::Tensor observed,
                        double eps) {
  TORCH_CHECK(predicted.sizes() == observed.sizes(), "predicted shape ",
              predicted.sizes(), " differs from observed shape ",
              observed.sizes());

  int64_t nchannel = predicted.size(-1);
  auto pred = predicted.detach().to(torch::kCPU, torch::kFloat64)
                  .reshape({-1, nchannel});
  auto obs = observed.detach().to(torch::kCPU, torch::kFloat64)
                 .reshape({-1, nchannel});

  Metrics m;
  auto err = pred - obs;
  m.count = err.numel();
  if (m.count == 0) {
    m.rmse = m.mae = m.r2 = m.mape = std::nan("");
    m.mape_reliable = false;
    return m;
  }

  m.rmse = err.square().mean().sqrt().item<double>();
  m.mae = err.abs().mean().item<double>();

  double ss_res = err.square().sum().item<double>();
  double ss_tot = (obs - obs.mean(0)).square().sum().item<double>();
  m.r2 = ss_tot > 0. ? 1. - ss_res / ss_tot : std::nan("");

  auto mask = obs.abs() >= eps;
  m.mape_reliable = mask.all().item<bool>();
  if (mask.any().item<bool>()) {
    auto ratio = err.abs().masked_select(mask) / obs.abs().masked_select(mask);
    m.mape = 100. * ratio.mean().item<double>();
  } else {
    m.mape = std::nan("");
  }

  return m;
}

namespace {

void fill_metrics(EvaluationResult& result) {
  result.overall = compute_metrics(result.predicted, result.observed);
  result.per_channel.clear();
  for (int64_t c = 0; c < result.predicted.size(-1); ++c) {
    result.per_channel.push_back(
        compute_metrics(result.predicted.narrow(-1, c, 1),
                        result.observed.narrow(-1, c, 1)));
  }
}

}  // namespace

EvaluationResult evaluate(HybridModel model, WindowSet const& windows,
                          int64_t batch_size) {
  BIOKIN_CHECK(!windows.empty(), ConfigurationError,
               "no windows to evaluate");
  batch_size = std::max<int64_t>(1, batch_size);

  torch::NoGradGuard no_grad;
  model->eval();

  std::vector<torch::Tensor> pred;
  for (int64_t begin = 0; begin < windows.size(); begin += batch_size) {
    auto batch =
        windows.slice(begin, std::min(begin + batch_size, windows.size()));
    pred.push_back(model->forward(batch.input, batch.input_time, batch.target,
                                  batch.target_time));
  }

  EvaluationResult result;
  result.mode = model->mode();
  result.predicted = torch::cat(pred, 0);
  result.observed = windows.target.clone();
  fill_metrics(result);
  return result;
}

std::map<HybridMode, EvaluationResult> compare_modes(HybridModel model,
                                                     WindowSet const& windows,
                                                     int64_t batch_size) {
  auto mode = model->mode();
  std::map<HybridMode, EvaluationResult> results;

  for (auto m : {HybridMode::mechanistic_only, HybridMode::residual_hybrid}) {
    model->set_mode(m);
    results[m] = evaluate(model, windows, batch_size);
  }

  model->set_mode(mode);
  return results;
}

EvaluationResult evaluate_rollout(HybridModel model, Dataset const& data,
                                  int64_t window_length) {
  torch::NoGradGuard no_grad;
  model->eval();

  std::vector<torch::Tensor> pred, obs;
  for (auto const& [id, exp] : data) {
    if (exp.size() <= window_length) continue;

    auto window = exp.state.narrow(0, 0, window_length).unsqueeze(0);
    auto window_time = exp.time.narrow(0, 0, window_length).unsqueeze(0);
    auto future_time = exp.time.slice(0, window_length).unsqueeze(0);

    pred.push_back(model->rollout(window, window_time, future_time));
    obs.push_back(exp.state.slice(0, window_length).unsqueeze(0));
  }

  BIOKIN_CHECK(!pred.empty(), ConfigurationError, "window_length = ",
               window_length, " leaves no experiment to roll out");

  EvaluationResult result;
  result.mode = model->mode();
  result.predicted = torch::cat(pred, 1);
  result.observed = torch::cat(obs, 1);
  fill_metrics(result);
  return result;
}

void export_results(std::string const& dir, HybridModel model,
                    std::vector<EpochRecord> const& history,
                    EvaluationResult const& result) {
  std::filesystem::create_directories(dir);

  torch::save(model, dir + "/model.pt");

  auto table = history_to_tensor(history);
  save_tensors({{"history", table}}, dir + "/history.pt");

  std::ofstream csv(dir + "/history.csv");
  TORCH_CHECK(csv.is_open(), "cannot open ", dir, "/history.csv");
  csv << "epoch,train_total,train_data,train_physics,val_total,val_data,"
         "val_physics,lr\n";
  for (auto const& r : history) {
    csv << fmt::format("{},{:.8e},{:.8e},{:.8e},{:.8e},{:.8e},{:.8e},{:.8e}\n",
                       r.epoch, r.train_total, r.train_data, r.train_physics,
                       r.val_total, r.val_data, r.val_physics, r.lr);
  }

  save_tensors({{"predicted", result.predicted.detach().cpu()},
                {"observed", result.observed.detach().cpu()}},
               dir + "/predictions.pt");

  auto names = channel_names(result.predicted.size(-1));
  auto emit = [](YAML::Emitter& out, Metrics const& m) {
    out << YAML::BeginMap;
    out << YAML::Key << "rmse" << YAML::Value << m.rmse;
    out << YAML::Key << "mae" << YAML::Value << m.mae;
    out << YAML::Key << "r2" << YAML::Value << m.r2;
    out << YAML::Key << "mape" << YAML::Value << m.mape;
    out << YAML::Key << "mape_reliable" << YAML::Value << m.mape_reliable;
    out << YAML::Key << "count" << YAML::Value << m.count;
    out << YAML::EndMap;
  };

  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "mode" << YAML::Value << to_string(result.mode);
  out << YAML::Key << "overall" << YAML::Value;
  emit(out, result.overall);
  out << YAML::Key << "channels" << YAML::Value << YAML::BeginMap;
  for (size_t c = 0; c < result.per_channel.size(); ++c) {
    out << YAML::Key << names[c] << YAML::Value;
    emit(out, result.per_channel[c]);
  }
  out << YAML::EndMap;

  auto kin = model->kinetics->current();
  out << YAML::Key << "kinetics" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "mu_max" << YAML::Value << kin.mu_max();
  out << YAML::Key << "Ks" << YAML::Value << kin.Ks();
  out << YAML::Key << "Yxs" << YAML::Value << kin.Yxs();
  out << YAML::Key << "Yps" << YAML::Value << kin.Yps();
  out << YAML::Key << "qp_max" << YAML::Value << kin.qp_max();
  out << YAML::EndMap;
  out << YAML::EndMap;

  std::ofstream yaml(dir + "/metrics.yaml");
  TORCH_CHECK(yaml.is_open(), "cannot open ", dir, "/metrics.yaml");
  yaml << out.c_str() << "\n";
}

}  // namespace biokin
