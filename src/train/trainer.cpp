// C/C++
#include <algorithm>
#include <cmath>
#include <filesystem>

// torch
#include <ATen/CPUGeneratorImpl.h>
#include <torch/serialize.h>

// yaml
#include <yaml-cpp/yaml.h>

// fmt
#include <fmt/format.h>

// biokin
#include <biokin/biokin_formatter.hpp>
#include <biokin/errors.hpp>

#include "trainer.hpp"

namespace biokin {

TrainerOptions TrainerOptions::from_yaml(const YAML::Node& node) {
  TrainerOptions options;

  if (node["learning_rate"])
    options.learning_rate(node["learning_rate"].as<double>());
  if (node["weight_decay"])
    options.weight_decay(node["weight_decay"].as<double>());
  if (node["epochs"]) options.epochs(node["epochs"].as<int64_t>());
  if (node["lr_patience"]) options.lr_patience(node["lr_patience"].as<int64_t>());
  if (node["lr_factor"]) options.lr_factor(node["lr_factor"].as<double>());
  if (node["seed"]) options.seed(node["seed"].as<uint64_t>());
  if (node["verbose"]) options.verbose(node["verbose"].as<bool>());
  if (node["checkpoint_dir"])
    options.checkpoint_dir(node["checkpoint_dir"].as<std::string>());

  return options;
}

torch::Tensor history_to_tensor(std::vector<EpochRecord> const& history) {
  auto table = torch::zeros({static_cast<int64_t>(history.size()), 8},
                            torch::kFloat64);
  auto acc = table.accessor<double, 2>();
  for (size_t i = 0; i < history.size(); ++i) {
    auto const& r = history[i];
    acc[i][0] = static_cast<double>(r.epoch);
    acc[i][1] = r.train_total;
    acc[i][2] = r.train_data;
    acc[i][3] = r.train_physics;
    acc[i][4] = r.val_total;
    acc[i][5] = r.val_data;
    acc[i][6] = r.val_physics;
    acc[i][7] = r.lr;
  }
  return table;
}

std::vector<EpochRecord> history_from_tensor(torch::Tensor table) {
  table = table.to(torch::kCPU, torch::kFloat64).contiguous();
  auto acc = table.accessor<double, 2>();

  std::vector<EpochRecord> history;
  for (int64_t i = 0; i < table.size(0); ++i) {
    EpochRecord r;
    r.epoch = static_cast<int64_t>(acc[i][0]);
    r.train_total = acc[i][1];
    r.train_data = acc[i][2];
    r.train_physics = acc[i][3];
    r.val_total = acc[i][4];
    r.val_data = acc[i][5];
    r.val_physics = acc[i][6];
    r.lr = acc[i][7];
    history.push_back(r);
  }
  return history;
}

Trainer::Trainer(HybridModel model_, PhysicsLossOptions const& loss_options,
                 TrainerOptions const& options_)
    : model(std::move(model_)), loss(loss_options), options(options_) {
  BIOKIN_CHECK(options.learning_rate() > 0., ConfigurationError,
               "learning_rate = ", options.learning_rate(), " must be > 0");
  BIOKIN_CHECK(options.weight_decay() >= 0., ConfigurationError,
               "weight_decay = ", options.weight_decay(), " must be >= 0");
  BIOKIN_CHECK(options.epochs() >= 0, ConfigurationError,
               "epochs = ", options.epochs(), " must be >= 0");
  BIOKIN_CHECK(options.lr_patience() >= 0, ConfigurationError,
               "lr_patience = ", options.lr_patience(), " must be >= 0");
  BIOKIN_CHECK(options.lr_factor() > 0. && options.lr_factor() < 1.,
               ConfigurationError, "lr_factor = ", options.lr_factor(),
               " must be in (0, 1)");

  auto dtype = model->time_scale.dtype();
  auto device = model->time_scale.device();
  loss->to(device, dtype);

  optimizer = std::make_unique<torch::optim::Adam>(
      model->parameters(), torch::optim::AdamOptions(options.learning_rate())
                               .weight_decay(options.weight_decay()));

  scheduler = std::make_unique<torch::optim::ReduceLROnPlateauScheduler>(
      *optimizer, torch::optim::ReduceLROnPlateauScheduler::SchedulerMode::min,
      static_cast<float>(options.lr_factor()),
      static_cast<int>(options.lr_patience()));

  best_model = std::dynamic_pointer_cast<HybridModelImpl>(model->clone());
}

double Trainer::learning_rate() const {
  return optimizer->param_groups()[0].options().get_lr();
}

LossTerms Trainer::batch_loss(WindowSet const& batch) {
  auto pred = model->forward(batch.input, batch.input_time, batch.target,
                             batch.target_time);

  // prepend the anchor state so the residual covers the first step
  auto traj = torch::cat({batch.input.narrow(1, -1, 1), pred}, 1);
  auto time = torch::cat({batch.input_time.narrow(1, -1, 1), batch.target_time}, 1);

  return loss->forward(traj, time, batch.target, model->mechanistic_rate(traj));
}

EpochRecord Trainer::run_epoch(int64_t epoch, WindowSet const& train,
                               WindowSet const& val, int64_t batch_train,
                               int64_t batch_val) {
  EpochRecord rec;
  rec.epoch = epoch;
  rec.lr = learning_rate();

  model->train();

  // dropout masks depend only on the seed and the epoch, also after resume
  torch::manual_seed(options.seed() + epoch);

  auto perm = shuffle_order(epoch, train.size());
  auto shuffled = train.select(perm.to(train.input.device()));

  int64_t ibatch = 0;
  for (int64_t begin = 0; begin < shuffled.size(); begin += batch_train) {
    auto batch = shuffled.slice(
        begin, std::min(begin + batch_train, shuffled.size()));

    optimizer->zero_grad();

    LossTerms terms;
    try {
      terms = batch_loss(batch);
    } catch (NumericalError const& e) {
      auto msg = fmt::format("epoch {}, batch {}: {}", epoch, ibatch, e.what());
      fmt::print(stderr, "Error: {}\n", msg);
      throw NumericalError(msg);
    }

    // nothing is trainable in mechanistic-only mode with fixed kinetics
    if (terms.total.requires_grad()) {
      terms.total.backward();
      optimizer->step();
    }

    double w = static_cast<double>(batch.size()) / shuffled.size();
    rec.train_total += w * terms.total.item<double>();
    rec.train_data += w * terms.data.item<double>();
    rec.train_physics += w * terms.physics.item<double>();
    ++ibatch;
  }

  if (val.empty()) {
    rec.val_total = rec.val_data = rec.val_physics = std::nan("");
  } else {
    try {
      auto terms = evaluate_loss(val, batch_val);
      rec.val_total = terms.total.item<double>();
      rec.val_data = terms.data.item<double>();
      rec.val_physics = terms.physics.item<double>();
    } catch (NumericalError const& e) {
      auto msg = fmt::format("epoch {}, validation: {}", epoch, e.what());
      fmt::print(stderr, "Error: {}\n", msg);
      throw NumericalError(msg);
    }
  }

  return rec;
}

torch::Tensor Trainer::shuffle_order(int64_t epoch, int64_t n) const {
  auto gen = at::make_generator<at::CPUGeneratorImpl>(options.seed() + epoch);
  return torch::randperm(n, gen, torch::kLong);
}

LossTerms Trainer::evaluate_loss(WindowSet const& windows, int64_t batch_size) {
  TORCH_CHECK(!windows.empty(), "no windows to evaluate");
  batch_size = std::max<int64_t>(1, batch_size);

  torch::NoGradGuard no_grad;
  model->eval();

  double total = 0., data = 0., physics = 0.;
  for (int64_t begin = 0; begin < windows.size(); begin += batch_size) {
    auto batch =
        windows.slice(begin, std::min(begin + batch_size, windows.size()));
    auto terms = batch_loss(batch);

    double w = static_cast<double>(batch.size()) / windows.size();
    total += w * terms.total.item<double>();
    data += w * terms.data.item<double>();
    physics += w * terms.physics.item<double>();
  }

  auto opts = model->time_scale.options();
  return {torch::tensor(total, opts), torch::tensor(data, opts),
          torch::tensor(physics, opts)};
}

std::vector<EpochRecord> const& Trainer::fit(SequenceData const& data) {
  BIOKIN_CHECK(!data.train.empty(), ConfigurationError,
               "training split is empty");

  model->fit_normalization(data.train);
  loss->set_scales(model->scaler->scale, model->rate_scale());

  if (history.empty()) {
    best_model = std::dynamic_pointer_cast<HybridModelImpl>(model->clone());
  }

  auto const& plan = data.plan;
  for (int64_t epoch = history.size(); epoch < options.epochs(); ++epoch) {
    auto rec = run_epoch(epoch, data.train, data.val, plan.batch_train,
                         plan.batch_val);
    history.push_back(rec);

    // without a validation split the training loss is monitored
    double monitored = data.val.empty() ? rec.train_total : rec.val_total;
    if (monitored < best_loss) {
      best_loss = monitored;
      best_epoch = epoch;
      keep_best();
    }

    scheduler->step(static_cast<float>(monitored));

    if (options.verbose()) {
      fmt::print("{}\n", rec);
    }

    if (!options.checkpoint_dir().empty()) {
      std::filesystem::create_directories(options.checkpoint_dir());
      save_checkpoint(options.checkpoint_dir() + "/checkpoint.pt");
    }
  }

  restore_best();

  if (options.verbose()) {
    fmt::print("Best epoch {} with loss {:.6e}\n", best_epoch, best_loss);
  }

  return history;
}

void Trainer::keep_best() {
  torch::NoGradGuard no_grad;
  auto src = model->named_parameters();
  auto dst = best_model->named_parameters();
  for (auto const& item : src) dst[item.key()].copy_(item.value());

  auto src_buf = model->named_buffers();
  auto dst_buf = best_model->named_buffers();
  for (auto const& item : src_buf) dst_buf[item.key()].copy_(item.value());
}

void Trainer::restore_best() {
  if (best_epoch < 0) return;

  torch::NoGradGuard no_grad;
  auto src = best_model->named_parameters();
  auto dst = model->named_parameters();
  for (auto const& item : src) dst[item.key()].copy_(item.value());

  auto src_buf = best_model->named_buffers();
  auto dst_buf = model->named_buffers();
  for (auto const& item : src_buf) dst_buf[item.key()].copy_(item.value());
}

void Trainer::save_checkpoint(std::string const& path) const {
  torch::serialize::OutputArchive archive;

  torch::serialize::OutputArchive model_archive;
  model->save(model_archive);
  archive.write("model", model_archive);

  torch::serialize::OutputArchive best_archive;
  best_model->save(best_archive);
  archive.write("best_model", best_archive);

  torch::serialize::OutputArchive optim_archive;
  optimizer->save(optim_archive);
  archive.write("optimizer", optim_archive);

  archive.write("history", history_to_tensor(history));
  archive.write("best_loss", torch::tensor(best_loss, torch::kFloat64));
  archive.write("best_epoch", torch::tensor(best_epoch, torch::kInt64));

  // a partially written file never replaces the last good checkpoint
  auto tmp = path + ".tmp";
  archive.save_to(tmp);
  std::filesystem::rename(tmp, path);
}

bool Trainer::resume(std::string const& path) {
  if (!std::filesystem::exists(path)) return false;

  torch::serialize::InputArchive archive;
  archive.load_from(path);

  torch::serialize::InputArchive model_archive;
  archive.read("model", model_archive);
  model->load(model_archive);

  torch::serialize::InputArchive best_archive;
  archive.read("best_model", best_archive);
  best_model->load(best_archive);

  torch::serialize::InputArchive optim_archive;
  archive.read("optimizer", optim_archive);
  optimizer->load(optim_archive);

  torch::Tensor table, best, epoch;
  archive.read("history", table);
  archive.read("best_loss", best);
  archive.read("best_epoch", epoch);

  history = history_from_tensor(table);
  best_loss = best.item<double>();
  best_epoch = epoch.item<int64_t>();

  if (options.verbose()) {
    fmt::print("Resumed from {} after {} epochs\n", path, history.size());
  }

  return true;
}

}  // namespace biokin
