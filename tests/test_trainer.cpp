// C/C++
#include <cmath>
#include <filesystem>
#include <limits>

// external
#include <gtest/gtest.h>

// torch
#include <torch/torch.h>

// biokin
#include <biokin/errors.hpp>
#include <biokin/train/trainer.hpp>

// tests
#include "synthetic_data.hpp"

using namespace biokin;

class TrainerTest : public testing::Test {
 protected:
  SequenceData seq;
  HybridModelOptions op;
  TrainerOptions top;

  void SetUp() override {
    seq = build_sequences(make_batch_dataset(), SequenceOptions());

    op.kinetics(MonodOptions().mu_max(0.058).Ks(0.5).qp_max(0.0115)
                    .trainable(true));
    op.learner(ResidualLearnerOptions().hidden_dim(8).num_layers(1)
                   .dropout(0.));

    top.epochs(5).learning_rate(1e-2).verbose(false);
  }
};

TEST_F(TrainerTest, records_every_epoch) {
  Trainer trainer(HybridModel(op), PhysicsLossOptions(), top);
  auto const& history = trainer.fit(seq);

  ASSERT_EQ(history.size(), 5);
  for (size_t i = 0; i < history.size(); ++i) {
    auto const& r = history[i];
    EXPECT_EQ(r.epoch, static_cast<int64_t>(i));
    EXPECT_TRUE(std::isfinite(r.train_total));
    EXPECT_TRUE(std::isfinite(r.val_total));
    EXPECT_NEAR(r.train_total, r.train_data + r.train_physics, 1e-10);
    EXPECT_NEAR(r.val_total, r.val_data + r.val_physics, 1e-10);
    if (i > 0) EXPECT_LE(r.lr, history[i - 1].lr);
  }

  EXPECT_GE(trainer.best_epoch, 0);
  EXPECT_EQ(trainer.best_loss, history[trainer.best_epoch].val_total);
}

TEST_F(TrainerTest, default_model_trains_without_conversion) {
  // residual hybrid with a multi-layer learner, used as constructed
  op.learner(ResidualLearnerOptions().hidden_dim(8));
  HybridModel model(op);
  EXPECT_EQ(model->learner->head->weight.scalar_type(), torch::kFloat64);

  Trainer trainer(model, PhysicsLossOptions(), top.epochs(1));
  auto const& history = trainer.fit(seq);

  ASSERT_EQ(history.size(), 1);
  EXPECT_TRUE(std::isfinite(history[0].train_total));
  EXPECT_TRUE(std::isfinite(history[0].val_total));
  EXPECT_GT(model->learner->head->bias.abs().sum().item<double>(), 0.);
}

TEST_F(TrainerTest, shuffle_order_changes_every_epoch) {
  Trainer trainer(HybridModel(op), PhysicsLossOptions(), top);
  int64_t n = seq.train.size();

  auto first = trainer.shuffle_order(0, n);
  auto second = trainer.shuffle_order(1, n);

  EXPECT_TRUE(torch::equal(first, trainer.shuffle_order(0, n)));
  EXPECT_FALSE(torch::equal(first, second));
  EXPECT_TRUE(torch::equal(std::get<0>(first.sort()),
                           torch::arange(n, torch::kLong)));
  EXPECT_TRUE(torch::equal(std::get<0>(second.sort()),
                           torch::arange(n, torch::kLong)));

  // the order is fixed by the seed
  Trainer other(HybridModel(op), PhysicsLossOptions(), top);
  EXPECT_TRUE(torch::equal(second, other.shuffle_order(1, n)));
}

TEST_F(TrainerTest, restores_best_parameters) {
  Trainer trainer(HybridModel(op), PhysicsLossOptions(), top);
  trainer.fit(seq);

  auto best = trainer.best_model->named_parameters();
  for (auto const& item : trainer.model->named_parameters()) {
    EXPECT_TRUE(torch::equal(item.value(), best[item.key()])) << item.key();
  }

  // the restored model reproduces the best validation loss
  auto terms = trainer.evaluate_loss(seq.val, seq.plan.batch_val);
  EXPECT_NEAR(terms.total.item<double>(), trainer.best_loss,
              1e-9 * std::max(1., trainer.best_loss));
}

TEST_F(TrainerTest, learning_rate_drops_on_plateau) {
  // nothing is trainable, so the monitored loss never improves
  op.mode(HybridMode::mechanistic_only);
  op.kinetics().trainable(false);
  top.epochs(4).lr_patience(0).lr_factor(0.5);

  Trainer trainer(HybridModel(op), PhysicsLossOptions(), top);
  auto const& history = trainer.fit(seq);

  EXPECT_DOUBLE_EQ(history.front().lr, 1e-2);
  EXPECT_LT(history.back().lr, history.front().lr);
  EXPECT_DOUBLE_EQ(history[0].val_total, history[3].val_total);
}

TEST_F(TrainerTest, checkpoint_and_resume) {
  auto dir = std::filesystem::temp_directory_path() / "biokin_test_checkpoint";
  std::filesystem::remove_all(dir);

  top.epochs(3).checkpoint_dir(dir.string());
  Trainer first(HybridModel(op), PhysicsLossOptions(), top);
  first.fit(seq);

  auto path = (dir / "checkpoint.pt").string();
  ASSERT_TRUE(std::filesystem::exists(path));
  EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

  top.epochs(5);
  Trainer second(HybridModel(op), PhysicsLossOptions(), top);
  ASSERT_TRUE(second.resume(path));
  EXPECT_EQ(second.history.size(), 3);
  EXPECT_EQ(second.best_epoch, first.best_epoch);
  EXPECT_DOUBLE_EQ(second.best_loss, first.best_loss);

  auto const& history = second.fit(seq);
  ASSERT_EQ(history.size(), 5);
  EXPECT_EQ(history[3].epoch, 3);
  EXPECT_DOUBLE_EQ(history[0].train_total, first.history[0].train_total);

  EXPECT_FALSE(second.resume((dir / "missing.pt").string()));
  std::filesystem::remove_all(dir);
}

TEST_F(TrainerTest, resumed_run_matches_uninterrupted_run) {
  // dropout between LSTM layers draws random masks every epoch
  op.learner(ResidualLearnerOptions().hidden_dim(8).num_layers(2)
                 .dropout(0.2));
  top.epochs(4);

  torch::manual_seed(1);
  HybridModel reference_model(op);
  Trainer reference(reference_model, PhysicsLossOptions(), top);
  reference.fit(seq);

  auto dir = std::filesystem::temp_directory_path() / "biokin_test_resume";
  std::filesystem::remove_all(dir);

  torch::manual_seed(1);
  HybridModel interrupted_model(op);
  auto partial = top;
  partial.epochs(2).checkpoint_dir(dir.string());
  Trainer interrupted(interrupted_model, PhysicsLossOptions(), partial);
  interrupted.fit(seq);

  torch::manual_seed(123);
  Trainer resumed(HybridModel(op), PhysicsLossOptions(), top);
  ASSERT_TRUE(resumed.resume((dir / "checkpoint.pt").string()));
  auto const& history = resumed.fit(seq);

  ASSERT_EQ(history.size(), 4);
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_NEAR(history[i].train_total, reference.history[i].train_total,
                1e-9 * reference.history[i].train_total)
        << "epoch " << i;
    EXPECT_NEAR(history[i].val_total, reference.history[i].val_total,
                1e-9 * reference.history[i].val_total)
        << "epoch " << i;
  }

  std::filesystem::remove_all(dir);
}

TEST_F(TrainerTest, non_finite_loss_aborts) {
  // every training batch carries a non-finite target
  seq.train.target.select(-1, SUBSTRATE)
      .fill_(std::numeric_limits<double>::quiet_NaN());

  Trainer trainer(HybridModel(op), PhysicsLossOptions(), top);
  try {
    trainer.fit(seq);
    FAIL() << "expected NumericalError";
  } catch (NumericalError const& e) {
    EXPECT_NE(std::string(e.what()).find("epoch 0, batch 0"),
              std::string::npos)
        << e.what();
  }
}

TEST_F(TrainerTest, invalid_options) {
  EXPECT_THROW(Trainer(HybridModel(op), PhysicsLossOptions(),
                       TrainerOptions().learning_rate(0.)),
               ConfigurationError);
  EXPECT_THROW(Trainer(HybridModel(op), PhysicsLossOptions(),
                       TrainerOptions().lr_factor(1.5)),
               ConfigurationError);

  SequenceData empty;
  Trainer trainer(HybridModel(op), PhysicsLossOptions(), top);
  EXPECT_THROW(trainer.fit(empty), ConfigurationError);
}

TEST(History, table_round_trip) {
  std::vector<EpochRecord> history(3);
  for (int64_t i = 0; i < 3; ++i) {
    history[i].epoch = i;
    history[i].train_total = 1. / (i + 1);
    history[i].val_physics = 0.5 * i;
    history[i].lr = 1e-3;
  }

  auto table = history_to_tensor(history);
  EXPECT_EQ(table.size(0), 3);
  EXPECT_EQ(table.size(1), 8);

  auto back = history_from_tensor(table);
  ASSERT_EQ(back.size(), 3);
  EXPECT_EQ(back[2].epoch, 2);
  EXPECT_DOUBLE_EQ(back[1].train_total, 0.5);
  EXPECT_DOUBLE_EQ(back[2].val_physics, 1.0);
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
