// external
#include <gtest/gtest.h>

// torch
#include <torch/torch.h>

// biokin
#include <biokin/errors.hpp>
#include <biokin/hybrid/hybrid_model.hpp>

// tests
#include "device_testing.hpp"

using namespace biokin;

GTEST_ALLOW_UNINSTANTIATED_PARAMETERIZED_TEST(DeviceTest);

class HybridModelTest : public DeviceTest {
 protected:
  HybridModelOptions op;

  void SetUp() override {
    DeviceTest::SetUp();
    op.kinetics(MonodOptions().mu_max(0.05).Ks(0.5).qp_max(0.01));
    op.learner(ResidualLearnerOptions().hidden_dim(8).num_layers(1));
  }

  //! one experiment of 21 points over 0 - 240 h
  Dataset make_dataset(HybridModel model) {
    torch::NoGradGuard no_grad;
    auto x0 = torch::tensor({0.1, 10., 0.}, options());
    auto time = torch::linspace(0., 240., 21, options());
    Dataset data;
    data["batch1"] = Experiment("batch1", time, model->simulate(x0, time));
    return data;
  }
};

TEST_P(HybridModelTest, mechanistic_only_matches_reference_integration) {
  op.mode(HybridMode::mechanistic_only);
  HybridModel model(op);
  model->to(device, dtype);
  std::cout << model << std::endl;

  auto x0 = torch::tensor({{0.1, 10., 0.}, {0.3, 8., 0.1}}, options());
  auto time = torch::linspace(0., 120., 11, options());
  auto traj = model->simulate(x0, time);

  Monod kinet(op.kinetics());
  kinet->to(device, dtype);
  auto solver = make_solver(op.integrator());
  auto ref = integrate(
      *solver, [&](torch::Tensor x) { return kinet->forward(x); }, x0, time);

  EXPECT_TRUE(torch::allclose(traj, ref, 1e-12, 1e-14));
  EXPECT_EQ(model->status(), RunStatus::done);

  // one-step predictions restart from the reference states
  auto windows = build_windows(make_dataset(model), 5);
  auto pred = model->forward(windows.input, windows.input_time,
                             windows.target, windows.target_time);
  auto dt = windows.target_time.select(1, 0) - windows.input_time.select(1, -1);
  auto expected = solver->advance(
      [&](torch::Tensor x) { return kinet->forward(x); },
      windows.input.select(1, -1), dt);
  EXPECT_TRUE(torch::allclose(pred.select(1, 0), expected, 1e-12, 1e-14));
}

TEST_P(HybridModelTest, untrained_hybrid_equals_mechanistic) {
  HybridModel model(op);
  model->to(device, dtype);
  EXPECT_EQ(model->mode(), HybridMode::residual_hybrid);
  EXPECT_EQ(model->status(), RunStatus::uninitialized);

  auto windows = build_windows(make_dataset(model), 5);
  model->fit_normalization(windows);

  auto hybrid = model->forward(windows.input, windows.input_time,
                               windows.target, windows.target_time);

  model->set_mode(HybridMode::mechanistic_only);
  EXPECT_FALSE(model->correction(windows.input).has_value());
  auto mech = model->forward(windows.input, windows.input_time,
                             windows.target, windows.target_time);

  EXPECT_TRUE(torch::allclose(hybrid, mech, 1e-12, 1e-14));
}

TEST_P(HybridModelTest, correction_changes_prediction) {
  HybridModel model(op);
  model->to(device, dtype);

  auto windows = build_windows(make_dataset(model), 5);
  model->fit_normalization(windows);
  model->eval();

  auto mech = model->forward(windows.input, windows.input_time,
                             windows.target, windows.target_time);
  {
    torch::NoGradGuard no_grad;
    model->learner->head->bias.fill_(0.01);
  }

  auto corr = model->correction(windows.input);
  ASSERT_TRUE(corr.has_value());
  EXPECT_EQ(corr->size(0), windows.size());
  EXPECT_EQ(corr->size(1), 3);
  EXPECT_TRUE(torch::allclose(corr->select(0, 0), 0.01 * model->rate_scale()));

  auto hybrid = model->forward(windows.input, windows.input_time,
                               windows.target, windows.target_time);
  EXPECT_FALSE(torch::allclose(hybrid, mech));
}

TEST_P(HybridModelTest, gradients_reach_learner_and_kinetics) {
  op.kinetics().trainable(true);
  HybridModel model(op);
  model->to(device, dtype);

  auto windows = build_windows(make_dataset(model), 5);
  model->fit_normalization(windows);

  auto pred = model->forward(windows.input, windows.input_time,
                             windows.target, windows.target_time);
  (pred - windows.target * 1.1).square().mean().backward();

  EXPECT_TRUE(model->kinetics->log_mu_max.grad().defined());
  EXPECT_GT(model->learner->head->bias.grad().abs().sum().item<double>(), 0.);
}

TEST_P(HybridModelTest, normalization_fit) {
  HybridModel model(op);
  model->to(device, dtype);

  auto windows = build_windows(make_dataset(model), 5);
  model->fit_normalization(windows);

  EXPECT_NEAR(model->time_scale.item<double>(), 12., 1e-12);
  EXPECT_TRUE(torch::allclose(model->rate_scale(),
                              model->scaler->scale / 12.));
}

TEST_P(HybridModelTest, rollout) {
  HybridModel model(op);
  model->to(device, dtype);

  auto data = make_dataset(model);
  auto const& exp = data.at("batch1");

  auto window = exp.state.narrow(0, 0, 5).unsqueeze(0);
  auto window_time = exp.time.narrow(0, 0, 5).unsqueeze(0);
  auto future_time = exp.time.slice(0, 5).unsqueeze(0);

  auto windows = build_windows(data, 5);
  model->fit_normalization(windows);
  model->eval();

  auto pred = model->rollout(window, window_time, future_time);
  ASSERT_EQ(pred.size(0), 1);
  ASSERT_EQ(pred.size(1), 16);
  ASSERT_EQ(pred.size(2), 3);
  EXPECT_TRUE((pred >= 0.).all().item<bool>());

  // zero corrections reproduce the mechanistic trajectory
  EXPECT_TRUE(torch::allclose(pred[0], exp.state.slice(0, 5), 1e-10, 1e-12));
}

TEST_P(HybridModelTest, shape_errors) {
  EXPECT_THROW(HybridModel(HybridModelOptions(op).nchannel(2)), DataShapeError);

  auto bad = op;
  bad.learner().input_dim(4);
  EXPECT_THROW(HybridModel{bad}, DataShapeError);

  HybridModel model(op);
  model->to(device, dtype);
  auto window = torch::zeros({2, 5, 4}, options());
  auto window_time = torch::zeros({2, 5}, options());
  auto target = torch::zeros({2, 1, 4}, options());
  auto target_time = torch::ones({2, 1}, options());
  EXPECT_THROW(model->forward(window, window_time, target, target_time),
               DataShapeError);
  EXPECT_THROW(model->simulate(torch::zeros({4}, options()),
                               torch::linspace(0., 1., 3, options())),
               DataShapeError);
}

TEST_P(HybridModelTest, auxiliary_channels) {
  op.nchannel(4);
  op.learner().input_dim(4);
  HybridModel model(op);
  model->to(device, dtype);

  auto x0 = torch::tensor({0.1, 10., 0., 7.}, options());
  auto traj = model->simulate(x0, torch::linspace(0., 48., 5, options()));

  EXPECT_EQ(traj.size(-1), 4);
  EXPECT_TRUE((traj.select(-1, 3) == 7.).all().item<bool>());
}

TEST(HybridMode, parse) {
  EXPECT_EQ(parse_hybrid_mode("mechanistic_only"), HybridMode::mechanistic_only);
  EXPECT_EQ(parse_hybrid_mode("residual_hybrid"), HybridMode::residual_hybrid);
  EXPECT_EQ(to_string(HybridMode::residual_hybrid), "residual_hybrid");
  EXPECT_THROW(parse_hybrid_mode("neural_ode"), ConfigurationError);
}

BIOKIN_INSTANTIATE_DEVICE_TESTS(HybridModelTest);

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
