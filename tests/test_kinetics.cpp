// external
#include <gtest/gtest.h>

// fmt
#include <fmt/format.h>

// torch
#include <torch/torch.h>

// biokin
#include <biokin/errors.hpp>
#include <biokin/kinetics/kinetics_formatter.hpp>
#include <biokin/kinetics/monod.hpp>

// tests
#include "device_testing.hpp"

using namespace biokin;

GTEST_ALLOW_UNINSTANTIATED_PARAMETERIZED_TEST(DeviceTest);

class MonodTest : public DeviceTest {};

TEST_P(MonodTest, rates_match_closed_form) {
  auto op = MonodOptions().mu_max(0.4).Ks(0.2).Yxs(0.5).qp_max(0.1);
  Monod kinet(op);
  kinet->to(device, dtype);
  std::cout << fmt::format("{}", kinet->options) << std::endl;

  auto state = torch::tensor({{1.0, 2.0, 0.5}}, options());
  auto rate = kinet->forward(state);

  double mu = 0.4 * 2.0 / (0.2 + 2.0);
  double qp = 0.1 * 2.0 / (0.2 + 2.0);
  EXPECT_NEAR(rate[0][0].item<double>(), mu * 1.0, 1e-12);
  EXPECT_NEAR(rate[0][1].item<double>(), -mu * 1.0 / 0.5, 1e-12);
  EXPECT_NEAR(rate[0][2].item<double>(), qp * 1.0, 1e-12);
}

TEST_P(MonodTest, finite_and_signed_on_grid) {
  Monod kinet(MonodOptions{});
  kinet->to(device, dtype);

  auto X = torch::linspace(0., 20., 41, options());
  auto S = torch::linspace(0., 50., 51, options());
  auto grid = torch::meshgrid({X, S, torch::zeros({1}, options())}, "ij");
  auto state = torch::stack({grid[0], grid[1], grid[2]}, -1).reshape({-1, 3});

  auto rate = kinet->forward(state);

  EXPECT_TRUE(torch::isfinite(rate).all().item<bool>());
  EXPECT_TRUE((rate.select(-1, BIOMASS) >= 0.).all().item<bool>());
  EXPECT_TRUE((rate.select(-1, SUBSTRATE) <= 0.).all().item<bool>());
  EXPECT_TRUE((rate.select(-1, PRODUCT) >= 0.).all().item<bool>());
}

TEST_P(MonodTest, no_growth_without_substrate) {
  Monod kinet(MonodOptions{});
  kinet->to(device, dtype);

  auto S = torch::tensor({0., -1.e-3, -5.}, options());
  EXPECT_TRUE((kinet->growth_rate(S) == 0.).all().item<bool>());
  EXPECT_TRUE((kinet->production_rate(S) == 0.).all().item<bool>());

  auto state = torch::tensor({{2., -0.1, 1.}}, options());
  auto rate = kinet->forward(state);
  EXPECT_TRUE((rate == 0.).all().item<bool>());
}

TEST_P(MonodTest, auxiliary_channels_have_zero_rate) {
  Monod kinet(MonodOptions{});
  kinet->to(device, dtype);

  auto state = torch::tensor({{1., 5., 0., 7., 3.}}, options());
  auto rate = kinet->forward(state);

  ASSERT_EQ(rate.size(-1), 5);
  EXPECT_EQ(rate[0][3].item<double>(), 0.);
  EXPECT_EQ(rate[0][4].item<double>(), 0.);
  EXPECT_GT(rate[0][0].item<double>(), 0.);
}

TEST_P(MonodTest, trainable_parameters) {
  Monod fixed(MonodOptions{});
  EXPECT_EQ(fixed->parameters().size(), 0);
  EXPECT_EQ(fixed->buffers().size(), 5);

  Monod kinet(MonodOptions().trainable(true));
  kinet->to(device, dtype);
  EXPECT_EQ(kinet->parameters().size(), 5);

  auto state = torch::tensor({{1., 2., 0.}}, options());
  kinet->forward(state).sum().backward();
  EXPECT_TRUE(kinet->log_mu_max.grad().defined());
  EXPECT_NE(kinet->log_mu_max.grad().item<double>(), 0.);

  auto p = kinet->current();
  EXPECT_NEAR(p.mu_max(), MonodOptions().mu_max(), 1e-12);
  EXPECT_NEAR(p.Ks(), MonodOptions().Ks(), 1e-12);
}

TEST(MonodOptions, rejects_non_positive_parameters) {
  EXPECT_THROW(Monod(MonodOptions().mu_max(0.)), ConfigurationError);
  EXPECT_THROW(Monod(MonodOptions().Ks(-1.)), ConfigurationError);
  EXPECT_THROW(Monod(MonodOptions().Yxs(0.)), ConfigurationError);
}

BIOKIN_INSTANTIATE_DEVICE_TESTS(MonodTest);

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
