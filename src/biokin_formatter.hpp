#pragma once

// fmt
#include <fmt/format.h>

// biokin
#include "biokin_options.hpp"
#include "kinetics/kinetics_formatter.hpp"
#include "train/evaluation.hpp"
#include "train/trainer.hpp"

template <>
struct fmt::formatter<biokin::EpochRecord> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const biokin::EpochRecord& r, FormatContext& ctx) const {
    return fmt::format_to(
        ctx.out(),
        "Epoch {:4d} | train {:.4e} (data {:.4e}, physics {:.4e}) | "
        "val {:.4e} (data {:.4e}, physics {:.4e}) | lr {:.2e}",
        r.epoch, r.train_total, r.train_data, r.train_physics, r.val_total,
        r.val_data, r.val_physics, r.lr);
  }
};

template <>
struct fmt::formatter<biokin::Metrics> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const biokin::Metrics& m, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(),
                          "(RMSE = {:.4g}; MAE = {:.4g}; R2 = {:.4f}; "
                          "MAPE = {:.2f}%{}; n = {})",
                          m.rmse, m.mae, m.r2, m.mape,
                          m.mape_reliable ? "" : " (unreliable)", m.count);
  }
};

template <>
struct fmt::formatter<biokin::SequencePlan> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const biokin::SequencePlan& p, FormatContext& ctx) const {
    return fmt::format_to(
        ctx.out(),
        "(window_length = {}; horizon = {}; windows = {} [train {}, val {}, "
        "test {}]; batch = [{}, {}, {}]; excluded = {})",
        p.window_length, p.horizon, p.total_windows(), p.split.train,
        p.split.val, p.split.test, p.batch_train, p.batch_val, p.batch_test,
        p.excluded.size());
  }
};

template <>
struct fmt::formatter<biokin::BiokinOptions> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const biokin::BiokinOptions& p, FormatContext& ctx) const {
    auto const& model = p.model();
    auto const& seq = p.sequence();
    auto const& tr = p.trainer();
    return fmt::format_to(
        ctx.out(),
        "(mode = {}; kinetics = {}; integrator = {}/{}; learner = {}x{} "
        "dropout {}; window_length = {}; batch_size = {}; split = {}/{}/{}; "
        "lambda = {}/{}; lr = {}; weight_decay = {}; epochs = {}; "
        "plateau = {}x{}; seed = {})",
        biokin::to_string(model.mode()), model.kinetics(),
        model.integrator().type(), model.integrator().max_step(),
        model.learner().num_layers(), model.learner().hidden_dim(),
        model.learner().dropout(), seq.window_length(), seq.batch_size(),
        seq.train_ratio(), seq.val_ratio(), seq.test_ratio(),
        p.loss().lambda_data(), p.loss().lambda_physics(),
        tr.learning_rate(), tr.weight_decay(), tr.epochs(), tr.lr_patience(),
        tr.lr_factor(), tr.seed());
  }
};
