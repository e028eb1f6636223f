#pragma once

// fmt
#include <fmt/format.h>

// biokin
#include "monod.hpp"

template <>
struct fmt::formatter<biokin::MonodOptions> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const biokin::MonodOptions& p, FormatContext& ctx) const {
    return fmt::format_to(
        ctx.out(),
        "(mu_max = {:.4g}; Ks = {:.4g}; Yxs = {:.4g}; Yps = {:.4g}; "
        "qp_max = {:.4g}; trainable = {})",
        p.mu_max(), p.Ks(), p.Yxs(), p.Yps(), p.qp_max(), p.trainable());
  }
};
