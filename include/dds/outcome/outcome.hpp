/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/outcome/result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <string_view>

#include <fmt/format.h>

// OUTCOME_TRY(expr) propagates a failure, OUTCOME_TRY(name, expr) also binds
// the value to a new variable
#define OUTCOME_TRY(...) BOOST_OUTCOME_TRY(__VA_ARGS__)

#include <dds/outcome/outcome-register.hpp>

namespace outcome {
  using namespace BOOST_OUTCOME_V2_NAMESPACE;  // NOLINT

  template <class R,
            class S = std::error_code,
            class NoValuePolicy = policy::default_policy<R, S, void>>  //
  using result = basic_result<R, S, NoValuePolicy>;

}  // namespace outcome

/// Renders the error message, e.g. log_->warn("{}", result.error())
template <>
struct fmt::formatter<std::error_code> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const std::error_code &ec, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(ec.message(), ctx);
  }
};
