/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/throw_exception.hpp>
#include <libp2p/outcome/outcome.hpp>

/**
 * Assign value of result expression to existing lvalue or return error
 * OUTCOME_TRYA(member_, expr);
 */
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_TRYA(var, val, ...) \
  OUTCOME_TRY(var, __VA_ARGS__);     \
  val = std::move(var);
#define OUTCOME_TRYA(val, ...) \
  _OUTCOME_TRYA(BOOST_OUTCOME_TRY_UNIQUE_NAME, val, __VA_ARGS__)

namespace ps::outcome {
  using libp2p::outcome::failure;
  using libp2p::outcome::result;
  using libp2p::outcome::success;

  /// Throw error enum value as std::system_error
  template <typename T,
            typename = std::enable_if_t<std::is_error_code_enum_v<T>>>
  [[noreturn]] inline void raise(T t) {
    boost::throw_exception(std::system_error{make_error_code(t)});
  }
}  // namespace ps::outcome
