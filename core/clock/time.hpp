/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include "common/outcome.hpp"

namespace ps::clock {
  enum class TimeFromStringError { kInvalidFormat = 1 };

  using UnixTime = std::chrono::seconds;
  using std::chrono::microseconds;

  /// UTC instant with microsecond precision, counted from unix epoch
  using Timestamp = microseconds;

  /// "2020-01-02T03:04:05.000006Z", fraction omitted when zero
  std::string timestampToString(Timestamp time);

  /**
   * Parse ISO 8601 extended UTC time
   * @param str - "2020-01-02T03:04:05Z" with optional fraction of second
   */
  outcome::result<Timestamp> timestampFromString(const std::string &str);
}  // namespace ps::clock

OUTCOME_HPP_DECLARE_ERROR(ps::clock, TimeFromStringError);
