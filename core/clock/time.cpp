/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/time.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

namespace ps::clock {
  namespace pt = boost::posix_time;

  namespace {
    /// "YYYY-MM-DDTHH:MM:SSZ"
    constexpr size_t kMinLength = 20;

    const pt::ptime kEpoch{boost::gregorian::date{1970, 1, 1}};
  }  // namespace

  std::string timestampToString(Timestamp time) {
    return pt::to_iso_extended_string(kEpoch + pt::microseconds{time.count()})
           + "Z";
  }

  outcome::result<Timestamp> timestampFromString(const std::string &str) {
    if (str.size() < kMinLength || str.back() != 'Z') {
      return TimeFromStringError::kInvalidFormat;
    }
    pt::ptime time;
    try {
      time = pt::from_iso_extended_string(str.substr(0, str.size() - 1));
    } catch (const std::exception &) {
      return TimeFromStringError::kInvalidFormat;
    }
    if (time.is_special()) {
      return TimeFromStringError::kInvalidFormat;
    }
    return Timestamp{(time - kEpoch).total_microseconds()};
  }
}  // namespace ps::clock

OUTCOME_CPP_DEFINE_CATEGORY(ps::clock, TimeFromStringError, e) {
  using ps::clock::TimeFromStringError;
  switch (e) {
    case TimeFromStringError::kInvalidFormat:
      return "TimeFromStringError: expected YYYY-MM-DDTHH:MM:SS[.ffffff]Z";
  }
  return "TimeFromStringError: unknown error";
}
