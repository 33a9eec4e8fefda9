/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/time.hpp"

namespace ps::clock {
  /// Wall clock of the node, source of order and trash timestamps
  class UTCClock {
   public:
    virtual ~UTCClock() = default;

    virtual Timestamp nowMicro() const = 0;

    /// Seconds precision, used for file modification times
    UnixTime nowUTC() const {
      return std::chrono::duration_cast<UnixTime>(nowMicro());
    }
  };
}  // namespace ps::clock
