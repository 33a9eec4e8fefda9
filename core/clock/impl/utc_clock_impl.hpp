/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/utc_clock.hpp"

namespace ps::clock {
  /// System clock
  class UTCClockImpl final : public UTCClock {
   public:
    Timestamp nowMicro() const override;
  };
}  // namespace ps::clock
