/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_PIECESTORE_TEST_MOCKS_UTC_CLOCK
#define CPP_PIECESTORE_TEST_MOCKS_UTC_CLOCK

#include <gmock/gmock.h>

#include "clock/utc_clock.hpp"

namespace ps::clock {
  class UTCClockMock : public UTCClock {
   public:
    MOCK_CONST_METHOD0(nowMicro, microseconds());
  };
}  // namespace ps::clock

#endif  // CPP_PIECESTORE_TEST_MOCKS_UTC_CLOCK
