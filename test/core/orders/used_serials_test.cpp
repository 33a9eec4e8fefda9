/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "orders/used_serials.hpp"

#include <gtest/gtest.h>

#include "orders/order_error.hpp"
#include "testutil/outcome.hpp"

namespace ps::orders {
  using clock::Timestamp;

  class UsedSerialsTest : public ::testing::Test {
   public:
    NodeID satellite{NodeID::fromSpan(Bytes(32, 1)).value()};
    NodeID other{NodeID::fromSpan(Bytes(32, 2)).value()};
    SerialNumber serial{SerialNumber::fromSpan(Bytes(16, 7)).value()};
    UsedSerials serials;
  };

  /**
   * @given serial added for satellite
   * @when add same pair again
   * @then serial already used, other satellite may use same serial
   */
  TEST_F(UsedSerialsTest, Unique) {
    EXPECT_OUTCOME_TRUE_1(serials.add(satellite, serial, Timestamp{100}));
    EXPECT_OUTCOME_ERROR(OrderError::kSerialAlreadyUsed,
                         serials.add(satellite, serial, Timestamp{200}));
    EXPECT_OUTCOME_TRUE_1(serials.add(other, serial, Timestamp{100}));
    EXPECT_TRUE(serials.exists(satellite, serial));
    EXPECT_EQ(serials.size(), 2);
  }

  /**
   * @given serials with different expirations
   * @when delete expired
   * @then only serials expired before now are removed
   */
  TEST_F(UsedSerialsTest, DeleteExpired) {
    EXPECT_OUTCOME_TRUE_1(serials.add(satellite, serial, Timestamp{100}));
    EXPECT_OUTCOME_TRUE_1(serials.add(other, serial, Timestamp{300}));
    serials.deleteExpired(Timestamp{200});
    EXPECT_FALSE(serials.exists(satellite, serial));
    EXPECT_TRUE(serials.exists(other, serial));
    EXPECT_EQ(serials.size(), 1);

    serials.deleteExpired(Timestamp{300});
    EXPECT_EQ(serials.size(), 1);
    serials.deleteExpired(Timestamp{301});
    EXPECT_EQ(serials.size(), 0);
    EXPECT_OUTCOME_TRUE_1(serials.add(satellite, serial, Timestamp{400}));
    EXPECT_EQ(serials.size(), 1);
  }
}  // namespace ps::orders
