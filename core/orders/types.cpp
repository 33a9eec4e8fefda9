/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "orders/types.hpp"

#include <google/protobuf/util/time_util.h>

namespace ps::orders {
  using google::protobuf::util::TimeUtil;

  google::protobuf::Timestamp toProto(clock::Timestamp time) {
    return TimeUtil::MicrosecondsToTimestamp(time.count());
  }

  clock::Timestamp fromProto(const google::protobuf::Timestamp &time) {
    return clock::Timestamp{TimeUtil::TimestampToMicroseconds(time)};
  }
}  // namespace ps::orders
