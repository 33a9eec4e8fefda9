/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <google/protobuf/timestamp.pb.h>

#include "clock/time.hpp"
#include "common/blob.hpp"
#include "orders/protobuf/orders.pb.h"

namespace ps::orders {
  using pb::Order;
  using pb::OrderLimit;
  using pb::PieceAction;
  using pb::PieceHash;
  using pb::PieceHashAlgorithm;

  constexpr size_t kSerialNumberLength = 16;

  using SerialNumber = common::Blob<kSerialNumberLength>;

  /// Protobuf timestamp of an instant, microseconds precision
  google::protobuf::Timestamp toProto(clock::Timestamp time);

  clock::Timestamp fromProto(const google::protobuf::Timestamp &time);

  /// Unset protobuf timestamp means "never"
  inline bool isSet(const google::protobuf::Timestamp &time) {
    return time.seconds() != 0 || time.nanos() != 0;
  }
}  // namespace ps::orders
