/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ps::orders {

  /// Authorization failures of order limits and orders
  enum class OrderError {
    kMissingSerial = 1,
    kWrongAction,
    kWrongStorageNode,
    kOrderExpired,
    kPieceExpired,
    kOrderCreationTooOld,
    kUntrustedSatellite,
    kInvalidSatelliteSignature,
    kInvalidUplinkKey,
    kSerialAlreadyUsed,
    kInvalidOrder,
    kInvalidOrderSignature,
    kOrderAmountDecreased,
    kOrderAmountExceedsLimit,
  };

}  // namespace ps::orders

OUTCOME_HPP_DECLARE_ERROR(ps::orders, OrderError);
