/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "orders/order_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ps::orders, OrderError, e) {
  using ps::orders::OrderError;
  switch (e) {
    case OrderError::kMissingSerial:
      return "OrderError: order limit has no serial number";
    case OrderError::kWrongAction:
      return "OrderError: action is not allowed for the request";
    case OrderError::kWrongStorageNode:
      return "OrderError: order limit is issued for another storage node";
    case OrderError::kOrderExpired:
      return "OrderError: order limit has expired";
    case OrderError::kPieceExpired:
      return "OrderError: piece expiration is in the past";
    case OrderError::kOrderCreationTooOld:
      return "OrderError: order limit was created too long ago";
    case OrderError::kUntrustedSatellite:
      return "OrderError: satellite is not trusted";
    case OrderError::kInvalidSatelliteSignature:
      return "OrderError: satellite signature is invalid";
    case OrderError::kInvalidUplinkKey:
      return "OrderError: uplink public key is invalid";
    case OrderError::kSerialAlreadyUsed:
      return "OrderError: serial number is already used";
    case OrderError::kInvalidOrder:
      return "OrderError: order does not belong to the order limit";
    case OrderError::kInvalidOrderSignature:
      return "OrderError: order signature is invalid";
    case OrderError::kOrderAmountDecreased:
      return "OrderError: order amount is less than the previous one";
    case OrderError::kOrderAmountExceedsLimit:
      return "OrderError: order amount exceeds the order limit";
  }
  return "OrderError: unknown error";
}
