/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "orders/order_limit_verifier.hpp"

#include "common/span.hpp"
#include "orders/order_error.hpp"
#include "orders/signing.hpp"

namespace ps::orders {
  using common::span::cbytes;

  OrderLimitVerifier::OrderLimitVerifier(
      const NodeID &self,
      std::shared_ptr<TrustedSatellites> trust,
      std::shared_ptr<Secp256k1Provider> crypto,
      std::shared_ptr<UTCClock> clock,
      std::shared_ptr<UsedSerials> used_serials,
      std::chrono::seconds grace_period)
      : self_{self},
        trust_{std::move(trust)},
        crypto_{std::move(crypto)},
        clock_{std::move(clock)},
        used_serials_{std::move(used_serials)},
        grace_period_{grace_period} {}

  outcome::result<void> OrderLimitVerifier::verify(
      const OrderLimit &limit, const std::set<PieceAction> &allowed) const {
    auto serial{SerialNumber::fromSpan(cbytes(limit.serial_number()))};
    if (!serial) {
      return OrderError::kMissingSerial;
    }
    if (allowed.count(limit.action()) == 0) {
      return OrderError::kWrongAction;
    }
    auto node{NodeID::fromSpan(cbytes(limit.storage_node_id()))};
    if (!node || node.value() != self_) {
      return OrderError::kWrongStorageNode;
    }

    const auto now{clock_->nowMicro()};
    const auto order_expiration{fromProto(limit.order_expiration())};
    if (order_expiration <= now) {
      return OrderError::kOrderExpired;
    }
    if (isSet(limit.piece_expiration())
        && fromProto(limit.piece_expiration()) <= now) {
      return OrderError::kPieceExpired;
    }
    if (fromProto(limit.order_creation()) < now - grace_period_) {
      return OrderError::kOrderCreationTooOld;
    }

    auto satellite{NodeID::fromSpan(cbytes(limit.satellite_id()))};
    if (!satellite) {
      return OrderError::kUntrustedSatellite;
    }
    OUTCOME_TRY(satellite_key, trust_->publicKey(satellite.value()));
    auto signed_by_satellite{verifyOrderLimit(*crypto_, limit, satellite_key)};
    if (!signed_by_satellite || !signed_by_satellite.value()) {
      return OrderError::kInvalidSatelliteSignature;
    }

    auto uplink_key{publicKeyFromBytes(limit.uplink_public_key())};
    if (!uplink_key || !crypto_->validatePublicKey(uplink_key.value())) {
      return OrderError::kInvalidUplinkKey;
    }

    used_serials_->deleteExpired(now);
    return used_serials_->add(
        satellite.value(), serial.value(), order_expiration);
  }

  outcome::result<void> OrderLimitVerifier::verifyOrder(
      const OrderLimit &limit, const Order &order, int64_t previous_amount)
      const {
    if (order.serial_number() != limit.serial_number()) {
      return OrderError::kInvalidOrder;
    }
    if (order.amount() < previous_amount) {
      return OrderError::kOrderAmountDecreased;
    }
    if (order.amount() > limit.limit()) {
      return OrderError::kOrderAmountExceedsLimit;
    }
    OUTCOME_TRY(uplink_key, publicKeyFromBytes(limit.uplink_public_key()));
    auto signed_by_uplink{orders::verifyOrder(*crypto_, order, uplink_key)};
    if (!signed_by_uplink || !signed_by_uplink.value()) {
      return OrderError::kInvalidOrderSignature;
    }
    return outcome::success();
  }

  const NodeID &OrderLimitVerifier::self() const {
    return self_;
  }
}  // namespace ps::orders
