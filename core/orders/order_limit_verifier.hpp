/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <set>

#include "clock/utc_clock.hpp"
#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "orders/types.hpp"
#include "orders/used_serials.hpp"
#include "piecestore/trust/trusted_satellites.hpp"

namespace ps::orders {
  using clock::UTCClock;
  using crypto::secp256k1::Secp256k1Provider;
  using piecestore::trust::TrustedSatellites;

  /**
   * Authorizes order limits and orders presented to the storage node
   */
  class OrderLimitVerifier {
   public:
    OrderLimitVerifier(const NodeID &self,
                       std::shared_ptr<TrustedSatellites> trust,
                       std::shared_ptr<Secp256k1Provider> crypto,
                       std::shared_ptr<UTCClock> clock,
                       std::shared_ptr<UsedSerials> used_serials,
                       std::chrono::seconds grace_period);

    /**
     * Check limit and mark its serial as used.
     * Checks are done in order: serial, action, storage node, order
     * expiration, piece expiration, creation time, trust, satellite
     * signature, uplink key, serial reuse. Expired serials are pruned
     * before the serial is recorded.
     * @param limit - order limit signed by satellite
     * @param allowed - actions acceptable for the request
     */
    outcome::result<void> verify(const OrderLimit &limit,
                                 const std::set<PieceAction> &allowed) const;

    /**
     * Check order of an already verified limit
     * @param previous_amount - largest amount accepted in the session
     */
    outcome::result<void> verifyOrder(const OrderLimit &limit,
                                      const Order &order,
                                      int64_t previous_amount) const;

    const NodeID &self() const;

   private:
    NodeID self_;
    std::shared_ptr<TrustedSatellites> trust_;
    std::shared_ptr<Secp256k1Provider> crypto_;
    std::shared_ptr<UTCClock> clock_;
    std::shared_ptr<UsedSerials> used_serials_;
    std::chrono::seconds grace_period_;
  };
}  // namespace ps::orders
