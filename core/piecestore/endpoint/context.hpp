/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/utc_clock.hpp"
#include "common/logger.hpp"
#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "orders/order_limit_verifier.hpp"
#include "orders/unsent_orders.hpp"
#include "piecestore/config.hpp"
#include "piecestore/pieces/piece_locks.hpp"
#include "piecestore/pieces/piece_store.hpp"
#include "piecestore/trust/trusted_satellites.hpp"

namespace ps::piecestore::endpoint {
  using clock::UTCClock;
  using crypto::secp256k1::KeyPair;
  using crypto::secp256k1::Secp256k1Provider;
  using orders::OrderLimitVerifier;
  using orders::UnsentOrders;
  using pieces::PieceLocks;
  using pieces::PieceStore;
  using primitives::NodeID;
  using primitives::piece::PieceID;
  using trust::TrustedSatellites;

  /// State shared by the endpoint and its sessions
  struct EndpointContext {
    Config config;
    KeyPair identity;
    NodeID self;
    std::shared_ptr<Secp256k1Provider> crypto;
    std::shared_ptr<UTCClock> clock;
    std::shared_ptr<TrustedSatellites> trust;
    std::shared_ptr<OrderLimitVerifier> verifier;
    std::shared_ptr<PieceStore> store;
    std::shared_ptr<PieceLocks> locks;
    std::shared_ptr<UnsentOrders> unsent_orders;
    common::Logger logger;
  };
}  // namespace ps::piecestore::endpoint
