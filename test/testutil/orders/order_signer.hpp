/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_PIECESTORE_TEST_TESTUTIL_ORDER_SIGNER_HPP
#define CPP_PIECESTORE_TEST_TESTUTIL_ORDER_SIGNER_HPP

#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "orders/types.hpp"
#include "piecestore/trust/trusted_satellites.hpp"
#include "primitives/node_id/node_id.hpp"
#include "primitives/piece/piece_id.hpp"

namespace testutils {
  using ps::Bytes;
  using ps::clock::Timestamp;
  using ps::crypto::secp256k1::KeyPair;
  using ps::crypto::secp256k1::Secp256k1Provider;
  using ps::orders::Order;
  using ps::orders::OrderLimit;
  using ps::orders::PieceAction;
  using ps::orders::PieceHash;
  using ps::orders::PieceHashAlgorithm;
  using ps::primitives::NodeID;
  using ps::primitives::piece::PieceID;

  /// Random secp256k1 identity
  struct Identity {
    explicit Identity(const Secp256k1Provider &crypto);

    KeyPair keys;
    NodeID id;
  };

  /**
   * Satellite issuing order limits for tests
   */
  class SatelliteSigner {
   public:
    explicit SatelliteSigner(std::shared_ptr<Secp256k1Provider> crypto);

    const NodeID &id() const;

    ps::piecestore::trust::SatelliteInfo info() const;

    /**
     * Signed limit valid for an hour from now
     * @param now - creation time
     */
    OrderLimit limit(const NodeID &node,
                     const PieceID &piece,
                     PieceAction action,
                     int64_t amount,
                     const KeyPair &uplink,
                     Timestamp now) const;

    /// Sign again after fields were changed
    void sign(OrderLimit &limit) const;

   private:
    std::shared_ptr<Secp256k1Provider> crypto_;
    Identity identity_;
  };

  /**
   * Uplink signing orders and piece hashes for tests
   */
  class UplinkSigner {
   public:
    explicit UplinkSigner(std::shared_ptr<Secp256k1Provider> crypto);

    const KeyPair &keys() const;

    Order order(const OrderLimit &limit, int64_t amount) const;

    PieceHash pieceHash(const PieceID &piece,
                        const Bytes &hash,
                        int64_t size,
                        PieceHashAlgorithm algorithm,
                        Timestamp now) const;

    /// Sign again after fields were changed
    void sign(PieceHash &hash) const;

   private:
    std::shared_ptr<Secp256k1Provider> crypto_;
    Identity identity_;
  };
}  // namespace testutils

#endif  // CPP_PIECESTORE_TEST_TESTUTIL_ORDER_SIGNER_HPP
