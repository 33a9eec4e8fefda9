/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <google/protobuf/message_lite.h>

#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "orders/types.hpp"

/**
 * Signatures of order limits, orders and piece hashes.
 * Signed bytes are the deterministic serialization of a message with its
 * signature field cleared.
 */
namespace ps::orders {
  using crypto::secp256k1::PrivateKey;
  using crypto::secp256k1::PublicKey;
  using crypto::secp256k1::Secp256k1Provider;
  using crypto::secp256k1::Signature;

  /// Deterministic protobuf encoding, stable across runs
  Bytes serializeDeterministic(const google::protobuf::MessageLite &message);

  Bytes signingBytes(const OrderLimit &limit);
  Bytes signingBytes(const Order &order);
  Bytes signingBytes(const PieceHash &hash);

  outcome::result<PublicKey> publicKeyFromBytes(const std::string &bytes);
  outcome::result<Signature> signatureFromBytes(const std::string &bytes);

  /// Fill satellite_signature
  outcome::result<void> signOrderLimit(const Secp256k1Provider &provider,
                                       const PrivateKey &key,
                                       OrderLimit &limit);

  /// Fill uplink_signature
  outcome::result<void> signOrder(const Secp256k1Provider &provider,
                                  const PrivateKey &key,
                                  Order &order);

  /// Fill signature, used by uplinks and storage nodes alike
  outcome::result<void> signPieceHash(const Secp256k1Provider &provider,
                                      const PrivateKey &key,
                                      PieceHash &hash);

  /**
   * Check a signature made by one of the sign functions
   * @return false for a well-formed signature which does not match
   */
  outcome::result<bool> verifyOrderLimit(const Secp256k1Provider &provider,
                                         const OrderLimit &limit,
                                         const PublicKey &key);

  outcome::result<bool> verifyOrder(const Secp256k1Provider &provider,
                                    const Order &order,
                                    const PublicKey &key);

  outcome::result<bool> verifyPieceHash(const Secp256k1Provider &provider,
                                        const PieceHash &hash,
                                        const PublicKey &key);
}  // namespace ps::orders
