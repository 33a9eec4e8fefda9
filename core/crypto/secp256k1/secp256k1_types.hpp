/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>

namespace ps::crypto::secp256k1 {

  static const size_t kPrivateKeyLength = 32;
  static const size_t kPublicKeyLength = 65;
  static const size_t kMessageHashLength = 32;
  static const size_t kSignatureLength = 65;

  using PrivateKey = std::array<uint8_t, kPrivateKeyLength>;

  /// Public key in uncompressed form, 0x04 prefix
  using PublicKey = std::array<uint8_t, kPublicKeyLength>;

  /**
   * Compact ECDSA signature with the recovery id in the last byte
   */
  using Signature = std::array<uint8_t, kSignatureLength>;

  struct KeyPair {
    PrivateKey private_key;
    PublicKey public_key;

    bool operator==(const KeyPair &other) const {
      return private_key == other.private_key && public_key == other.public_key;
    }

    bool operator!=(const KeyPair &other) const {
      return !(*this == other);
    }
  };
}  // namespace ps::crypto::secp256k1
