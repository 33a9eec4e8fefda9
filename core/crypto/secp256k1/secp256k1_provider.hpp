/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "crypto/secp256k1/secp256k1_types.hpp"

namespace ps::crypto::secp256k1 {

  /**
   * Signs and verifies arbitrary messages.
   * Messages are hashed with SHA-256 before signing, public keys are
   * uncompressed and signatures are compact with recovery id.
   */
  class Secp256k1Provider {
   public:
    virtual ~Secp256k1Provider() = default;

    /**
     * @brief Generate private and public keys
     * @return Secp256k1 key pair or error code
     */
    virtual outcome::result<KeyPair> generate() const = 0;

    /**
     * @brief Generate public key from private key
     * @param key - private key for deriving public key
     * @return Derived public key or error code
     */
    virtual outcome::result<PublicKey> derive(const PrivateKey &key) const = 0;

    /**
     * @brief Create signature for a message
     * @param message - data to sign, hashed internally
     * @param key - private key for signing
     * @return Secp256k1 signature or error code
     */
    virtual outcome::result<Signature> sign(BytesIn message,
                                            const PrivateKey &key) const = 0;

    /**
     * @brief Verify signature for a message
     * @param message - signed data
     * @param signature - target for verifying
     * @param key - public key for signature verifying
     * @return false if signature does not match, error if it is malformed
     */
    virtual outcome::result<bool> verify(BytesIn message,
                                         const Signature &signature,
                                         const PublicKey &key) const = 0;

    /**
     * @brief Check that bytes are a valid uncompressed point of the curve
     */
    virtual outcome::result<void> validatePublicKey(
        const PublicKey &key) const = 0;
  };

}  // namespace ps::crypto::secp256k1
