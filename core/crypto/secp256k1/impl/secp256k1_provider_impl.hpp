/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "secp256k1.h"

namespace ps::crypto::secp256k1 {

  /**
   * libsecp256k1 backed provider, keys are generated with OpenSSL
   */
  class Secp256k1ProviderImpl : public Secp256k1Provider {
   public:
    Secp256k1ProviderImpl();

    outcome::result<KeyPair> generate() const override;

    outcome::result<PublicKey> derive(const PrivateKey &key) const override;

    outcome::result<Signature> sign(BytesIn message,
                                    const PrivateKey &key) const override;

    outcome::result<bool> verify(BytesIn message,
                                 const Signature &signature,
                                 const PublicKey &key) const override;

    outcome::result<void> validatePublicKey(
        const PublicKey &key) const override;

   private:
    outcome::result<secp256k1_pubkey> parsePublicKey(
        const PublicKey &key) const;

    std::unique_ptr<secp256k1_context, void (*)(secp256k1_context *)> context_;
  };

}  // namespace ps::crypto::secp256k1
