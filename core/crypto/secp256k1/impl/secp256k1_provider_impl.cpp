/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include "crypto/secp256k1/secp256k1_error.hpp"
#include "crypto/sha/sha256.hpp"
#include "secp256k1_recovery.h"

namespace ps::crypto::secp256k1 {
  using sha::Hash256;
  using sha::sha256;

  Secp256k1ProviderImpl::Secp256k1ProviderImpl()
      : context_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                          | SECP256K1_CONTEXT_VERIFY),
                 secp256k1_context_destroy) {}

  outcome::result<KeyPair> Secp256k1ProviderImpl::generate() const {
    std::shared_ptr<EC_KEY> key{EC_KEY_new_by_curve_name(NID_secp256k1),
                                EC_KEY_free};
    if (!key || EC_KEY_generate_key(key.get()) != 1) {
      return Secp256k1Error::kKeyGenerationFailed;
    }
    KeyPair pair{};
    const BIGNUM *private_num = EC_KEY_get0_private_key(key.get());
    if (BN_bn2binpad(private_num,
                     pair.private_key.data(),
                     static_cast<int>(pair.private_key.size()))
        < 0) {
      return Secp256k1Error::kKeyGenerationFailed;
    }
    OUTCOME_TRYA(pair.public_key, derive(pair.private_key));
    return pair;
  }

  outcome::result<PublicKey> Secp256k1ProviderImpl::derive(
      const PrivateKey &key) const {
    secp256k1_pubkey pubkey;
    if (!secp256k1_ec_pubkey_create(context_.get(), &pubkey, key.data())) {
      return Secp256k1Error::kKeyGenerationFailed;
    }

    PublicKey public_key{};
    size_t outputlen = public_key.size();
    if (!secp256k1_ec_pubkey_serialize(context_.get(),
                                       public_key.data(),
                                       &outputlen,
                                       &pubkey,
                                       SECP256K1_EC_UNCOMPRESSED)) {
      return Secp256k1Error::kPubkeySerializationError;
    }
    return public_key;
  }

  outcome::result<Signature> Secp256k1ProviderImpl::sign(
      BytesIn message, const PrivateKey &key) const {
    const Hash256 digest{sha256(message)};
    secp256k1_ecdsa_recoverable_signature sig_struct;
    if (!secp256k1_ecdsa_sign_recoverable(context_.get(),
                                          &sig_struct,
                                          digest.data(),
                                          key.data(),
                                          secp256k1_nonce_function_rfc6979,
                                          nullptr)) {
      return Secp256k1Error::kCannotSignError;
    }
    Signature signature{};
    int recid = 0;
    if (!secp256k1_ecdsa_recoverable_signature_serialize_compact(
            context_.get(), signature.data(), &recid, &sig_struct)) {
      return Secp256k1Error::kSignatureSerializationError;
    }
    signature[64] = static_cast<uint8_t>(recid);
    return signature;
  }

  outcome::result<bool> Secp256k1ProviderImpl::verify(
      BytesIn message, const Signature &signature, const PublicKey &key) const {
    if (signature[64] > 3) {
      return Secp256k1Error::kSignatureParseError;
    }
    secp256k1_ecdsa_signature sig;
    if (!secp256k1_ecdsa_signature_parse_compact(
            context_.get(), &sig, signature.data())) {
      return Secp256k1Error::kSignatureParseError;
    }
    OUTCOME_TRY(pubkey, parsePublicKey(key));
    const Hash256 digest{sha256(message)};
    return secp256k1_ecdsa_verify(context_.get(), &sig, digest.data(), &pubkey)
           == 1;
  }

  outcome::result<void> Secp256k1ProviderImpl::validatePublicKey(
      const PublicKey &key) const {
    OUTCOME_TRY(parsePublicKey(key));
    return outcome::success();
  }

  outcome::result<secp256k1_pubkey> Secp256k1ProviderImpl::parsePublicKey(
      const PublicKey &key) const {
    secp256k1_pubkey pubkey;
    if (!secp256k1_ec_pubkey_parse(
            context_.get(), &pubkey, key.data(), key.size())) {
      return Secp256k1Error::kPubkeyParseError;
    }
    return pubkey;
  }

}  // namespace ps::crypto::secp256k1
