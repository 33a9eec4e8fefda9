/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "orders/signing.hpp"

#include <algorithm>

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include "common/span.hpp"
#include "crypto/secp256k1/secp256k1_error.hpp"

namespace ps::orders {
  using common::span::cbytes;
  using crypto::secp256k1::Secp256k1Error;

  Bytes serializeDeterministic(const google::protobuf::MessageLite &message) {
    std::string out;
    message.ByteSizeLong();
    {
      google::protobuf::io::StringOutputStream stream{&out};
      google::protobuf::io::CodedOutputStream coded{&stream};
      coded.SetSerializationDeterministic(true);
      message.SerializeWithCachedSizes(&coded);
    }
    return copy(cbytes(out));
  }

  Bytes signingBytes(const OrderLimit &limit) {
    auto unsigned_limit{limit};
    unsigned_limit.clear_satellite_signature();
    return serializeDeterministic(unsigned_limit);
  }

  Bytes signingBytes(const Order &order) {
    auto unsigned_order{order};
    unsigned_order.clear_uplink_signature();
    return serializeDeterministic(unsigned_order);
  }

  Bytes signingBytes(const PieceHash &hash) {
    auto unsigned_hash{hash};
    unsigned_hash.clear_signature();
    return serializeDeterministic(unsigned_hash);
  }

  outcome::result<PublicKey> publicKeyFromBytes(const std::string &bytes) {
    PublicKey key;
    if (bytes.size() != key.size()) {
      return Secp256k1Error::kInvalidLength;
    }
    std::copy(bytes.begin(), bytes.end(), key.begin());
    return key;
  }

  outcome::result<Signature> signatureFromBytes(const std::string &bytes) {
    Signature signature;
    if (bytes.size() != signature.size()) {
      return Secp256k1Error::kInvalidLength;
    }
    std::copy(bytes.begin(), bytes.end(), signature.begin());
    return signature;
  }

  namespace {
    template <typename Message>
    outcome::result<std::string> sign(const Secp256k1Provider &provider,
                                      const PrivateKey &key,
                                      const Message &message) {
      OUTCOME_TRY(signature, provider.sign(signingBytes(message), key));
      return common::span::toString(signature);
    }

    template <typename Message>
    outcome::result<bool> verify(const Secp256k1Provider &provider,
                                 const Message &message,
                                 const std::string &signature_bytes,
                                 const PublicKey &key) {
      auto signature{signatureFromBytes(signature_bytes)};
      if (!signature) {
        return false;
      }
      return provider.verify(signingBytes(message), signature.value(), key);
    }
  }  // namespace

  outcome::result<void> signOrderLimit(const Secp256k1Provider &provider,
                                       const PrivateKey &key,
                                       OrderLimit &limit) {
    OUTCOME_TRY(signature, sign(provider, key, limit));
    limit.set_satellite_signature(std::move(signature));
    return outcome::success();
  }

  outcome::result<void> signOrder(const Secp256k1Provider &provider,
                                  const PrivateKey &key,
                                  Order &order) {
    OUTCOME_TRY(signature, sign(provider, key, order));
    order.set_uplink_signature(std::move(signature));
    return outcome::success();
  }

  outcome::result<void> signPieceHash(const Secp256k1Provider &provider,
                                      const PrivateKey &key,
                                      PieceHash &hash) {
    OUTCOME_TRY(signature, sign(provider, key, hash));
    hash.set_signature(std::move(signature));
    return outcome::success();
  }

  outcome::result<bool> verifyOrderLimit(const Secp256k1Provider &provider,
                                         const OrderLimit &limit,
                                         const PublicKey &key) {
    return verify(provider, limit, limit.satellite_signature(), key);
  }

  outcome::result<bool> verifyOrder(const Secp256k1Provider &provider,
                                    const Order &order,
                                    const PublicKey &key) {
    return verify(provider, order, order.uplink_signature(), key);
  }

  outcome::result<bool> verifyPieceHash(const Secp256k1Provider &provider,
                                        const PieceHash &hash,
                                        const PublicKey &key) {
    return verify(provider, hash, hash.signature(), key);
  }
}  // namespace ps::orders
