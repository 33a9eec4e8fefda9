/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/node_id/node_id.hpp"

#include <algorithm>

#include "codec/base32/base32.hpp"
#include "crypto/sha/sha256.hpp"

namespace ps::primitives {

  NodeID NodeID::fromPublicKey(const crypto::secp256k1::PublicKey &key) {
    return NodeID{crypto::sha::sha256(key)};
  }

  outcome::result<NodeID> NodeID::fromSpan(BytesIn bytes) {
    if (bytes.size() != kNodeIdLength) {
      return NodeIdError::kInvalidLength;
    }
    NodeID id;
    std::copy(bytes.begin(), bytes.end(), id.begin());
    return id;
  }

  outcome::result<NodeID> NodeID::fromString(std::string_view str) {
    auto bytes{codec::base32::decode(str)};
    if (!bytes) {
      return NodeIdError::kInvalidEncoding;
    }
    return fromSpan(bytes.value());
  }

  std::string NodeID::toString() const {
    return codec::base32::encode(*this);
  }

  bool NodeID::isZero() const {
    return std::all_of(begin(), end(), [](auto b) { return b == 0; });
  }

}  // namespace ps::primitives

OUTCOME_CPP_DEFINE_CATEGORY(ps::primitives, NodeIdError, e) {
  using ps::primitives::NodeIdError;
  switch (e) {
    case NodeIdError::kInvalidLength:
      return "NodeIdError: node id must be 32 bytes";
    case NodeIdError::kInvalidEncoding:
      return "NodeIdError: node id is not valid base32";
  }
  return "NodeIdError: unknown error";
}
