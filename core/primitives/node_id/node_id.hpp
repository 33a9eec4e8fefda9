/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/blob.hpp"
#include "crypto/secp256k1/secp256k1_types.hpp"

namespace ps::primitives {

  enum class NodeIdError {
    kInvalidLength = 1,
    kInvalidEncoding,
  };

  constexpr size_t kNodeIdLength = 32;

  /**
   * Identity of a storage node or a satellite, hash of its public key
   */
  struct NodeID : public common::Blob<kNodeIdLength> {
    using Blob::Blob;

    /// SHA-256 of the uncompressed identity key
    static NodeID fromPublicKey(const crypto::secp256k1::PublicKey &key);

    static outcome::result<NodeID> fromSpan(BytesIn bytes);

    static outcome::result<NodeID> fromString(std::string_view str);

    /// Unpadded base32, upper case
    std::string toString() const;

    bool isZero() const;
  };

}  // namespace ps::primitives

template <>
struct std::hash<ps::primitives::NodeID>
    : std::hash<ps::common::Blob<ps::primitives::kNodeIdLength>> {};

OUTCOME_HPP_DECLARE_ERROR(ps::primitives, NodeIdError);
