/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "crypto/secp256k1/secp256k1_types.hpp"
#include "primitives/node_id/node_id.hpp"

namespace ps::piecestore::trust {
  using crypto::secp256k1::PublicKey;
  using primitives::NodeID;

  enum class TrustError {
    kInvalidSatelliteUrl = 1,
  };

  struct SatelliteInfo {
    NodeID id;
    PublicKey public_key{};
    std::string address;
  };

  /**
   * Parse "<uncompressed public key hex>@<host:port>"
   */
  outcome::result<SatelliteInfo> parseSatelliteUrl(const std::string &url);

  /**
   * Satellites allowed to issue order limits and maintenance requests
   */
  class TrustedSatellites {
   public:
    void add(const SatelliteInfo &satellite);

    void remove(const NodeID &id);

    bool isTrusted(const NodeID &id) const;

    /// OrderError::kUntrustedSatellite for unknown ids
    outcome::result<PublicKey> publicKey(const NodeID &id) const;

    std::vector<NodeID> satellites() const;

   private:
    mutable std::shared_mutex mutex_;
    std::map<NodeID, SatelliteInfo> satellites_;
  };
}  // namespace ps::piecestore::trust

OUTCOME_HPP_DECLARE_ERROR(ps::piecestore::trust, TrustError);
