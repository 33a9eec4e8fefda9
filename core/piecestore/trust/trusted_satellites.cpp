/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/trust/trusted_satellites.hpp"

#include <algorithm>
#include <mutex>

#include "common/hexutil.hpp"
#include "orders/order_error.hpp"

namespace ps::piecestore::trust {
  using orders::OrderError;

  outcome::result<SatelliteInfo> parseSatelliteUrl(const std::string &url) {
    const auto at{url.find('@')};
    if (at == std::string::npos || at + 1 == url.size()) {
      return TrustError::kInvalidSatelliteUrl;
    }
    auto key{common::unhex(std::string_view{url}.substr(0, at))};
    if (!key || key.value().size() != PublicKey{}.size()) {
      return TrustError::kInvalidSatelliteUrl;
    }
    SatelliteInfo info;
    std::copy(key.value().begin(), key.value().end(), info.public_key.begin());
    info.id = NodeID::fromPublicKey(info.public_key);
    info.address = url.substr(at + 1);
    return info;
  }

  void TrustedSatellites::add(const SatelliteInfo &satellite) {
    std::unique_lock lock{mutex_};
    satellites_[satellite.id] = satellite;
  }

  void TrustedSatellites::remove(const NodeID &id) {
    std::unique_lock lock{mutex_};
    satellites_.erase(id);
  }

  bool TrustedSatellites::isTrusted(const NodeID &id) const {
    std::shared_lock lock{mutex_};
    return satellites_.count(id) != 0;
  }

  outcome::result<PublicKey> TrustedSatellites::publicKey(
      const NodeID &id) const {
    std::shared_lock lock{mutex_};
    auto it{satellites_.find(id)};
    if (it == satellites_.end()) {
      return OrderError::kUntrustedSatellite;
    }
    return it->second.public_key;
  }

  std::vector<NodeID> TrustedSatellites::satellites() const {
    std::shared_lock lock{mutex_};
    std::vector<NodeID> ids;
    ids.reserve(satellites_.size());
    for (const auto &[id, info] : satellites_) {
      ids.push_back(id);
    }
    return ids;
  }
}  // namespace ps::piecestore::trust

OUTCOME_CPP_DEFINE_CATEGORY(ps::piecestore::trust, TrustError, e) {
  using ps::piecestore::trust::TrustError;
  switch (e) {
    case TrustError::kInvalidSatelliteUrl:
      return "TrustError: satellite url must be <public key hex>@<address>";
  }
  return "TrustError: unknown error";
}
