/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>

#include "orders/types.hpp"
#include "primitives/node_id/node_id.hpp"

namespace ps::orders {
  using primitives::NodeID;

  /**
   * Serial numbers of order limits already seen, kept until the limit expires.
   * Expired serials are forgotten by deleteExpired, a replay of one is
   * rejected by the expiration check of its limit.
   */
  class UsedSerials {
   public:
    /// OrderError::kSerialAlreadyUsed if the pair is known
    outcome::result<void> add(const NodeID &satellite,
                              const SerialNumber &serial,
                              clock::Timestamp expiration);

    bool exists(const NodeID &satellite, const SerialNumber &serial) const;

    /// Forget serials which expired before now
    void deleteExpired(clock::Timestamp now);

    size_t size() const;

   private:
    using Key = std::pair<NodeID, SerialNumber>;

    mutable std::mutex mutex_;
    std::map<Key, clock::Timestamp> serials_;
    /// Expiration index of serials_
    std::multimap<clock::Timestamp, Key> expirations_;
  };
}  // namespace ps::orders
