/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "common/logger.hpp"
#include "orders/types.hpp"
#include "primitives/node_id/node_id.hpp"

namespace ps::orders {
  using primitives::NodeID;

  /// Largest order of a finished transfer with its limit
  struct OrderInfo {
    OrderLimit limit;
    Order order;
  };

  /**
   * Orders waiting for settlement with their satellites.
   * Orders whose limit expired cannot be settled and are dropped, when the
   * queue is full the order expiring first is dropped.
   */
  class UnsentOrders {
   public:
    static constexpr size_t kDefaultMaxOrders{10000};

    explicit UnsentOrders(size_t max_orders = kDefaultMaxOrders);

    /**
     * Queue order, expired orders are pruned first
     * @param info - order with its limit
     * @param now - current time, orders expiring at or before it are dropped
     */
    outcome::result<void> enqueue(OrderInfo info, clock::Timestamp now);

    /// Orders of the satellite by expiration, left in the queue
    std::vector<OrderInfo> list(const NodeID &satellite) const;

    /// Orders of the satellite by expiration, removed from the queue
    std::vector<OrderInfo> take(const NodeID &satellite);

    size_t size() const;

   private:
    struct Entry {
      NodeID satellite;
      OrderInfo info;
    };

    size_t max_orders_;
    mutable std::mutex mutex_;
    /// Keyed by order expiration
    std::multimap<clock::Timestamp, Entry> orders_;
    common::Logger logger_;
  };
}  // namespace ps::orders
