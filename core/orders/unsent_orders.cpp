/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "orders/unsent_orders.hpp"

#include "common/hexutil.hpp"
#include "common/span.hpp"

namespace ps::orders {

  UnsentOrders::UnsentOrders(size_t max_orders)
      : max_orders_{max_orders}, logger_{common::createLogger("orders")} {}

  outcome::result<void> UnsentOrders::enqueue(OrderInfo info,
                                              clock::Timestamp now) {
    OUTCOME_TRY(satellite,
                NodeID::fromSpan(
                    common::span::cbytes(info.limit.satellite_id())));
    const auto expiration{fromProto(info.limit.order_expiration())};

    std::lock_guard lock{mutex_};
    orders_.erase(orders_.begin(), orders_.upper_bound(now));
    if (expiration <= now) {
      logger_->debug("order {} of {} expired before it was queued",
                     common::hex_lower(
                         common::span::cbytes(info.order.serial_number())),
                     satellite.toString());
      return outcome::success();
    }
    if (!orders_.empty() && orders_.size() >= max_orders_) {
      const auto &dropped{orders_.begin()->second};
      logger_->warn("{} unsent orders queued, dropping order of {}",
                    orders_.size(),
                    dropped.satellite.toString());
      orders_.erase(orders_.begin());
    }
    orders_.emplace(expiration, Entry{satellite, std::move(info)});
    return outcome::success();
  }

  std::vector<OrderInfo> UnsentOrders::list(const NodeID &satellite) const {
    std::lock_guard lock{mutex_};
    std::vector<OrderInfo> orders;
    for (const auto &[expiration, entry] : orders_) {
      if (entry.satellite == satellite) {
        orders.push_back(entry.info);
      }
    }
    return orders;
  }

  std::vector<OrderInfo> UnsentOrders::take(const NodeID &satellite) {
    std::lock_guard lock{mutex_};
    std::vector<OrderInfo> orders;
    for (auto it{orders_.begin()}; it != orders_.end();) {
      if (it->second.satellite == satellite) {
        orders.push_back(std::move(it->second.info));
        it = orders_.erase(it);
      } else {
        ++it;
      }
    }
    return orders;
  }

  size_t UnsentOrders::size() const {
    std::lock_guard lock{mutex_};
    return orders_.size();
  }
}  // namespace ps::orders
