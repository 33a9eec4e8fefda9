/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "orders/used_serials.hpp"

#include "orders/order_error.hpp"

namespace ps::orders {

  outcome::result<void> UsedSerials::add(const NodeID &satellite,
                                         const SerialNumber &serial,
                                         clock::Timestamp expiration) {
    std::lock_guard lock{mutex_};
    auto key{std::make_pair(satellite, serial)};
    if (!serials_.emplace(key, expiration).second) {
      return OrderError::kSerialAlreadyUsed;
    }
    expirations_.emplace(expiration, std::move(key));
    return outcome::success();
  }

  bool UsedSerials::exists(const NodeID &satellite,
                           const SerialNumber &serial) const {
    std::lock_guard lock{mutex_};
    return serials_.count(std::make_pair(satellite, serial)) != 0;
  }

  void UsedSerials::deleteExpired(clock::Timestamp now) {
    std::lock_guard lock{mutex_};
    const auto end{expirations_.lower_bound(now)};
    for (auto it{expirations_.begin()}; it != end; ++it) {
      serials_.erase(it->second);
    }
    expirations_.erase(expirations_.begin(), end);
  }

  size_t UsedSerials::size() const {
    std::lock_guard lock{mutex_};
    return serials_.size();
  }
}  // namespace ps::orders
