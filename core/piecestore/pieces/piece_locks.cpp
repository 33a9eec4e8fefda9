/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/pieces/piece_locks.hpp"

namespace ps::piecestore::pieces {

  PieceLocks::Guard::Guard(std::shared_ptr<PieceLocks> locks, Key key)
      : locks_{std::move(locks)}, key_{std::move(key)} {}

  PieceLocks::Guard::~Guard() {
    locks_->unlock(key_);
  }

  std::unique_ptr<PieceLocks::Guard> PieceLocks::tryLock(
      const NodeID &satellite, const PieceID &piece) {
    Key key{satellite, piece};
    {
      std::lock_guard lock{mutex_};
      if (!locked_.insert(key).second) {
        return nullptr;
      }
    }
    return std::make_unique<Guard>(shared_from_this(), std::move(key));
  }

  bool PieceLocks::isLocked(const NodeID &satellite,
                            const PieceID &piece) const {
    std::lock_guard lock{mutex_};
    return locked_.count(Key{satellite, piece}) != 0;
  }

  void PieceLocks::unlock(const Key &key) {
    std::lock_guard lock{mutex_};
    locked_.erase(key);
  }

}  // namespace ps::piecestore::pieces
