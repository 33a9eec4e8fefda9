/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <set>

#include "primitives/node_id/node_id.hpp"
#include "primitives/piece/piece_id.hpp"

namespace ps::piecestore::pieces {
  using primitives::NodeID;
  using primitives::piece::PieceID;

  /**
   * Advisory per-piece locks. Uploads hold the lock for the whole session,
   * maintenance jobs skip locked pieces.
   */
  class PieceLocks : public std::enable_shared_from_this<PieceLocks> {
   public:
    using Key = std::pair<NodeID, PieceID>;

    /// Lock released on destruction
    class Guard {
     public:
      Guard(std::shared_ptr<PieceLocks> locks, Key key);
      Guard(const Guard &) = delete;
      Guard &operator=(const Guard &) = delete;
      ~Guard();

     private:
      std::shared_ptr<PieceLocks> locks_;
      Key key_;
    };

    /// Guard or nullptr if the piece is already locked
    std::unique_ptr<Guard> tryLock(const NodeID &satellite,
                                   const PieceID &piece);

    bool isLocked(const NodeID &satellite, const PieceID &piece) const;

   private:
    void unlock(const Key &key);

    mutable std::mutex mutex_;
    std::set<Key> locked_;
  };

}  // namespace ps::piecestore::pieces
