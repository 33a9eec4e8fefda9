/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>

#include <boost/asio/io_context.hpp>

#include "piecestore/bloom/bloom_filter.hpp"
#include "piecestore/config.hpp"
#include "piecestore/pieces/piece_locks.hpp"
#include "piecestore/pieces/piece_store.hpp"

namespace ps::piecestore::retain {
  using bloom::BloomFilter;
  using pieces::PieceLocks;
  using pieces::PieceStore;
  using primitives::NodeID;

  /// Garbage collection request of a satellite
  struct RetainRequest {
    NodeID satellite;
    /// Only pieces created before are collected
    clock::Timestamp created_before;
    /// Pieces the satellite still references
    BloomFilter filter;
  };

  struct RetainStats {
    size_t requests{};
    size_t pieces_checked{};
    size_t pieces_trashed{};
    size_t pieces_skipped{};
  };

  /**
   * Moves pieces which are not retained by their satellite to trash.
   * Requests are processed on io_context when given, by runOnce()
   * otherwise.
   */
  class RetainService : public std::enable_shared_from_this<RetainService> {
   public:
    RetainService(RetainConfig config,
                  std::shared_ptr<PieceStore> store,
                  std::shared_ptr<PieceLocks> locks,
                  std::shared_ptr<boost::asio::io_context> io);

    /**
     * Replace pending request of the same satellite
     * @return false when retain is disabled
     */
    bool queue(RetainRequest request);

    /**
     * Process all pending requests
     * @return number of trashed pieces
     */
    outcome::result<size_t> runOnce();

    size_t pending() const;

    RetainStats stats() const;

    RetainStatus status() const;

   private:
    outcome::result<size_t> process(const RetainRequest &request);

    RetainConfig config_;
    std::shared_ptr<PieceStore> store_;
    std::shared_ptr<PieceLocks> locks_;
    std::shared_ptr<boost::asio::io_context> io_;
    mutable std::mutex mutex_;
    std::map<NodeID, RetainRequest> pending_;
    bool scheduled_{false};
    RetainStats stats_;
    common::Logger logger_;
  };
}  // namespace ps::piecestore::retain
