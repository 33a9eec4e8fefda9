/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "clock/utc_clock.hpp"
#include "piecestore/pieces/piece_store.hpp"

namespace ps::piecestore::retain {
  using clock::UTCClock;
  using pieces::PieceStore;

  /**
   * Periodically deletes trash entries older than expiry
   */
  class TrashChore : public std::enable_shared_from_this<TrashChore> {
   public:
    TrashChore(std::shared_ptr<PieceStore> store,
               std::shared_ptr<UTCClock> clock,
               std::chrono::seconds expiry,
               std::shared_ptr<boost::asio::io_context> io,
               std::chrono::seconds interval);

    /**
     * Empty expired trash of every satellite
     * @return number of deleted pieces
     */
    outcome::result<size_t> runOnce();

    void start();

    void stop();

   private:
    void schedule();

    std::shared_ptr<PieceStore> store_;
    std::shared_ptr<UTCClock> clock_;
    std::chrono::seconds expiry_;
    std::shared_ptr<boost::asio::io_context> io_;
    std::chrono::seconds interval_;
    boost::asio::steady_timer timer_;
    bool running_{false};
    common::Logger logger_;
  };
}  // namespace ps::piecestore::retain
