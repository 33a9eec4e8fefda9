/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/retain/trash_chore.hpp"

#include <boost/asio/post.hpp>

namespace ps::piecestore::retain {
  TrashChore::TrashChore(std::shared_ptr<PieceStore> store,
                         std::shared_ptr<UTCClock> clock,
                         std::chrono::seconds expiry,
                         std::shared_ptr<boost::asio::io_context> io,
                         std::chrono::seconds interval)
      : store_{std::move(store)},
        clock_{std::move(clock)},
        expiry_{expiry},
        io_{std::move(io)},
        interval_{interval},
        timer_{*io_},
        logger_{common::createLogger("trash")} {}

  outcome::result<size_t> TrashChore::runOnce() {
    const auto before{clock_->nowMicro() - expiry_};
    OUTCOME_TRY(satellites, store_->trashSatellites());
    size_t deleted{};
    for (const auto &satellite : satellites) {
      OUTCOME_TRY(count, store_->emptyTrash(satellite, before));
      if (count != 0) {
        logger_->info("deleted {} trashed pieces of {}",
                      count,
                      satellite.toString());
      }
      deleted += count;
    }
    return deleted;
  }

  void TrashChore::start() {
    boost::asio::post(*io_, [self{shared_from_this()}] {
      if (self->running_) {
        return;
      }
      self->running_ = true;
      self->schedule();
    });
  }

  void TrashChore::stop() {
    boost::asio::post(*io_, [self{shared_from_this()}] {
      self->running_ = false;
      self->timer_.cancel();
    });
  }

  void TrashChore::schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([self{shared_from_this()}](
                          const boost::system::error_code &error) {
      if (error || !self->running_) {
        return;
      }
      auto deleted{self->runOnce()};
      if (!deleted) {
        self->logger_->error("cannot empty trash: {}",
                             deleted.error().message());
      }
      self->schedule();
    });
  }
}  // namespace ps::piecestore::retain
