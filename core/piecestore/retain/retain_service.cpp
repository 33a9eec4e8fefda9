/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/retain/retain_service.hpp"

#include <boost/asio/post.hpp>

#include "piecestore/blobstore/blobstore_error.hpp"

namespace ps::piecestore::retain {
  using blobstore::BlobStoreError;

  RetainService::RetainService(RetainConfig config,
                               std::shared_ptr<PieceStore> store,
                               std::shared_ptr<PieceLocks> locks,
                               std::shared_ptr<boost::asio::io_context> io)
      : config_{config},
        store_{std::move(store)},
        locks_{std::move(locks)},
        io_{std::move(io)},
        logger_{common::createLogger("retain")} {}

  bool RetainService::queue(RetainRequest request) {
    if (config_.status == RetainStatus::kDisabled) {
      logger_->debug("retain disabled, request of {} dropped",
                     request.satellite.toString());
      return false;
    }
    std::unique_lock lock{mutex_};
    const auto satellite{request.satellite};
    pending_.insert_or_assign(satellite, std::move(request));
    ++stats_.requests;
    if (!io_ || scheduled_) {
      return true;
    }
    scheduled_ = true;
    boost::asio::post(*io_, [self{shared_from_this()}] {
      auto trashed{self->runOnce()};
      if (!trashed) {
        self->logger_->error("retain failed: {}", trashed.error().message());
      }
    });
    return true;
  }

  outcome::result<size_t> RetainService::runOnce() {
    size_t trashed{};
    while (true) {
      std::unique_lock lock{mutex_};
      if (pending_.empty()) {
        scheduled_ = false;
        return trashed;
      }
      auto request{std::move(pending_.begin()->second)};
      pending_.erase(pending_.begin());
      lock.unlock();

      auto count{process(request)};
      if (!count) {
        lock.lock();
        scheduled_ = false;
        return count.error();
      }
      trashed += count.value();
    }
  }

  size_t RetainService::pending() const {
    std::unique_lock lock{mutex_};
    return pending_.size();
  }

  RetainStats RetainService::stats() const {
    std::unique_lock lock{mutex_};
    return stats_;
  }

  RetainStatus RetainService::status() const {
    return config_.status;
  }

  outcome::result<size_t> RetainService::process(
      const RetainRequest &request) {
    const auto threshold{request.created_before - config_.time_buffer};
    std::vector<PieceID> candidates;
    size_t checked{};
    OUTCOME_TRY(store_->walk(
        request.satellite,
        [&](const pieces::PieceInfo &piece) -> outcome::result<void> {
          ++checked;
          if (piece.creation_time < threshold
              && !request.filter.contains(piece.id)) {
            candidates.push_back(piece.id);
          }
          return outcome::success();
        }));

    size_t trashed{};
    size_t skipped{};
    for (const auto &id : candidates) {
      if (config_.status == RetainStatus::kDebug) {
        logger_->debug("would trash {} of {}",
                       id.toString(),
                       request.satellite.toString());
        continue;
      }
      auto guard{locks_->tryLock(request.satellite, id)};
      if (!guard) {
        ++skipped;
        continue;
      }
      auto moved{store_->trash(request.satellite, id)};
      if (!moved) {
        if (moved.error() != BlobStoreError::kBlobNotFound) {
          logger_->warn("cannot trash {} of {}: {}",
                        id.toString(),
                        request.satellite.toString(),
                        moved.error().message());
          ++skipped;
        }
        continue;
      }
      ++trashed;
    }

    {
      std::unique_lock lock{mutex_};
      stats_.pieces_checked += checked;
      stats_.pieces_trashed += trashed;
      stats_.pieces_skipped += skipped;
    }
    logger_->info("retain of {}: {} pieces checked, {} candidates, {} trashed",
                  request.satellite.toString(),
                  checked,
                  candidates.size(),
                  trashed);
    return trashed;
  }
}  // namespace ps::piecestore::retain
