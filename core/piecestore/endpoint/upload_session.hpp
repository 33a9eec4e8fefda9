/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "fsm/fsm.hpp"
#include "piecestore/endpoint/context.hpp"
#include "piecestore/protobuf/piecestore.pb.h"

namespace ps::piecestore::endpoint {
  using orders::Order;
  using orders::OrderLimit;
  using orders::PieceHash;
  using orders::PieceHashAlgorithm;
  using pb::PieceUploadRequest;
  using pb::PieceUploadResponse;

  enum class UploadState {
    kIdle,
    kAwaitingLimit,
    kActive,
    kFinalizing,
    kDone,
    kFailed,
  };

  enum class UploadEvent {
    kMessage,
    kLimitAccepted,
    kDoneReceived,
    kCommitted,
    kFail,
  };

  /**
   * Upload of a single piece, fed one request at a time.
   * Nothing is visible in the store until the final hash is accepted.
   * Destroying an unfinished session cancels it.
   */
  class UploadSession {
   public:
    using Fsm = fsm::FSM<UploadEvent, UploadState>;

    explicit UploadSession(std::shared_ptr<EndpointContext> ctx);
    UploadSession(const UploadSession &) = delete;
    UploadSession &operator=(const UploadSession &) = delete;
    ~UploadSession();

    /**
     * Process order, chunk and done of the request, in that order.
     * Any error fails the session.
     * @return storage node signed hash when done was accepted
     */
    outcome::result<boost::optional<PieceUploadResponse>> onMessage(
        const PieceUploadRequest &request);

    /// Abort unfinished upload, temporary data is removed
    void cancel();

    UploadState state() const;

    /// Bytes of payload received
    uint64_t written() const;

   private:
    outcome::result<boost::optional<PieceUploadResponse>> process(
        const PieceUploadRequest &request);
    outcome::result<void> open(const OrderLimit &limit,
                               PieceHashAlgorithm algorithm);
    outcome::result<void> acceptOrder(const Order &order);
    outcome::result<void> acceptChunk(const PieceUploadRequest::Chunk &chunk);
    outcome::result<PieceUploadResponse> finish(const PieceHash &done);
    outcome::result<void> checkPieceHash(const PieceHash &done) const;
    void fail(const std::error_code &error);
    void transit(UploadEvent event);

    std::shared_ptr<EndpointContext> ctx_;
    Fsm fsm_;
    OrderLimit limit_;
    PieceHashAlgorithm algorithm_{};
    NodeID satellite_;
    PieceID piece_id_;
    boost::optional<Order> largest_order_;
    std::unique_ptr<pieces::PieceLocks::Guard> lock_;
    std::unique_ptr<pieces::PieceWriter> writer_;
  };
}  // namespace ps::piecestore::endpoint
