/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>

#include <boost/optional.hpp>

#include "fsm/fsm.hpp"
#include "piecestore/endpoint/context.hpp"
#include "piecestore/protobuf/piecestore.pb.h"

namespace ps::piecestore::endpoint {
  using orders::Order;
  using orders::OrderLimit;
  using pb::PieceDownloadRequest;
  using pb::PieceDownloadResponse;

  enum class DownloadState {
    kIdle,
    kAwaitingLimit,
    kActive,
    kDone,
    kFailed,
  };

  enum class DownloadEvent {
    kMessage,
    kLimitAccepted,
    kFinish,
    kFail,
  };

  /**
   * Download of a single piece. Requested ranges are sent as orders allow,
   * in responses of at most max_chunk_size bytes.
   */
  class DownloadSession {
   public:
    using Fsm = fsm::FSM<DownloadEvent, DownloadState>;

    explicit DownloadSession(std::shared_ptr<EndpointContext> ctx);
    DownloadSession(const DownloadSession &) = delete;
    DownloadSession &operator=(const DownloadSession &) = delete;
    ~DownloadSession();

    /**
     * Accept order and chunk request of the message.
     * First message must contain limit and chunk, its first response
     * carries the piece hash and original order limit.
     * @return chunks allowed by orders received so far
     */
    outcome::result<std::vector<PieceDownloadResponse>> onMessage(
        const PieceDownloadRequest &request);

    /// Client closed its side, largest order is kept for settlement
    outcome::result<void> finish();

    void cancel();

    DownloadState state() const;

    /// Payload bytes sent
    uint64_t sent() const;

    /// Requested bytes waiting for orders
    uint64_t pending() const;

   private:
    struct Range {
      uint64_t offset;
      uint64_t size;
    };

    outcome::result<std::vector<PieceDownloadResponse>> process(
        const PieceDownloadRequest &request);
    outcome::result<void> open(const OrderLimit &limit);
    outcome::result<void> acceptOrder(const Order &order);
    outcome::result<void> queueChunk(const PieceDownloadRequest::Chunk &chunk);
    outcome::result<void> emit(std::vector<PieceDownloadResponse> &responses);
    outcome::result<void> attachHeader(PieceDownloadResponse &response);
    void fail(const std::error_code &error);
    void release();

    std::shared_ptr<EndpointContext> ctx_;
    Fsm fsm_;
    OrderLimit limit_;
    NodeID satellite_;
    PieceID piece_id_;
    std::unique_ptr<pieces::PieceReader> reader_;
    boost::optional<Order> largest_order_;
    std::deque<Range> queue_;
    uint64_t requested_{};
    uint64_t sent_{};
  };
}  // namespace ps::piecestore::endpoint
