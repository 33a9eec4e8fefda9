/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/endpoint/download_session.hpp"

#include <algorithm>

#include "common/span.hpp"
#include "piecestore/blobstore/blobstore_error.hpp"
#include "piecestore/endpoint/endpoint_error.hpp"
#include "piecestore/pieces/piece_store_error.hpp"

namespace ps::piecestore::endpoint {
  using blobstore::BlobStoreError;
  using common::span::cbytes;
  using pieces::PieceStoreError;

  namespace {
    const std::set<orders::PieceAction> kDownloadActions{
        orders::pb::GET,
        orders::pb::GET_AUDIT,
        orders::pb::GET_REPAIR,
    };

    std::vector<DownloadSession::Fsm::TransitionRule> makeTransitions() {
      using Rule = DownloadSession::Fsm::TransitionRule;
      return {
          Rule(DownloadEvent::kMessage)
              .from(DownloadState::kIdle)
              .to(DownloadState::kAwaitingLimit),
          Rule(DownloadEvent::kLimitAccepted)
              .from(DownloadState::kAwaitingLimit)
              .to(DownloadState::kActive),
          Rule(DownloadEvent::kFinish)
              .from(DownloadState::kActive)
              .to(DownloadState::kDone),
          Rule(DownloadEvent::kFail)
              .fromMany(DownloadState::kIdle,
                        DownloadState::kAwaitingLimit,
                        DownloadState::kActive)
              .to(DownloadState::kFailed),
      };
    }
  }  // namespace

  DownloadSession::DownloadSession(std::shared_ptr<EndpointContext> ctx)
      : ctx_{std::move(ctx)},
        fsm_{makeTransitions(),
             DownloadState::kIdle,
             {DownloadState::kDone, DownloadState::kFailed}} {}

  DownloadSession::~DownloadSession() {
    cancel();
  }

  outcome::result<std::vector<PieceDownloadResponse>>
  DownloadSession::onMessage(const PieceDownloadRequest &request) {
    if (fsm_.isFinal()) {
      return EndpointError::kSessionClosed;
    }
    auto responses{process(request)};
    if (!responses) {
      fail(responses.error());
    }
    return responses;
  }

  outcome::result<void> DownloadSession::finish() {
    if (fsm_.isFinal()) {
      return EndpointError::kSessionClosed;
    }
    OUTCOME_TRY(fsm_.send(DownloadEvent::kFinish));
    release();
    ctx_->logger->info("downloaded {} bytes of {} for {}",
                       sent_,
                       piece_id_.toString(),
                       satellite_.toString());
    if (largest_order_) {
      OUTCOME_TRY(ctx_->unsent_orders->enqueue({limit_, *largest_order_},
                                               ctx_->clock->nowMicro()));
    }
    return outcome::success();
  }

  void DownloadSession::cancel() {
    if (fsm_.isFinal()) {
      return;
    }
    fail({});
  }

  DownloadState DownloadSession::state() const {
    return fsm_.get();
  }

  uint64_t DownloadSession::sent() const {
    return sent_;
  }

  uint64_t DownloadSession::pending() const {
    uint64_t total{};
    for (const auto &range : queue_) {
      total += range.size;
    }
    return total;
  }

  outcome::result<std::vector<PieceDownloadResponse>>
  DownloadSession::process(const PieceDownloadRequest &request) {
    const bool first{fsm_.get() == DownloadState::kIdle};
    if (first) {
      OUTCOME_TRY(fsm_.send(DownloadEvent::kMessage));
      if (!request.has_limit()) {
        return EndpointError::kMissingOrderLimit;
      }
      if (!request.has_chunk()) {
        return EndpointError::kInvalidChunkRequest;
      }
      OUTCOME_TRY(open(request.limit()));
      OUTCOME_TRY(fsm_.send(DownloadEvent::kLimitAccepted));
    } else if (request.has_limit()
               || (!request.has_order() && !request.has_chunk())) {
      return EndpointError::kUnexpectedMessage;
    }

    if (request.has_order()) {
      OUTCOME_TRY(acceptOrder(request.order()));
    }
    if (request.has_chunk()) {
      OUTCOME_TRY(queueChunk(request.chunk()));
    }

    std::vector<PieceDownloadResponse> responses;
    OUTCOME_TRY(emit(responses));
    if (first) {
      if (responses.empty()) {
        responses.emplace_back();
      }
      OUTCOME_TRY(attachHeader(responses.front()));
    }
    return responses;
  }

  outcome::result<void> DownloadSession::open(const OrderLimit &limit) {
    OUTCOME_TRY(ctx_->verifier->verify(limit, kDownloadActions));
    OUTCOME_TRYA(satellite_, NodeID::fromSpan(cbytes(limit.satellite_id())));
    OUTCOME_TRYA(piece_id_, PieceID::fromSpan(cbytes(limit.piece_id())));
    auto reader{ctx_->store->reader(satellite_, piece_id_)};
    if (!reader) {
      if (reader.error() == BlobStoreError::kBlobNotFound) {
        return EndpointError::kPieceNotFound;
      }
      return reader.error();
    }
    reader_ = std::move(reader.value());
    limit_ = limit;
    ctx_->logger->debug("download of {} for {} started, limit {}",
                        piece_id_.toString(),
                        satellite_.toString(),
                        limit.limit());
    return outcome::success();
  }

  outcome::result<void> DownloadSession::acceptOrder(const Order &order) {
    const int64_t previous{largest_order_ ? largest_order_->amount() : 0};
    OUTCOME_TRY(ctx_->verifier->verifyOrder(limit_, order, previous));
    largest_order_ = order;
    return outcome::success();
  }

  outcome::result<void> DownloadSession::queueChunk(
      const PieceDownloadRequest::Chunk &chunk) {
    if (chunk.offset() < 0 || chunk.chunk_size() <= 0) {
      return EndpointError::kInvalidChunkRequest;
    }
    const auto offset{static_cast<uint64_t>(chunk.offset())};
    const auto size{static_cast<uint64_t>(chunk.chunk_size())};
    if (offset > reader_->size() || size > reader_->size() - offset) {
      return EndpointError::kInvalidChunkRequest;
    }
    if (requested_ + size > static_cast<uint64_t>(limit_.limit())) {
      return EndpointError::kOrderAllowanceExceeded;
    }
    requested_ += size;
    queue_.push_back({offset, size});
    return outcome::success();
  }

  outcome::result<void> DownloadSession::emit(
      std::vector<PieceDownloadResponse> &responses) {
    const auto ordered{static_cast<uint64_t>(
        largest_order_ ? largest_order_->amount() : 0)};
    while (!queue_.empty() && sent_ < ordered) {
      auto &range{queue_.front()};
      const auto size{std::min<uint64_t>(
          {range.size, ctx_->config.max_chunk_size, ordered - sent_})};
      Bytes data(size);
      OUTCOME_TRY(bytes_read, reader_->read(range.offset, data));
      if (bytes_read != size) {
        return PieceStoreError::kPieceTooSmall;
      }
      auto &chunk{*responses.emplace_back().mutable_chunk()};
      chunk.set_offset(range.offset);
      chunk.set_data(common::span::toString(data));
      range.offset += size;
      range.size -= size;
      sent_ += size;
      if (range.size == 0) {
        queue_.pop_front();
      }
    }
    return outcome::success();
  }

  outcome::result<void> DownloadSession::attachHeader(
      PieceDownloadResponse &response) {
    auto header{reader_->header()};
    if (!header) {
      if (header.error() == PieceStoreError::kHeaderUnavailable) {
        return outcome::success();
      }
      return header.error();
    }
    *response.mutable_hash() = reconstructPieceHash(
        header.value(), piece_id_, static_cast<int64_t>(reader_->size()));
    *response.mutable_limit() = header.value().order_limit();
    return outcome::success();
  }

  void DownloadSession::fail(const std::error_code &error) {
    if (error) {
      logFailure(ctx_->logger, "download", error);
    }
    release();
    auto state{fsm_.send(DownloadEvent::kFail)};
    if (!state) {
      ctx_->logger->error("download session: {}", state.error().message());
    }
  }

  void DownloadSession::release() {
    reader_.reset();
    queue_.clear();
  }
}  // namespace ps::piecestore::endpoint
