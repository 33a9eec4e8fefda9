/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/endpoint/upload_session.hpp"

#include "common/span.hpp"
#include "orders/signing.hpp"
#include "piecestore/endpoint/endpoint_error.hpp"
#include "piecestore/pieces/piece_store_error.hpp"

namespace ps::piecestore::endpoint {
  using common::span::bytestr;
  using common::span::cbytes;
  using pieces::PieceStoreError;

  namespace {
    const std::set<orders::PieceAction> kUploadActions{
        orders::pb::PUT,
        orders::pb::PUT_REPAIR,
        orders::pb::PUT_GRACEFUL_EXIT,
    };

    std::vector<UploadSession::Fsm::TransitionRule> makeTransitions() {
      using Rule = UploadSession::Fsm::TransitionRule;
      return {
          Rule(UploadEvent::kMessage)
              .from(UploadState::kIdle)
              .to(UploadState::kAwaitingLimit),
          Rule(UploadEvent::kLimitAccepted)
              .from(UploadState::kAwaitingLimit)
              .to(UploadState::kActive),
          Rule(UploadEvent::kDoneReceived)
              .from(UploadState::kActive)
              .to(UploadState::kFinalizing),
          Rule(UploadEvent::kCommitted)
              .from(UploadState::kFinalizing)
              .to(UploadState::kDone),
          Rule(UploadEvent::kFail)
              .fromMany(UploadState::kIdle,
                        UploadState::kAwaitingLimit,
                        UploadState::kActive,
                        UploadState::kFinalizing)
              .to(UploadState::kFailed),
      };
    }
  }  // namespace

  UploadSession::UploadSession(std::shared_ptr<EndpointContext> ctx)
      : ctx_{std::move(ctx)},
        fsm_{makeTransitions(),
             UploadState::kIdle,
             {UploadState::kDone, UploadState::kFailed}} {}

  UploadSession::~UploadSession() {
    cancel();
  }

  outcome::result<boost::optional<PieceUploadResponse>>
  UploadSession::onMessage(const PieceUploadRequest &request) {
    if (fsm_.isFinal()) {
      return EndpointError::kSessionClosed;
    }
    auto response{process(request)};
    if (!response) {
      fail(response.error());
    }
    return response;
  }

  void UploadSession::cancel() {
    if (fsm_.isFinal()) {
      return;
    }
    if (writer_) {
      ctx_->logger->info("upload of {} cancelled after {} bytes",
                         piece_id_.toString(),
                         written());
    }
    fail({});
  }

  UploadState UploadSession::state() const {
    return fsm_.get();
  }

  uint64_t UploadSession::written() const {
    return writer_ ? writer_->size() : 0;
  }

  outcome::result<boost::optional<PieceUploadResponse>> UploadSession::process(
      const PieceUploadRequest &request) {
    if (fsm_.get() == UploadState::kIdle) {
      OUTCOME_TRY(fsm_.send(UploadEvent::kMessage));
      if (!request.has_limit()) {
        return EndpointError::kMissingOrderLimit;
      }
      OUTCOME_TRY(open(request.limit(), request.hash_algorithm()));
      OUTCOME_TRY(fsm_.send(UploadEvent::kLimitAccepted));
    } else if (request.has_limit()
               || (!request.has_order() && !request.has_chunk()
                   && !request.has_done())) {
      return EndpointError::kUnexpectedMessage;
    }

    if (request.has_order()) {
      OUTCOME_TRY(acceptOrder(request.order()));
    }
    if (request.has_chunk()) {
      OUTCOME_TRY(acceptChunk(request.chunk()));
    }
    if (request.has_done()) {
      OUTCOME_TRY(response, finish(request.done()));
      return response;
    }
    return boost::none;
  }

  outcome::result<void> UploadSession::open(const OrderLimit &limit,
                                            PieceHashAlgorithm algorithm) {
    OUTCOME_TRY(ctx_->verifier->verify(limit, kUploadActions));
    OUTCOME_TRYA(satellite_, NodeID::fromSpan(cbytes(limit.satellite_id())));
    OUTCOME_TRYA(piece_id_, PieceID::fromSpan(cbytes(limit.piece_id())));
    if (limit.limit() < 0
        || static_cast<uint64_t>(limit.limit())
               > ctx_->store->availableSpace()) {
      return PieceStoreError::kNotEnoughSpace;
    }
    lock_ = ctx_->locks->tryLock(satellite_, piece_id_);
    if (!lock_) {
      return PieceStoreError::kPieceLocked;
    }
    OUTCOME_TRYA(writer_,
                 ctx_->store->writer(satellite_, piece_id_, algorithm));
    limit_ = limit;
    algorithm_ = algorithm;
    ctx_->logger->debug("upload of {} for {} started, limit {}",
                        piece_id_.toString(),
                        satellite_.toString(),
                        limit.limit());
    return outcome::success();
  }

  outcome::result<void> UploadSession::acceptOrder(const Order &order) {
    const int64_t previous{largest_order_ ? largest_order_->amount() : 0};
    OUTCOME_TRY(ctx_->verifier->verifyOrder(limit_, order, previous));
    largest_order_ = order;
    return outcome::success();
  }

  outcome::result<void> UploadSession::acceptChunk(
      const PieceUploadRequest::Chunk &chunk) {
    const auto offset{writer_->size()};
    if (chunk.offset() < 0 || static_cast<uint64_t>(chunk.offset()) != offset) {
      return EndpointError::kChunkOutOfOrder;
    }
    const auto end{offset + chunk.data().size()};
    const auto ordered{static_cast<uint64_t>(
        largest_order_ ? largest_order_->amount() : 0)};
    if (end > ordered || end > static_cast<uint64_t>(limit_.limit())) {
      return EndpointError::kOrderAllowanceExceeded;
    }
    return writer_->write(cbytes(chunk.data()));
  }

  outcome::result<void> UploadSession::checkPieceHash(
      const PieceHash &done) const {
    if (done.piece_id() != limit_.piece_id()) {
      return EndpointError::kPieceIdMismatch;
    }
    if (done.piece_size() < 0
        || static_cast<uint64_t>(done.piece_size()) != writer_->size()) {
      return EndpointError::kPieceSizeMismatch;
    }
    if (done.hash_algorithm() != algorithm_) {
      return EndpointError::kHashAlgorithmMismatch;
    }
    OUTCOME_TRY(hash, writer_->hash());
    if (done.hash() != bytestr(hash)) {
      return EndpointError::kHashMismatch;
    }
    OUTCOME_TRY(uplink_key,
                orders::publicKeyFromBytes(limit_.uplink_public_key()));
    auto valid{orders::verifyPieceHash(*ctx_->crypto, done, uplink_key)};
    if (!valid || !valid.value()) {
      return EndpointError::kInvalidPieceHashSignature;
    }
    return outcome::success();
  }

  outcome::result<PieceUploadResponse> UploadSession::finish(
      const PieceHash &done) {
    OUTCOME_TRY(fsm_.send(UploadEvent::kDoneReceived));
    OUTCOME_TRY(checkPieceHash(done));

    PieceUploadResponse response;
    auto &node_hash{*response.mutable_done()};
    node_hash.set_piece_id(done.piece_id());
    node_hash.set_hash(done.hash());
    node_hash.set_piece_size(done.piece_size());
    node_hash.set_hash_algorithm(done.hash_algorithm());
    *node_hash.mutable_timestamp() = orders::toProto(ctx_->clock->nowMicro());
    OUTCOME_TRY(orders::signPieceHash(
        *ctx_->crypto, ctx_->identity.private_key, node_hash));

    PieceHeader header;
    header.set_hash(done.hash());
    *header.mutable_creation_time() = done.timestamp();
    header.set_signature(done.signature());
    header.set_hash_algorithm(done.hash_algorithm());
    *header.mutable_order_limit() = limit_;
    const auto size{writer_->size()};
    auto committed{writer_->commit(header)};
    writer_.reset();
    if (!committed) {
      return committed.error();
    }

    if (largest_order_) {
      OUTCOME_TRY(ctx_->unsent_orders->enqueue({limit_, *largest_order_},
                                               ctx_->clock->nowMicro()));
    }

    OUTCOME_TRY(fsm_.send(UploadEvent::kCommitted));
    lock_.reset();
    ctx_->logger->info("uploaded {} for {}, {} bytes",
                       piece_id_.toString(),
                       satellite_.toString(),
                       size);
    return response;
  }

  void UploadSession::fail(const std::error_code &error) {
    if (error) {
      logFailure(ctx_->logger, "upload", error);
    }
    if (writer_) {
      auto cancelled{writer_->cancel()};
      if (!cancelled) {
        ctx_->logger->warn("cannot remove temporary data of {}: {}",
                           piece_id_.toString(),
                           cancelled.error().message());
      }
      writer_.reset();
    }
    lock_.reset();
    transit(UploadEvent::kFail);
  }

  void UploadSession::transit(UploadEvent event) {
    auto state{fsm_.send(event)};
    if (!state) {
      ctx_->logger->error("upload session: {}", state.error().message());
    }
  }
}  // namespace ps::piecestore::endpoint
