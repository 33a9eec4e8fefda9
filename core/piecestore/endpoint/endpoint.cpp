/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/endpoint/endpoint.hpp"

#include "common/span.hpp"
#include "piecestore/blobstore/blobstore_error.hpp"
#include "piecestore/endpoint/endpoint_error.hpp"

namespace ps::piecestore::endpoint {
  using blobstore::BlobStoreError;
  using common::span::cbytes;

  Endpoint::Endpoint(std::shared_ptr<EndpointContext> ctx,
                     std::shared_ptr<RetainService> retain)
      : ctx_{std::move(ctx)}, retain_{std::move(retain)} {}

  std::unique_ptr<UploadSession> Endpoint::upload() const {
    return std::make_unique<UploadSession>(ctx_);
  }

  std::unique_ptr<DownloadSession> Endpoint::download() const {
    return std::make_unique<DownloadSession>(ctx_);
  }

  outcome::result<PieceDeleteResponse> Endpoint::deletePiece(
      const NodeID &caller, const PieceDeleteRequest &request) {
    auto deleted{[&]() -> outcome::result<void> {
      const auto &limit{request.limit()};
      OUTCOME_TRY(ctx_->verifier->verify(limit, {orders::pb::DELETE}));
      OUTCOME_TRY(satellite, NodeID::fromSpan(cbytes(limit.satellite_id())));
      if (satellite != caller) {
        return EndpointError::kNotLimitSatellite;
      }
      OUTCOME_TRY(id, PieceID::fromSpan(cbytes(limit.piece_id())));
      OUTCOME_TRY(exists, ctx_->store->exists(satellite, id));
      if (!exists) {
        return EndpointError::kPieceNotFound;
      }
      OUTCOME_TRY(removePiece(satellite, id));
      ctx_->logger->info(
          "deleted {} of {}", id.toString(), satellite.toString());
      return outcome::success();
    }()};
    if (!deleted) {
      logFailure(ctx_->logger, "delete", deleted.error());
      return deleted.error();
    }
    return PieceDeleteResponse{};
  }

  outcome::result<DeletePiecesResponse> Endpoint::deletePieces(
      const NodeID &caller, const DeletePiecesRequest &request) {
    if (auto trusted{checkTrusted(caller)}; !trusted) {
      logFailure(ctx_->logger, "delete pieces", trusted.error());
      return trusted.error();
    }
    int64_t unhandled{};
    for (const auto &raw : request.piece_ids()) {
      auto id{PieceID::fromSpan(cbytes(raw))};
      if (!id) {
        ++unhandled;
        continue;
      }
      auto removed{removePiece(caller, id.value())};
      if (!removed) {
        ctx_->logger->warn("cannot delete {} of {}: {}",
                           id.value().toString(),
                           caller.toString(),
                           removed.error().message());
        ++unhandled;
      }
    }
    ctx_->logger->info("delete pieces of {}: {} requested, {} unhandled",
                       caller.toString(),
                       request.piece_ids_size(),
                       unhandled);
    DeletePiecesResponse response;
    response.set_unhandled_count(unhandled);
    return response;
  }

  outcome::result<RetainResponse> Endpoint::retain(
      const NodeID &caller, const RetainRequest &request) {
    if (auto trusted{checkTrusted(caller)}; !trusted) {
      logFailure(ctx_->logger, "retain", trusted.error());
      return trusted.error();
    }
    if (retain_->status() == RetainStatus::kDisabled) {
      ctx_->logger->debug("retain disabled, request of {} ignored",
                          caller.toString());
      return RetainResponse{};
    }
    auto filter{bloom::BloomFilter::decode(cbytes(request.filter()))};
    if (!filter) {
      ctx_->logger->info("retain of {} rejected: {}",
                         caller.toString(),
                         filter.error().message());
      return EndpointError::kInvalidFilter;
    }
    retain_->queue({caller,
                    orders::fromProto(request.creation_date()),
                    std::move(filter.value())});
    return RetainResponse{};
  }

  outcome::result<RestoreTrashResponse> Endpoint::restoreTrash(
      const NodeID &caller, const RestoreTrashRequest &) {
    if (auto trusted{checkTrusted(caller)}; !trusted) {
      logFailure(ctx_->logger, "restore trash", trusted.error());
      return trusted.error();
    }
    OUTCOME_TRY(satellites, ctx_->store->trashSatellites());
    size_t restored{};
    for (const auto &satellite : satellites) {
      OUTCOME_TRY(count, ctx_->store->restoreTrash(satellite));
      restored += count;
    }
    ctx_->logger->info("restored {} pieces from trash, requested by {}",
                       restored,
                       caller.toString());
    return RestoreTrashResponse{};
  }

  outcome::result<void> Endpoint::checkTrusted(const NodeID &caller) const {
    if (!ctx_->trust->isTrusted(caller)) {
      return EndpointError::kUntrustedSatellite;
    }
    return outcome::success();
  }

  outcome::result<void> Endpoint::removePiece(const NodeID &satellite,
                                              const PieceID &id) {
    auto removed{ctx_->store->remove(satellite, id)};
    if (!removed && removed.error() != BlobStoreError::kBlobNotFound) {
      return removed.error();
    }
    return outcome::success();
  }
}  // namespace ps::piecestore::endpoint
