/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "piecestore/endpoint/download_session.hpp"
#include "piecestore/endpoint/upload_session.hpp"
#include "piecestore/retain/retain_service.hpp"

namespace ps::piecestore::endpoint {
  using pb::DeletePiecesRequest;
  using pb::DeletePiecesResponse;
  using pb::PieceDeleteRequest;
  using pb::PieceDeleteResponse;
  using pb::RestoreTrashRequest;
  using pb::RestoreTrashResponse;
  using pb::RetainRequest;
  using pb::RetainResponse;
  using retain::RetainService;

  /**
   * Storage node side of the piece transfer protocol.
   * Streaming calls return a session, unary calls are answered directly.
   * `caller` is the authenticated identity of the remote peer.
   */
  class Endpoint {
   public:
    Endpoint(std::shared_ptr<EndpointContext> ctx,
             std::shared_ptr<RetainService> retain);

    std::unique_ptr<UploadSession> upload() const;

    std::unique_ptr<DownloadSession> download() const;

    /**
     * Delete single piece by order limit with DELETE action.
     * @deprecated superseded by deletePieces
     */
    outcome::result<PieceDeleteResponse> deletePiece(
        const NodeID &caller, const PieceDeleteRequest &request);

    /**
     * Delete pieces of the calling satellite.
     * Absent pieces count as handled, unhandled_count counts pieces whose
     * id is malformed or whose removal failed.
     */
    outcome::result<DeletePiecesResponse> deletePieces(
        const NodeID &caller, const DeletePiecesRequest &request);

    /// Queue garbage collection of the calling satellite's pieces
    outcome::result<RetainResponse> retain(const NodeID &caller,
                                           const RetainRequest &request);

    /// Move all trashed pieces of the node back
    outcome::result<RestoreTrashResponse> restoreTrash(
        const NodeID &caller, const RestoreTrashRequest &request);

   private:
    outcome::result<void> checkTrusted(const NodeID &caller) const;

    /// Idempotent, absent piece is not an error
    outcome::result<void> removePiece(const NodeID &satellite,
                                      const PieceID &id);

    std::shared_ptr<EndpointContext> ctx_;
    std::shared_ptr<RetainService> retain_;
  };
}  // namespace ps::piecestore::endpoint
