/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/pieces/piece_store_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ps::piecestore::pieces, PieceStoreError, e) {
  using ps::piecestore::pieces::PieceStoreError;
  switch (e) {
    case PieceStoreError::kHeaderUnavailable:
      return "PieceStore: header is not stored for format V0 pieces";
    case PieceStoreError::kNotEnoughSpace:
      return "PieceStore: not enough allocated space";
    case PieceStoreError::kUnsupportedHashAlgorithm:
      return "PieceStore: unsupported piece hash algorithm";
    case PieceStoreError::kPieceLocked:
      return "PieceStore: piece is being written by another session";
    case PieceStoreError::kWriterClosed:
      return "PieceStore: piece writer is already committed or cancelled";
    case PieceStoreError::kPieceTooSmall:
      return "PieceStore: blob is shorter than the header area";
    case PieceStoreError::kPieceAlreadyExists:
      return "PieceStore: piece is already stored, delete it first";
  }
  return "PieceStore: unknown error";
}
