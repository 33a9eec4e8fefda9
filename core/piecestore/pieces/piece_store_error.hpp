/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ps::piecestore::pieces {

  enum class PieceStoreError {
    kHeaderUnavailable = 1,
    kNotEnoughSpace,
    kUnsupportedHashAlgorithm,
    kPieceLocked,
    kWriterClosed,
    kPieceTooSmall,
    kPieceAlreadyExists,
  };

}  // namespace ps::piecestore::pieces

OUTCOME_HPP_DECLARE_ERROR(ps::piecestore::pieces, PieceStoreError);
