/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "orders/types.hpp"

namespace ps::piecestore::pieces {
  using orders::PieceHashAlgorithm;

  /**
   * Running content hash of a piece payload
   */
  class PieceHasher {
   public:
    virtual ~PieceHasher() = default;

    virtual outcome::result<void> write(BytesIn data) = 0;

    /// Hash of the data written so far, the state is kept
    virtual outcome::result<Bytes> digest() const = 0;

    virtual PieceHashAlgorithm algorithm() const = 0;
  };

  /// kUnsupportedHashAlgorithm for unknown algorithms
  outcome::result<std::unique_ptr<PieceHasher>> makePieceHasher(
      PieceHashAlgorithm algorithm);

}  // namespace ps::piecestore::pieces
