/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "orders/types.hpp"
#include "piecestore/protobuf/piecestore.pb.h"
#include "primitives/piece/piece_id.hpp"

namespace ps::piecestore {
  using pb::PieceHeader;

  /// Bytes reserved in front of the payload of V1 blobs
  constexpr size_t kV1PieceHeaderReservedArea = 512;

  /// Big endian length prefix of the serialized header
  constexpr size_t kHeaderLengthSize = 2;

  enum class PieceHeaderError {
    kHeaderTooLarge = 1,
    kHeaderCorrupted,
  };

  /**
   * Frame header into the reserved area:
   * [be16 length][serialized header][zero padding]
   */
  outcome::result<Bytes> encodeHeaderArea(const PieceHeader &header);

  /// Parse reserved area, kHeaderCorrupted on bad length or message
  outcome::result<PieceHeader> decodeHeaderArea(BytesIn area);

  /**
   * Uplink's piece hash as it was signed, rebuilt from the header
   * @param id - piece id the header is stored under
   * @param piece_size - payload size
   */
  orders::PieceHash reconstructPieceHash(const PieceHeader &header,
                                         const primitives::piece::PieceID &id,
                                         int64_t piece_size);
}  // namespace ps::piecestore

OUTCOME_HPP_DECLARE_ERROR(ps::piecestore, PieceHeaderError);
