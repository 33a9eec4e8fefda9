/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/piece_header.hpp"

#include <algorithm>

#include <boost/endian/conversion.hpp>

#include "common/span.hpp"
#include "orders/signing.hpp"

namespace ps::piecestore {

  outcome::result<Bytes> encodeHeaderArea(const PieceHeader &header) {
    const auto encoded{orders::serializeDeterministic(header)};
    if (kHeaderLengthSize + encoded.size() > kV1PieceHeaderReservedArea) {
      return PieceHeaderError::kHeaderTooLarge;
    }
    Bytes area(kV1PieceHeaderReservedArea, 0);
    boost::endian::store_big_u16(area.data(),
                                 static_cast<uint16_t>(encoded.size()));
    std::copy(
        encoded.begin(), encoded.end(), area.begin() + kHeaderLengthSize);
    return area;
  }

  outcome::result<PieceHeader> decodeHeaderArea(BytesIn area) {
    if (static_cast<size_t>(area.size()) < kHeaderLengthSize) {
      return PieceHeaderError::kHeaderCorrupted;
    }
    const size_t length{boost::endian::load_big_u16(area.data())};
    if (kHeaderLengthSize + length > static_cast<size_t>(area.size())) {
      return PieceHeaderError::kHeaderCorrupted;
    }
    PieceHeader header;
    if (!header.ParseFromArray(area.data() + kHeaderLengthSize,
                               static_cast<int>(length))) {
      return PieceHeaderError::kHeaderCorrupted;
    }
    return header;
  }

  orders::PieceHash reconstructPieceHash(const PieceHeader &header,
                                         const primitives::piece::PieceID &id,
                                         int64_t piece_size) {
    orders::PieceHash hash;
    hash.set_piece_id(common::span::toString(id));
    hash.set_hash(header.hash());
    hash.set_piece_size(piece_size);
    *hash.mutable_timestamp() = header.creation_time();
    hash.set_hash_algorithm(header.hash_algorithm());
    hash.set_signature(header.signature());
    return hash;
  }
}  // namespace ps::piecestore

OUTCOME_CPP_DEFINE_CATEGORY(ps::piecestore, PieceHeaderError, e) {
  using ps::piecestore::PieceHeaderError;
  switch (e) {
    case PieceHeaderError::kHeaderTooLarge:
      return "PieceHeaderError: header does not fit into the reserved area";
    case PieceHeaderError::kHeaderCorrupted:
      return "PieceHeaderError: header area is corrupted";
  }
  return "PieceHeaderError: unknown error";
}
