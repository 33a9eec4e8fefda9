/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "common/blob.hpp"
#include "primitives/node_id/node_id.hpp"

namespace libp2p::crypto::hmac {
  class HmacProviderCtrImpl;
}  // namespace libp2p::crypto::hmac

namespace ps::primitives::piece {

  enum class PieceIdError {
    kInvalidLength = 1,
    kInvalidEncoding,
    kRandomSourceFailure,
  };

  constexpr size_t kPieceIdLength = 32;

  class PieceIDDeriver;

  /**
   * Identifier of a piece of erasure coded data.
   * Root ids are random, ids stored on nodes are derived from the root id for
   * every (node, piece number) pair.
   */
  struct PieceID : public common::Blob<kPieceIdLength> {
    using Blob::Blob;

    /**
     * Random id from OpenSSL CSPRNG
     * @throws std::system_error if randomness source fails
     */
    static PieceID generate();

    /// Raw form, exactly 32 bytes
    static outcome::result<PieceID> fromSpan(BytesIn bytes);

    /// Textual form, unpadded base32
    static outcome::result<PieceID> fromString(std::string_view str);

    /// Generic storage cell, same as raw form
    static outcome::result<PieceID> fromCell(const Bytes &cell);

    BytesIn bytes() const;

    std::string toString() const;

    Bytes toCell() const;

    bool isZero() const;

    /// Deriver keyed by this id, reusable for many derivations
    PieceIDDeriver deriver() const;

    /// Id of this piece on given node, same as deriver().derive(...)
    PieceID derive(const NodeID &node, uint32_t piece_num) const;
  };

  /**
   * HMAC-SHA512 keyed by a root piece id.
   * Owns its mac state, not thread-safe.
   */
  class PieceIDDeriver {
   public:
    explicit PieceIDDeriver(const PieceID &root);
    PieceIDDeriver(PieceIDDeriver &&) noexcept;
    PieceIDDeriver &operator=(PieceIDDeriver &&) noexcept;
    ~PieceIDDeriver();

    /// First 32 bytes of HMAC(node_id || be32(piece_num))
    PieceID derive(const NodeID &node, uint32_t piece_num);

   private:
    std::unique_ptr<libp2p::crypto::hmac::HmacProviderCtrImpl> mac_;
  };

}  // namespace ps::primitives::piece

template <>
struct std::hash<ps::primitives::piece::PieceID>
    : std::hash<ps::common::Blob<ps::primitives::piece::kPieceIdLength>> {};

OUTCOME_HPP_DECLARE_ERROR(ps::primitives::piece, PieceIdError);
