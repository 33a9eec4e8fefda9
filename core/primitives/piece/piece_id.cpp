/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/piece/piece_id.hpp"

#include <algorithm>

#include <boost/endian/conversion.hpp>
#include <libp2p/crypto/common.hpp>
#include <libp2p/crypto/hmac_provider/hmac_provider_ctr_impl.hpp>
#include <openssl/rand.h>

#include "codec/base32/base32.hpp"

namespace ps::primitives::piece {
  using libp2p::crypto::common::HashType;
  using libp2p::crypto::hmac::HmacProviderCtrImpl;

  constexpr size_t kSha512Length = 64;

  PieceID PieceID::generate() {
    PieceID id;
    if (RAND_bytes(id.data(), static_cast<int>(id.size())) != 1) {
      outcome::raise(PieceIdError::kRandomSourceFailure);
    }
    return id;
  }

  outcome::result<PieceID> PieceID::fromSpan(BytesIn bytes) {
    if (bytes.size() != kPieceIdLength) {
      return PieceIdError::kInvalidLength;
    }
    PieceID id;
    std::copy(bytes.begin(), bytes.end(), id.begin());
    return id;
  }

  outcome::result<PieceID> PieceID::fromString(std::string_view str) {
    auto bytes{codec::base32::decode(str)};
    if (!bytes) {
      return PieceIdError::kInvalidEncoding;
    }
    return fromSpan(bytes.value());
  }

  outcome::result<PieceID> PieceID::fromCell(const Bytes &cell) {
    return fromSpan(cell);
  }

  BytesIn PieceID::bytes() const {
    return *this;
  }

  std::string PieceID::toString() const {
    return codec::base32::encode(*this);
  }

  Bytes PieceID::toCell() const {
    return {begin(), end()};
  }

  bool PieceID::isZero() const {
    return std::all_of(begin(), end(), [](auto b) { return b == 0; });
  }

  PieceIDDeriver PieceID::deriver() const {
    return PieceIDDeriver{*this};
  }

  PieceID PieceID::derive(const NodeID &node, uint32_t piece_num) const {
    return deriver().derive(node, piece_num);
  }

  PieceIDDeriver::PieceIDDeriver(const PieceID &root)
      : mac_{std::make_unique<HmacProviderCtrImpl>(HashType::SHA512,
                                                   root.toCell())} {}

  PieceIDDeriver::PieceIDDeriver(PieceIDDeriver &&) noexcept = default;

  PieceIDDeriver &PieceIDDeriver::operator=(PieceIDDeriver &&) noexcept =
      default;

  PieceIDDeriver::~PieceIDDeriver() = default;

  PieceID PieceIDDeriver::derive(const NodeID &node, uint32_t piece_num) {
    std::array<uint8_t, sizeof(uint32_t)> num{};
    boost::endian::store_big_u32(num.data(), piece_num);

    std::array<uint8_t, kSha512Length> digest{};
    mac_->reset().value();
    mac_->write(node).value();
    mac_->write(num).value();
    mac_->digestOut(digest).value();

    PieceID derived;
    std::copy_n(digest.begin(), derived.size(), derived.begin());
    return derived;
  }

}  // namespace ps::primitives::piece

OUTCOME_CPP_DEFINE_CATEGORY(ps::primitives::piece, PieceIdError, e) {
  using ps::primitives::piece::PieceIdError;
  switch (e) {
    case PieceIdError::kInvalidLength:
      return "PieceIdError: piece id must be 32 bytes";
    case PieceIdError::kInvalidEncoding:
      return "PieceIdError: piece id is not valid base32";
    case PieceIdError::kRandomSourceFailure:
      return "PieceIdError: random source failed";
  }
  return "PieceIdError: unknown error";
}
