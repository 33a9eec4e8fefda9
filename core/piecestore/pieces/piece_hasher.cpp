/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/pieces/piece_hasher.hpp"

#include "crypto/blake2/blake2b.hpp"
#include "crypto/sha/sha256.hpp"
#include "piecestore/pieces/piece_store_error.hpp"

namespace ps::piecestore::pieces {
  namespace {
    class Sha256PieceHasher : public PieceHasher {
     public:
      outcome::result<void> write(BytesIn data) override {
        return sha_.write(data);
      }

      outcome::result<Bytes> digest() const override {
        crypto::sha::Hash256 hash;
        OUTCOME_TRY(sha_.digestOut(hash));
        return copy(hash);
      }

      PieceHashAlgorithm algorithm() const override {
        return orders::pb::SHA256;
      }

     private:
      crypto::sha::Sha256 sha_;
    };

    class Blake2bPieceHasher : public PieceHasher {
     public:
      outcome::result<void> write(BytesIn data) override {
        ctx_.update(data);
        return outcome::success();
      }

      outcome::result<Bytes> digest() const override {
        auto ctx{ctx_};
        crypto::blake2b::Blake2b256Hash hash;
        ctx.final(hash);
        return copy(hash);
      }

      PieceHashAlgorithm algorithm() const override {
        return orders::pb::BLAKE2B_256;
      }

     private:
      crypto::blake2b::Ctx ctx_{crypto::blake2b::kBlake2b256HashLength};
    };
  }  // namespace

  outcome::result<std::unique_ptr<PieceHasher>> makePieceHasher(
      PieceHashAlgorithm algorithm) {
    switch (algorithm) {
      case orders::pb::SHA256:
        return std::make_unique<Sha256PieceHasher>();
      case orders::pb::BLAKE2B_256:
        return std::make_unique<Blake2bPieceHasher>();
      default:
        return PieceStoreError::kUnsupportedHashAlgorithm;
    }
  }

}  // namespace ps::piecestore::pieces
