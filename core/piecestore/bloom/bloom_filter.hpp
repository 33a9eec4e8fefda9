/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "primitives/piece/piece_id.hpp"

namespace ps::piecestore::bloom {
  using primitives::piece::PieceID;

  enum class BloomFilterError {
    kInvalidFilter = 1,
    kUnsupportedVersion,
  };

  /**
   * Filter of piece ids a satellite wants to keep.
   *
   * Encoded as [version][seed][hash count][table]. Hash number i of an id is
   * the little endian u64 read from the id at offset (seed + i) mod 32,
   * wrapping around its end.
   */
  class BloomFilter {
   public:
    static constexpr uint8_t kVersion = 1;

    BloomFilter(uint8_t seed, uint8_t hash_count, size_t table_size);

    static outcome::result<BloomFilter> decode(BytesIn encoded);

    /**
     * Filter sized for expected number of elements
     * @param false_positive_rate - in (0, 1)
     */
    static BloomFilter optimal(size_t expected_elements,
                               double false_positive_rate,
                               uint8_t seed);

    void add(const PieceID &id);

    /// False positives are possible, false negatives are not
    bool contains(const PieceID &id) const;

    Bytes encode() const;

    uint8_t hashCount() const;

    size_t tableSize() const;

   private:
    static uint64_t hashOf(const PieceID &id, size_t offset);

    uint8_t seed_;
    uint8_t hash_count_;
    Bytes table_;
  };

}  // namespace ps::piecestore::bloom

OUTCOME_HPP_DECLARE_ERROR(ps::piecestore::bloom, BloomFilterError);
