/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/bloom/bloom_filter.hpp"

#include <algorithm>
#include <cmath>

#include <boost/endian/conversion.hpp>

namespace ps::piecestore::bloom {
  namespace {
    constexpr size_t kPrefixSize = 3;
    constexpr uint8_t kMaxHashCount = 32;
  }  // namespace

  BloomFilter::BloomFilter(uint8_t seed, uint8_t hash_count, size_t table_size)
      : seed_{seed}, hash_count_{hash_count}, table_(table_size, 0) {}

  outcome::result<BloomFilter> BloomFilter::decode(BytesIn encoded) {
    if (static_cast<size_t>(encoded.size()) <= kPrefixSize) {
      return BloomFilterError::kInvalidFilter;
    }
    if (encoded[0] != kVersion) {
      return BloomFilterError::kUnsupportedVersion;
    }
    const auto hash_count{encoded[2]};
    if (hash_count == 0 || hash_count > kMaxHashCount) {
      return BloomFilterError::kInvalidFilter;
    }
    BloomFilter filter{encoded[1], hash_count, 0};
    filter.table_.assign(encoded.begin() + kPrefixSize, encoded.end());
    return filter;
  }

  BloomFilter BloomFilter::optimal(size_t expected_elements,
                                   double false_positive_rate,
                                   uint8_t seed) {
    const auto n{static_cast<double>(std::max<size_t>(expected_elements, 1))};
    const auto ln2{std::log(2.0)};
    const auto bits{std::ceil(-n * std::log(false_positive_rate) / (ln2 * ln2))};
    const auto table_size{std::max<size_t>(
        static_cast<size_t>(std::ceil(bits / 8)), 1)};
    const auto hash_count{std::clamp<double>(
        std::round(static_cast<double>(table_size) * 8 / n * ln2),
        1,
        kMaxHashCount)};
    return BloomFilter{seed, static_cast<uint8_t>(hash_count), table_size};
  }

  uint64_t BloomFilter::hashOf(const PieceID &id, size_t offset) {
    std::array<uint8_t, sizeof(uint64_t)> window{};
    for (size_t i{0}; i < window.size(); ++i) {
      window[i] = id[(offset + i) % id.size()];
    }
    return boost::endian::load_little_u64(window.data());
  }

  void BloomFilter::add(const PieceID &id) {
    const auto bits{table_.size() * 8};
    for (size_t i{0}; i < hash_count_; ++i) {
      const auto bit{hashOf(id, seed_ + i) % bits};
      table_[bit / 8] |= static_cast<uint8_t>(1 << (bit % 8));
    }
  }

  bool BloomFilter::contains(const PieceID &id) const {
    const auto bits{table_.size() * 8};
    for (size_t i{0}; i < hash_count_; ++i) {
      const auto bit{hashOf(id, seed_ + i) % bits};
      if ((table_[bit / 8] & (1 << (bit % 8))) == 0) {
        return false;
      }
    }
    return true;
  }

  Bytes BloomFilter::encode() const {
    Bytes encoded{kVersion, seed_, hash_count_};
    append(encoded, table_);
    return encoded;
  }

  uint8_t BloomFilter::hashCount() const {
    return hash_count_;
  }

  size_t BloomFilter::tableSize() const {
    return table_.size();
  }

}  // namespace ps::piecestore::bloom

OUTCOME_CPP_DEFINE_CATEGORY(ps::piecestore::bloom, BloomFilterError, e) {
  using ps::piecestore::bloom::BloomFilterError;
  switch (e) {
    case BloomFilterError::kInvalidFilter:
      return "BloomFilterError: filter is malformed";
    case BloomFilterError::kUnsupportedVersion:
      return "BloomFilterError: filter version is not supported";
  }
  return "BloomFilterError: unknown error";
}
