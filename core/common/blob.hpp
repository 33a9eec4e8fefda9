/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

#include <boost/container_hash/hash.hpp>

#include "common/bytes.hpp"
#include "common/hexutil.hpp"
#include "common/outcome.hpp"

namespace ps::common {

  /**
   * Error codes for exceptions that may occur during blob initialization
   */
  enum class BlobError { kIncorrectLength = 1 };

  /**
   * Base type which represents blob of fixed size.
   *
   * std::string is usually used to store hex or byte representation, which
   * does not enforce the size. Blob keeps the size a compile-time property.
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
   public:
    /**
     * Initialize blob value
     */
    Blob() : std::array<uint8_t, size_>{} {}

    explicit Blob(const std::array<uint8_t, size_> &array)
        : std::array<uint8_t, size_>{array} {}

    /**
     * @returns static size of the blob
     */
    static constexpr size_t size() {
      return size_;
    }

    /// Converts current blob to hex string
    std::string toHex() const noexcept {
      return hex_lower(*this);
    }

    /**
     * Create Blob from arbitrary span of bytes
     * @param span bytes, must be exactly size_ long
     * @return result containing Blob object if span has correct size
     */
    static outcome::result<Blob<size_>> fromSpan(BytesIn span) {
      if (span.size() != size_) {
        return BlobError::kIncorrectLength;
      }

      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }

    /**
     * Create Blob from hex string
     * @param hex hex string
     * @return result containing Blob object if hex string has proper size and
     * is in hex format
     */
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return fromSpan(bytes);
    }
  };

  using Hash256 = Blob<32>;
}  // namespace ps::common

template <size_t N>
struct std::hash<ps::common::Blob<N>> {
  auto operator()(const ps::common::Blob<N> &blob) const {
    return boost::hash_range(blob.data(), blob.data() + N);  // NOLINT
  }
};

OUTCOME_HPP_DECLARE_ERROR(ps::common, BlobError);
