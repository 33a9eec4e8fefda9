/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace ps::codec::base32 {

  enum class Base32Error {
    kInvalidCharacter = 1,
    kInvalidLength,
  };

  /**
   * Encode bytes with RFC4648 alphabet (upper case), padding stripped
   */
  std::string encode(BytesIn bytes);

  /**
   * Same as encode() with the alphabet in lower case, used for file names
   */
  std::string encodeLower(BytesIn bytes);

  /**
   * Decode unpadded RFC4648 base32, case insensitive
   * @param str - encoded string without '=' padding
   */
  outcome::result<Bytes> decode(std::string_view str);

}  // namespace ps::codec::base32

OUTCOME_HPP_DECLARE_ERROR(ps::codec::base32, Base32Error);
