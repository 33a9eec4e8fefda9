/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace ps::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    kNotEnoughInput = 1,
    kNonHexInput,
    kUnknown
  };

  /**
   * @brief Converts bytes to uppercase hex representation
   * @param bytes bytes to convert
   * @return hex representation
   */
  std::string hex_upper(BytesIn bytes);

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes bytes to convert
   * @return hex representation
   */
  std::string hex_lower(BytesIn bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex hex string of even length
   * @return bytes or UnhexError
   */
  outcome::result<Bytes> unhex(std::string_view hex);

}  // namespace ps::common

OUTCOME_HPP_DECLARE_ERROR(ps::common, UnhexError);
