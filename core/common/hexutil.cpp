/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string/case_conv.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(ps::common, UnhexError, e) {
  using ps::common::UnhexError;
  switch (e) {
    case UnhexError::kNonHexInput:
      return "Input contains non-hex characters";
    case UnhexError::kNotEnoughInput:
      return "Input contains odd number of characters";
    default:
      return "Unknown error";
  }
}

namespace ps::common {

  std::string hex_upper(BytesIn bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex(bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  std::string hex_lower(BytesIn bytes) {
    return boost::algorithm::to_lower_copy(hex_upper(bytes));
  }

  outcome::result<Bytes> unhex(std::string_view hex) {
    Bytes blob;
    blob.reserve((hex.size() + 1) / 2);

    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(blob));
      return blob;
    } catch (const boost::algorithm::not_enough_input &e) {
      return UnhexError::kNotEnoughInput;
    } catch (const boost::algorithm::non_hex_input &e) {
      return UnhexError::kNonHexInput;
    } catch (const std::exception &e) {
      return UnhexError::kUnknown;
    }
  }
}  // namespace ps::common
