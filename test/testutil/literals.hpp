/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_PIECESTORE_TEST_TESTUTIL_LITERALS_HPP
#define CPP_PIECESTORE_TEST_TESTUTIL_LITERALS_HPP

#include "common/blob.hpp"
#include "common/hexutil.hpp"

inline std::vector<uint8_t> operator""_unhex(const char *c, size_t s) {
  return ps::common::unhex(std::string_view(c, s)).value();
}

inline ps::common::Hash256 operator""_hash256(const char *c, size_t s) {
  return ps::common::Hash256::fromHex(std::string_view(c, s)).value();
}

inline ps::common::Blob<32> operator""_blob32(const char *c, size_t s) {
  return ps::common::Blob<32>::fromHex(std::string_view(c, s)).value();
}

#endif  // CPP_PIECESTORE_TEST_TESTUTIL_LITERALS_HPP
