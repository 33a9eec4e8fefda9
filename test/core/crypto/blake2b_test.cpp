/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/blake2/blake2b.hpp"

#include <gtest/gtest.h>

#include "common/span.hpp"
#include "testutil/literals.hpp"

namespace ps::crypto::blake2b {
  using common::span::cbytes;

  /**
   * @given known inputs
   * @when blake2b-256
   * @then known digests
   */
  TEST(Blake2bTest, KnownAnswers) {
    EXPECT_EQ(
        blake2b_256({}),
        "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8"_blob32);
    EXPECT_EQ(
        blake2b_256(cbytes(std::string{"abc"})),
        "bddd813c634239723171ef3fee98579b94964e3bb1cb3e427262c8c068d52319"_blob32);
  }

  /**
   * @given input longer than one block
   * @when hashed at once and in uneven parts
   * @then digests are equal
   */
  TEST(Blake2bTest, IncrementalUpdate) {
    Bytes data(1000);
    for (size_t i = 0; i < data.size(); ++i) {
      data[i] = static_cast<uint8_t>(i * 7);
    }
    auto expected = blake2b_256(data);

    Ctx ctx{kBlake2b256HashLength};
    BytesIn all{data};
    ctx.update(all.subspan(0, 1));
    ctx.update(all.subspan(1, 128));
    ctx.update(all.subspan(129, 300));
    ctx.update(all.subspan(429));
    Blake2b256Hash actual;
    ctx.final(actual);

    EXPECT_EQ(actual, expected);
  }
}  // namespace ps::crypto::blake2b
