/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/piece/piece_id.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

namespace ps::primitives::piece {

  class PieceIdTest : public ::testing::Test {
   public:
    PieceID root{PieceID::fromSpan(Bytes{
        0,  1,  2,  3,  4,  5,  6,  7,  8,  9,  10, 11, 12, 13, 14, 15,
        16, 17, 18, 19, 20, 21, 22, 23, 24, 25, 26, 27, 28, 29, 30, 31,
    }).value()};
    NodeID node{NodeID::fromSpan(Bytes(kNodeIdLength, 0xaa)).value()};
  };

  /**
   * @given 32 random bytes
   * @when construct piece id from them
   * @then raw form equals input
   */
  TEST_F(PieceIdTest, FromSpanKeepsBytes) {
    const auto bytes{PieceID::generate().toCell()};
    EXPECT_OUTCOME_TRUE(id, PieceID::fromSpan(bytes));
    EXPECT_EQ(Bytes(id.bytes().begin(), id.bytes().end()), bytes);
    EXPECT_EQ(id.toCell(), bytes);
  }

  /**
   * @given 31 and 33 bytes
   * @when construct piece id
   * @then invalid length error
   */
  TEST_F(PieceIdTest, FromSpanWrongLength) {
    EXPECT_OUTCOME_ERROR(PieceIdError::kInvalidLength,
                         PieceID::fromSpan(Bytes(31)));
    EXPECT_OUTCOME_ERROR(PieceIdError::kInvalidLength,
                         PieceID::fromSpan(Bytes(33)));
    EXPECT_OUTCOME_ERROR(PieceIdError::kInvalidLength,
                         PieceID::fromCell(Bytes{}));
  }

  /**
   * @given known id
   * @when encode to text
   * @then unpadded base32 and decodes back
   */
  TEST_F(PieceIdTest, StringRoundTrip) {
    EXPECT_EQ(root.toString(),
              "AAAQEAYEAUDAOCAJBIFQYDIOB4IBCEQTCQKRMFYYDENBWHA5DYPQ");
    EXPECT_OUTCOME_EQ(PieceID::fromString(root.toString()), root);
    const auto random{PieceID::generate()};
    EXPECT_OUTCOME_EQ(PieceID::fromString(random.toString()), random);
  }

  /**
   * @given text which is not base32 or encodes wrong length
   * @when decode
   * @then invalid encoding error
   */
  TEST_F(PieceIdTest, FromStringInvalid) {
    EXPECT_OUTCOME_ERROR(PieceIdError::kInvalidEncoding,
                         PieceID::fromString("not base32 at all!"));
    EXPECT_OUTCOME_ERROR(PieceIdError::kInvalidLength,
                         PieceID::fromString("AAAQEAYE"));
  }

  /**
   * @given root id, node id, piece number
   * @when derive
   * @then first half of HMAC-SHA512(root, node || be32(num))
   */
  TEST_F(PieceIdTest, DeriveKnownAnswer) {
    EXPECT_EQ(
        root.derive(node, 0),
        "df204770defcd670b18d77079f7a0d1f29fb9ec080f3e42a21589f297fed2154"_blob32);
    EXPECT_EQ(
        root.derive(node, 1),
        "925edceab56c9b5b1233b94960b8fe0aed140ad66b2359eafad478e9433c7bdc"_blob32);
    EXPECT_EQ(root.derive(node, 1).toString(),
              "SJPNZ2VVNSNVWERTXFEWBOH6BLWRICWWNMRVT2X22R4OSQZ4PPOA");
  }

  /**
   * @given deriver of an id
   * @when derive repeatedly and in different order
   * @then same results as one-shot derive
   */
  TEST_F(PieceIdTest, DeriverIsDeterministic) {
    auto deriver{root.deriver()};
    const auto first{deriver.derive(node, 2)};
    EXPECT_EQ(deriver.derive(node, 1), root.derive(node, 1));
    EXPECT_EQ(deriver.derive(node, 2), first);
    EXPECT_EQ(deriver.derive(node, 2), root.derive(node, 2));
    EXPECT_NE(deriver.derive(node, 1), deriver.derive(node, 2));
  }

  /**
   * @given two nodes
   * @when derive same piece number
   * @then ids differ
   */
  TEST_F(PieceIdTest, DeriveDependsOnNode) {
    const auto other{NodeID::fromSpan(Bytes(kNodeIdLength, 0xbb)).value()};
    EXPECT_NE(root.derive(node, 7), root.derive(other, 7));
  }

  /**
   * @given generated ids
   * @then they are not zero and differ
   */
  TEST_F(PieceIdTest, Generate) {
    const auto a{PieceID::generate()};
    const auto b{PieceID::generate()};
    EXPECT_FALSE(a.isZero());
    EXPECT_NE(a, b);
    EXPECT_TRUE(PieceID{}.isZero());
  }

}  // namespace ps::primitives::piece
