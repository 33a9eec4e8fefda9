/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/trust/trusted_satellites.hpp"

#include <gtest/gtest.h>

#include "common/hexutil.hpp"
#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"
#include "orders/order_error.hpp"
#include "testutil/outcome.hpp"

namespace ps::piecestore::trust {
  using crypto::secp256k1::Secp256k1ProviderImpl;

  /**
   * @given url with public key and address
   * @when parse
   * @then id is derived from the key
   */
  TEST(TrustedSatellitesTest, ParseUrl) {
    Secp256k1ProviderImpl crypto;
    EXPECT_OUTCOME_TRUE(keys, crypto.generate());
    EXPECT_OUTCOME_TRUE(
        info,
        parseSatelliteUrl(common::hex_lower(keys.public_key)
                          + "@satellite.example:7777"));
    EXPECT_EQ(info.public_key, keys.public_key);
    EXPECT_EQ(info.id, NodeID::fromPublicKey(keys.public_key));
    EXPECT_EQ(info.address, "satellite.example:7777");
  }

  /**
   * @given malformed urls
   * @when parse
   * @then invalid url
   */
  TEST(TrustedSatellitesTest, ParseInvalidUrl) {
    EXPECT_OUTCOME_ERROR(TrustError::kInvalidSatelliteUrl,
                         parseSatelliteUrl("no-at-sign"));
    EXPECT_OUTCOME_ERROR(TrustError::kInvalidSatelliteUrl,
                         parseSatelliteUrl("abcd@host:1"));
    EXPECT_OUTCOME_ERROR(
        TrustError::kInvalidSatelliteUrl,
        parseSatelliteUrl(std::string(130, 'a') + "@"));
  }

  /**
   * @given trusted satellite
   * @when lookup and remove
   * @then key is known until removed
   */
  TEST(TrustedSatellitesTest, AddRemove) {
    TrustedSatellites trust;
    SatelliteInfo info;
    info.id = NodeID::fromSpan(Bytes(32, 1)).value();
    info.public_key[0] = 4;
    trust.add(info);
    EXPECT_TRUE(trust.isTrusted(info.id));
    EXPECT_OUTCOME_EQ(trust.publicKey(info.id), info.public_key);
    EXPECT_EQ(trust.satellites(), std::vector<NodeID>{info.id});

    trust.remove(info.id);
    EXPECT_FALSE(trust.isTrusted(info.id));
    EXPECT_OUTCOME_ERROR(orders::OrderError::kUntrustedSatellite,
                         trust.publicKey(info.id));
  }
}  // namespace ps::piecestore::trust
