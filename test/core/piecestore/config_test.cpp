/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/config.hpp"

#include <gtest/gtest.h>
#include <boost/filesystem/fstream.hpp>
#include <sstream>

#include "common/hexutil.hpp"
#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"

namespace ps::piecestore {

  class ConfigTest : public test::BaseFS_Test {
   public:
    ConfigTest() : test::BaseFS_Test("ps_config_test") {}
  };

  /**
   * @given storage without config file
   * @when read config
   * @then defaults
   */
  TEST_F(ConfigTest, Defaults) {
    EXPECT_OUTCOME_TRUE(config, Config::read(base_path));
    EXPECT_EQ(config.storage_path, base_path);
    EXPECT_EQ(config.allocated_space, Config::kTiB);
    EXPECT_EQ(config.max_chunk_size, 256 << 10);
    EXPECT_EQ(config.max_unsent_orders, 10000);
    EXPECT_EQ(config.order_limit_grace_period, std::chrono::hours{1});
    EXPECT_EQ(config.trash_expiry, std::chrono::hours{168});
    EXPECT_EQ(config.retain.status, RetainStatus::kEnabled);
    EXPECT_EQ(config.retain.time_buffer, std::chrono::seconds{0});
    EXPECT_TRUE(config.trusted_satellites.empty());
  }

  /**
   * @given config file with all options
   * @when read config
   * @then values are parsed
   */
  TEST_F(ConfigTest, ReadFile) {
    crypto::secp256k1::Secp256k1ProviderImpl crypto;
    const auto keys{crypto.generate().value()};
    {
      fs::ofstream file{base_path / "config.cfg"};
      file << "allocated-space=1000000\n"
           << "max-chunk-size=4096\n"
           << "max-unsent-orders=50\n"
           << "order-limit-grace-period=60\n"
           << "trash-expiry=24\n"
           << "log=d\n"
           << "trusted-satellite=" << common::hex_lower(keys.public_key)
           << "@127.0.0.1:7777\n"
           << "[retain]\n"
           << "status=debug\n"
           << "time-buffer=3600\n";
    }
    EXPECT_OUTCOME_TRUE(config, Config::read(base_path));
    EXPECT_EQ(config.allocated_space, 1000000);
    EXPECT_EQ(config.max_chunk_size, 4096);
    EXPECT_EQ(config.max_unsent_orders, 50);
    EXPECT_EQ(config.order_limit_grace_period, std::chrono::seconds{60});
    EXPECT_EQ(config.trash_expiry, std::chrono::hours{24});
    EXPECT_EQ(config.log_level, spdlog::level::debug);
    EXPECT_EQ(config.retain.status, RetainStatus::kDebug);
    EXPECT_EQ(config.retain.time_buffer, std::chrono::hours{1});
    ASSERT_EQ(config.trusted_satellites.size(), 1);
    EXPECT_EQ(config.trusted_satellites[0].public_key, keys.public_key);
    EXPECT_EQ(config.trusted_satellites[0].address, "127.0.0.1:7777");
  }

  /**
   * @given invalid values
   * @when parse
   * @then invalid value
   */
  TEST_F(ConfigTest, InvalidValues) {
    for (const auto &text : {"retain.status=sometimes\n",
                             "trash-expiry=-1\n",
                             "max-chunk-size=0\n",
                             "max-unsent-orders=0\n",
                             "allocated-space=lots\n",
                             "unknown-option=1\n"}) {
      std::istringstream input{text};
      EXPECT_OUTCOME_ERROR(ConfigError::kInvalidValue,
                           Config::parse(input, base_path));
    }
  }

  /**
   * @given retain status names
   * @when converted both ways
   * @then same status
   */
  TEST(RetainStatusTest, Names) {
    for (auto status :
         {RetainStatus::kEnabled, RetainStatus::kDebug, RetainStatus::kDisabled}) {
      EXPECT_OUTCOME_EQ(retainStatusFromString(retainStatusToString(status)),
                        status);
    }
  }
}  // namespace ps::piecestore
