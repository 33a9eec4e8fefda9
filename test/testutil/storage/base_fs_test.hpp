/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_PIECESTORE_BASE_FS_TEST_HPP
#define CPP_PIECESTORE_BASE_FS_TEST_HPP

#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

#include "common/logger.hpp"

namespace fs = boost::filesystem;

namespace test {

  /**
   * @brief Test owning a fresh storage directory. The directory is unique
   * per test case under the system temp directory and is removed with all
   * its contents after the test.
   */
  struct BaseFS_Test : public ::testing::Test {
    /// @param prefix - name prefix of the directory
    explicit BaseFS_Test(std::string prefix);

    void SetUp() override;

    void TearDown() override;

    /// Number of regular files under the directory, recursively
    size_t countFiles(const fs::path &dir) const;

   protected:
    std::string prefix;
    fs::path base_path;
    ps::common::Logger logger;
  };

}  // namespace test

#endif  // CPP_PIECESTORE_BASE_FS_TEST_HPP
