/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/retain/trash_chore.hpp"

#include <gtest/gtest.h>

#include "common/span.hpp"
#include "piecestore/blobstore/impl/filesystem_blobstore.hpp"
#include "testutil/mocks/clock/utc_clock_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"

namespace ps::piecestore::retain {
  using blobstore::FileSystemBlobStore;
  using clock::Timestamp;
  using clock::UTCClockMock;
  using primitives::NodeID;
  using primitives::piece::PieceID;
  using testing::NiceMock;
  using testing::Return;

  class TrashChoreTest : public test::BaseFS_Test {
   public:
    TrashChoreTest() : test::BaseFS_Test("ps_trash_chore_test") {}

    void SetUp() override {
      BaseFS_Test::SetUp();
      ON_CALL(*clock, nowMicro()).WillByDefault(Return(now));
      store = std::make_shared<PieceStore>(
          FileSystemBlobStore::open(base_path, clock).value(), 1 << 20);
      EXPECT_OUTCOME_TRUE_1(store->init());
      chore = std::make_shared<TrashChore>(
          store, clock, std::chrono::hours{24}, io, std::chrono::hours{1});
    }

    /// Piece trashed at given time
    PieceID trashed(Timestamp at) {
      const auto id{PieceID::generate()};
      auto writer{store->writer(satellite, id, orders::pb::SHA256).value()};
      writer->write(Bytes(10, 1)).value();
      PieceHeader header;
      header.set_hash(common::span::toString(writer->hash().value()));
      writer->commit(header).value();
      EXPECT_CALL(*clock, nowMicro()).WillOnce(Return(at));
      store->trash(satellite, id).value();
      testing::Mock::VerifyAndClearExpectations(clock.get());
      return id;
    }

    Timestamp now{std::chrono::seconds{1571699557}};
    std::shared_ptr<NiceMock<UTCClockMock>> clock{
        std::make_shared<NiceMock<UTCClockMock>>()};
    NodeID satellite{NodeID::fromSpan(Bytes(32, 1)).value()};
    std::shared_ptr<boost::asio::io_context> io{
        std::make_shared<boost::asio::io_context>()};
    std::shared_ptr<PieceStore> store;
    std::shared_ptr<TrashChore> chore;
  };

  /**
   * @given pieces trashed two days and one hour ago
   * @when chore runs with one day expiry
   * @then only the older one is deleted
   */
  TEST_F(TrashChoreTest, DeletesExpiredOnly) {
    const auto expired{trashed(now - std::chrono::hours{48})};
    const auto recent{trashed(now - std::chrono::hours{1})};
    EXPECT_OUTCOME_EQ(chore->runOnce(), 1);

    EXPECT_OUTCOME_TRUE(left, store->emptyTrash(satellite, now));
    ASSERT_EQ(left, 1);
    EXPECT_NE(expired, recent);
  }

  /**
   * @given started chore
   * @when stopped before the first interval
   * @then io context runs out of work
   */
  TEST_F(TrashChoreTest, StartStop) {
    chore->start();
    chore->stop();
    io->run();
    EXPECT_TRUE(io->stopped());
  }
}  // namespace ps::piecestore::retain
