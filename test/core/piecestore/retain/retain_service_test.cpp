/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/retain/retain_service.hpp"

#include <gtest/gtest.h>
#include <boost/filesystem/fstream.hpp>

#include "common/span.hpp"
#include "piecestore/blobstore/impl/filesystem_blobstore.hpp"
#include "testutil/mocks/clock/utc_clock_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"

namespace ps::piecestore::retain {
  using blobstore::FileSystemBlobStore;
  using clock::Timestamp;
  using clock::UTCClockMock;
  using primitives::piece::PieceID;
  using testing::NiceMock;
  using testing::Return;

  class RetainServiceTest : public test::BaseFS_Test {
   public:
    RetainServiceTest() : test::BaseFS_Test("ps_retain_service_test") {}

    void SetUp() override {
      BaseFS_Test::SetUp();
      ON_CALL(*clock, nowMicro()).WillByDefault(Return(now));
      store = std::make_shared<PieceStore>(
          FileSystemBlobStore::open(base_path, clock).value(), 1 << 20);
      EXPECT_OUTCOME_TRUE_1(store->init());
    }

    PieceID put(Timestamp created) {
      const auto id{PieceID::generate()};
      auto writer{store->writer(satellite, id, orders::pb::SHA256).value()};
      writer->write(Bytes(10, 1)).value();
      PieceHeader header;
      header.set_hash(common::span::toString(writer->hash().value()));
      *header.mutable_creation_time() = orders::toProto(created);
      writer->commit(header).value();
      return id;
    }

    bool exists(const PieceID &id) const {
      return store->exists(satellite, id).value();
    }

    RetainRequest request(Timestamp created_before,
                          const std::vector<PieceID> &retained) const {
      auto filter{BloomFilter::optimal(retained.size(), 0.0001, 0)};
      for (const auto &id : retained) {
        filter.add(id);
      }
      return {satellite, created_before, filter};
    }

    std::shared_ptr<RetainService> service(RetainConfig config) const {
      return std::make_shared<RetainService>(config, store, locks, nullptr);
    }

    Timestamp now{std::chrono::seconds{1571699557}};
    std::shared_ptr<NiceMock<UTCClockMock>> clock{
        std::make_shared<NiceMock<UTCClockMock>>()};
    NodeID satellite{NodeID::fromSpan(Bytes(32, 1)).value()};
    std::shared_ptr<PieceStore> store;
    std::shared_ptr<PieceLocks> locks{std::make_shared<PieceLocks>()};
  };

  /**
   * @given old retained piece, old unretained piece and new piece
   * @when retain
   * @then only old unretained piece is trashed
   */
  TEST_F(RetainServiceTest, TrashesOldUnretained) {
    const auto retained{put(now - std::chrono::hours{2})};
    const auto garbage{put(now - std::chrono::hours{2})};
    const auto fresh{put(now)};
    auto retain{service({})};
    EXPECT_TRUE(retain->queue(request(now - std::chrono::hours{1}, {retained})));
    EXPECT_OUTCOME_EQ(retain->runOnce(), 1);
    EXPECT_TRUE(exists(retained));
    EXPECT_FALSE(exists(garbage));
    EXPECT_TRUE(exists(fresh));

    const auto stats{retain->stats()};
    EXPECT_EQ(stats.requests, 1);
    EXPECT_EQ(stats.pieces_checked, 3);
    EXPECT_EQ(stats.pieces_trashed, 1);
  }

  /**
   * @given piece created shortly before the filter
   * @when time buffer covers the difference
   * @then piece is kept
   */
  TEST_F(RetainServiceTest, TimeBuffer) {
    const auto id{put(now - std::chrono::minutes{30})};
    auto retain{service({RetainStatus::kEnabled, std::chrono::hours{1}})};
    EXPECT_TRUE(retain->queue(request(now, {})));
    EXPECT_OUTCOME_EQ(retain->runOnce(), 0);
    EXPECT_TRUE(exists(id));
  }

  /**
   * @given debug status
   * @when retain
   * @then candidates are only logged
   */
  TEST_F(RetainServiceTest, DebugDoesNotTrash) {
    const auto id{put(now - std::chrono::hours{2})};
    auto retain{service({RetainStatus::kDebug, {}})};
    EXPECT_TRUE(retain->queue(request(now, {})));
    EXPECT_OUTCOME_EQ(retain->runOnce(), 0);
    EXPECT_TRUE(exists(id));
  }

  /**
   * @given disabled status
   * @when queue
   * @then request is dropped
   */
  TEST_F(RetainServiceTest, Disabled) {
    auto retain{service({RetainStatus::kDisabled, {}})};
    EXPECT_FALSE(retain->queue(request(now, {})));
    EXPECT_EQ(retain->pending(), 0);
  }

  /**
   * @given candidate piece locked by a transfer
   * @when retain
   * @then piece is skipped
   */
  TEST_F(RetainServiceTest, LockedPieceSkipped) {
    const auto id{put(now - std::chrono::hours{2})};
    auto guard{locks->tryLock(satellite, id)};
    auto retain{service({})};
    EXPECT_TRUE(retain->queue(request(now, {})));
    EXPECT_OUTCOME_EQ(retain->runOnce(), 0);
    EXPECT_TRUE(exists(id));
    EXPECT_EQ(retain->stats().pieces_skipped, 1);
  }

  /**
   * @given two garbage pieces, one of which cannot be moved to trash
   * @when retain
   * @then sweep continues, the other piece is trashed
   */
  TEST_F(RetainServiceTest, TrashFailureDoesNotStopSweep) {
    const auto blocked{put(now - std::chrono::hours{2})};
    const auto live_dir{base_path / "blobs"};
    fs::path blocked_path;
    for (fs::recursive_directory_iterator it{live_dir}, end; it != end; ++it) {
      if (fs::is_regular_file(it->path())) {
        blocked_path = it->path();
      }
    }
    ASSERT_FALSE(blocked_path.empty());
    const auto occupied{base_path / "trash"
                        / fs::relative(blocked_path, live_dir)};
    fs::create_directories(occupied);
    {
      fs::ofstream file{occupied / "occupied"};
      file << "x";
    }

    const auto garbage{put(now - std::chrono::hours{2})};
    auto retain{service({})};
    EXPECT_TRUE(retain->queue(request(now, {})));
    EXPECT_OUTCOME_EQ(retain->runOnce(), 1);
    EXPECT_TRUE(exists(blocked));
    EXPECT_FALSE(exists(garbage));
    EXPECT_EQ(retain->stats().pieces_skipped, 1);
    EXPECT_EQ(retain->stats().pieces_trashed, 1);
  }

  /**
   * @given two requests of the same satellite
   * @when queued before processing
   * @then newer replaces older
   */
  TEST_F(RetainServiceTest, NewerRequestReplaces) {
    const auto id{put(now - std::chrono::hours{2})};
    auto retain{service({})};
    EXPECT_TRUE(retain->queue(request(now, {})));
    EXPECT_TRUE(retain->queue(request(now, {id})));
    EXPECT_EQ(retain->pending(), 1);
    EXPECT_OUTCOME_EQ(retain->runOnce(), 0);
    EXPECT_TRUE(exists(id));
  }

  /**
   * @given service with io context
   * @when request is queued and io runs
   * @then request is processed
   */
  TEST_F(RetainServiceTest, ProcessedOnIoContext) {
    const auto id{put(now - std::chrono::hours{2})};
    auto io{std::make_shared<boost::asio::io_context>()};
    auto retain{std::make_shared<RetainService>(RetainConfig{}, store, locks, io)};
    EXPECT_TRUE(retain->queue(request(now, {})));
    io->run();
    EXPECT_EQ(retain->pending(), 0);
    EXPECT_FALSE(exists(id));
  }
}  // namespace ps::piecestore::retain
