/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/pieces/piece_store.hpp"

#include <gtest/gtest.h>

#include <thread>

#include "common/span.hpp"
#include "piecestore/blobstore/blobstore_error.hpp"
#include "piecestore/blobstore/impl/filesystem_blobstore.hpp"
#include "piecestore/pieces/piece_store_error.hpp"
#include "testutil/buffer_generator.hpp"
#include "testutil/mocks/clock/utc_clock_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"

namespace ps::piecestore::pieces {
  using blobstore::BlobStoreError;
  using blobstore::FileSystemBlobStore;
  using clock::Timestamp;
  using clock::UTCClockMock;
  using orders::toProto;
  using testing::NiceMock;
  using testing::Return;

  class PieceStoreTest : public test::BaseFS_Test {
   public:
    PieceStoreTest() : test::BaseFS_Test("ps_piece_store_test") {}

    void SetUp() override {
      BaseFS_Test::SetUp();
      ON_CALL(*clock, nowMicro()).WillByDefault(Return(now));
      blobs = FileSystemBlobStore::open(base_path, clock).value();
      store = std::make_shared<PieceStore>(blobs, 10000);
      EXPECT_OUTCOME_TRUE_1(store->init());
    }

    PieceHeader headerOf(const PieceWriter &writer, Timestamp created) {
      PieceHeader header;
      header.set_hash(common::span::toString(writer.hash().value()));
      *header.mutable_creation_time() = toProto(created);
      header.set_hash_algorithm(writer.algorithm());
      return header;
    }

    void put(const PieceID &id, const Bytes &data, Timestamp created) {
      EXPECT_OUTCOME_TRUE(writer,
                          store->writer(satellite, id, orders::pb::SHA256));
      EXPECT_OUTCOME_TRUE_1(writer->write(data));
      EXPECT_OUTCOME_TRUE_1(writer->commit(headerOf(*writer, created)));
    }

    Timestamp now{std::chrono::seconds{1571699557}};
    std::shared_ptr<NiceMock<UTCClockMock>> clock{
        std::make_shared<NiceMock<UTCClockMock>>()};
    NodeID satellite{NodeID::fromSpan(Bytes(32, 1)).value()};
    testutils::BufferGenerator generator;
    std::shared_ptr<FileSystemBlobStore> blobs;
    std::shared_ptr<PieceStore> store;
  };

  /**
   * @given piece written in two parts
   * @when commit and read back
   * @then payload and header are returned, space is accounted
   */
  TEST_F(PieceStoreTest, WriteRead) {
    const auto id{PieceID::generate()};
    const auto data{generator.makeRandomBuffer(1000)};
    EXPECT_OUTCOME_TRUE(writer,
                        store->writer(satellite, id, orders::pb::SHA256));
    BytesIn all{data};
    EXPECT_OUTCOME_TRUE_1(writer->write(all.subspan(0, 500)));
    EXPECT_OUTCOME_TRUE_1(writer->write(all.subspan(500)));
    EXPECT_EQ(writer->size(), 1000);
    auto header{headerOf(*writer, now)};
    EXPECT_OUTCOME_TRUE_1(writer->commit(header));
    EXPECT_OUTCOME_ERROR(PieceStoreError::kWriterClosed,
                         writer->write(all.subspan(0, 1)));
    EXPECT_EQ(store->usedSpace(), 1000);
    EXPECT_EQ(store->availableSpace(), 9000);

    EXPECT_OUTCOME_EQ(store->exists(satellite, id), true);
    EXPECT_OUTCOME_TRUE(reader, store->reader(satellite, id));
    EXPECT_EQ(reader->size(), 1000);
    Bytes read(1000);
    EXPECT_OUTCOME_EQ(reader->read(0, read), 1000);
    EXPECT_EQ(read, data);

    EXPECT_OUTCOME_TRUE(stored, reader->header());
    EXPECT_EQ(stored.format_version(), PieceHeader::FORMAT_V1);
    EXPECT_EQ(stored.hash(), header.hash());
  }

  /**
   * @given cancelled writer
   * @when check existence
   * @then piece does not exist and no space is used
   */
  TEST_F(PieceStoreTest, Cancel) {
    const auto id{PieceID::generate()};
    EXPECT_OUTCOME_TRUE(writer,
                        store->writer(satellite, id, orders::pb::SHA256));
    EXPECT_OUTCOME_TRUE_1(writer->write(generator.makeRandomBuffer(100)));
    EXPECT_OUTCOME_TRUE_1(writer->cancel());
    EXPECT_OUTCOME_EQ(store->exists(satellite, id), false);
    EXPECT_EQ(store->usedSpace(), 0);
  }

  /**
   * @given stored piece
   * @when trash, restore and remove
   * @then existence and used space follow
   */
  TEST_F(PieceStoreTest, TrashRestoreRemove) {
    const auto id{PieceID::generate()};
    put(id, generator.makeRandomBuffer(100), now);

    EXPECT_OUTCOME_TRUE_1(store->trash(satellite, id));
    EXPECT_OUTCOME_EQ(store->exists(satellite, id), false);
    EXPECT_EQ(store->usedSpace(), 0);
    EXPECT_OUTCOME_EQ(store->trashSatellites(),
                      std::vector<NodeID>{satellite});

    EXPECT_OUTCOME_EQ(store->restoreTrash(satellite), 1);
    EXPECT_OUTCOME_EQ(store->exists(satellite, id), true);
    EXPECT_EQ(store->usedSpace(), 100);

    EXPECT_OUTCOME_TRUE_1(store->remove(satellite, id));
    EXPECT_OUTCOME_EQ(store->exists(satellite, id), false);
    EXPECT_EQ(store->usedSpace(), 0);
    EXPECT_OUTCOME_ERROR(BlobStoreError::kBlobNotFound,
                         store->remove(satellite, id));
  }

  /**
   * @given stored piece
   * @when writer is opened for the same id
   * @then kPieceAlreadyExists, content and used space are unchanged
   */
  TEST_F(PieceStoreTest, ExistingPieceRejected) {
    const auto id{PieceID::generate()};
    const auto data{generator.makeRandomBuffer(100)};
    put(id, data, now);
    EXPECT_OUTCOME_ERROR(PieceStoreError::kPieceAlreadyExists,
                         store->writer(satellite, id, orders::pb::SHA256));
    EXPECT_EQ(store->usedSpace(), 100);

    EXPECT_OUTCOME_TRUE(reader, store->reader(satellite, id));
    Bytes read(100);
    EXPECT_OUTCOME_EQ(reader->read(0, read), 100);
    EXPECT_EQ(read, data);
  }

  /**
   * @given two writers of one id opened before either commits
   * @when both commit
   * @then second commit fails and space is counted once
   */
  TEST_F(PieceStoreTest, RacingWritersCountedOnce) {
    const auto id{PieceID::generate()};
    EXPECT_OUTCOME_TRUE(first,
                        store->writer(satellite, id, orders::pb::SHA256));
    EXPECT_OUTCOME_TRUE(second,
                        store->writer(satellite, id, orders::pb::SHA256));
    EXPECT_OUTCOME_TRUE_1(first->write(generator.makeRandomBuffer(100)));
    EXPECT_OUTCOME_TRUE_1(second->write(generator.makeRandomBuffer(50)));
    EXPECT_OUTCOME_TRUE_1(first->commit(headerOf(*first, now)));
    EXPECT_OUTCOME_ERROR(PieceStoreError::kPieceAlreadyExists,
                         second->commit(headerOf(*second, now)));
    EXPECT_EQ(store->usedSpace(), 100);
  }

  /**
   * @given trashed piece stored again under the same id
   * @when restore trash
   * @then live piece is kept and counted once
   */
  TEST_F(PieceStoreTest, RestoreKeepsLivePiece) {
    const auto id{PieceID::generate()};
    put(id, generator.makeRandomBuffer(100), now);
    EXPECT_OUTCOME_TRUE_1(store->trash(satellite, id));
    const auto fresh{generator.makeRandomBuffer(40)};
    put(id, fresh, now);
    EXPECT_EQ(store->usedSpace(), 40);

    EXPECT_OUTCOME_EQ(store->restoreTrash(satellite), 0);
    EXPECT_EQ(store->usedSpace(), 40);
    EXPECT_OUTCOME_TRUE(reader, store->reader(satellite, id));
    EXPECT_EQ(reader->size(), 40);
  }

  /**
   * @given store initialized before pieces were added by another instance
   * @when piece is removed
   * @then used space saturates at zero
   */
  TEST_F(PieceStoreTest, UsedSpaceDoesNotWrap) {
    auto other{std::make_shared<PieceStore>(blobs, 10000)};
    const auto id{PieceID::generate()};
    EXPECT_OUTCOME_TRUE(writer,
                        other->writer(satellite, id, orders::pb::SHA256));
    EXPECT_OUTCOME_TRUE_1(writer->write(generator.makeRandomBuffer(100)));
    EXPECT_OUTCOME_TRUE_1(writer->commit(headerOf(*writer, now)));
    EXPECT_EQ(store->usedSpace(), 0);

    EXPECT_OUTCOME_TRUE_1(store->remove(satellite, id));
    EXPECT_EQ(store->usedSpace(), 0);
    EXPECT_EQ(store->availableSpace(), 10000);
  }

  /**
   * @given pieces stored and removed from several threads
   * @when all threads finish
   * @then used space counts exactly the kept pieces
   */
  TEST_F(PieceStoreTest, ConcurrentAccounting) {
    constexpr size_t kThreads{4};
    constexpr size_t kPieces{20};
    std::vector<std::thread> threads;
    for (size_t t = 0; t < kThreads; ++t) {
      threads.emplace_back([this] {
        for (size_t i = 0; i < kPieces; ++i) {
          const auto id{PieceID::generate()};
          auto writer{
              store->writer(satellite, id, orders::pb::SHA256).value()};
          writer->write(Bytes(10, 1)).value();
          writer->commit(headerOf(*writer, now)).value();
          if (i % 2 == 0) {
            store->remove(satellite, id).value();
          }
        }
      });
    }
    for (auto &thread : threads) {
      thread.join();
    }
    EXPECT_EQ(store->usedSpace(), kThreads * kPieces / 2 * 10);
  }

  /**
   * @given two stored pieces
   * @when one is removed while walk visits the other
   * @then walk succeeds and skips the removed piece
   */
  TEST_F(PieceStoreTest, WalkSkipsRemovedPieces) {
    const auto first{PieceID::generate()};
    const auto second{PieceID::generate()};
    put(first, generator.makeRandomBuffer(10), now);
    put(second, generator.makeRandomBuffer(10), now);

    std::vector<PieceID> seen;
    EXPECT_OUTCOME_TRUE_1(store->walk(
        satellite, [&](const PieceInfo &info) -> outcome::result<void> {
          seen.push_back(info.id);
          OUTCOME_TRY(store->remove(satellite,
                                    info.id == first ? second : first));
          return outcome::success();
        }));
    ASSERT_EQ(seen.size(), 1);
    EXPECT_OUTCOME_EQ(store->exists(satellite, seen[0]), true);
  }

  /**
   * @given pieces with different creation times
   * @when walk
   * @then creation time comes from the header
   */
  TEST_F(PieceStoreTest, WalkCreationTime) {
    const auto old_id{PieceID::generate()};
    const auto new_id{PieceID::generate()};
    const auto old_time{now - std::chrono::hours{10}};
    put(old_id, generator.makeRandomBuffer(10), old_time);
    put(new_id, generator.makeRandomBuffer(20), now);

    std::map<PieceID, PieceInfo> seen;
    EXPECT_OUTCOME_TRUE_1(store->walk(
        satellite, [&](const PieceInfo &info) -> outcome::result<void> {
          seen.emplace(info.id, info);
          return outcome::success();
        }));
    ASSERT_EQ(seen.size(), 2);
    EXPECT_EQ(seen.at(old_id).creation_time, old_time);
    EXPECT_EQ(seen.at(old_id).size, 10);
    EXPECT_EQ(seen.at(new_id).creation_time, now);
    EXPECT_EQ(seen.at(new_id).size, 20);
  }

  /**
   * @given pieces stored by earlier store instance
   * @when new store is initialized
   * @then used space is counted
   */
  TEST_F(PieceStoreTest, InitCountsUsedSpace) {
    put(PieceID::generate(), generator.makeRandomBuffer(10), now);
    put(PieceID::generate(), generator.makeRandomBuffer(20), now);
    auto reopened{std::make_shared<PieceStore>(blobs, 10000)};
    EXPECT_OUTCOME_TRUE_1(reopened->init());
    EXPECT_EQ(reopened->usedSpace(), 30);
  }
}  // namespace ps::piecestore::pieces
