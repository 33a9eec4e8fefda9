/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/endpoint/download_session.hpp"

#include <gtest/gtest.h>

#include "fsm/error.hpp"
#include "orders/signing.hpp"
#include "piecestore/endpoint/endpoint_error.hpp"
#include "testutil/piecestore/endpoint_fixture.hpp"

namespace ps::piecestore::endpoint {

  class DownloadSessionTest : public testutils::EndpointFixture {
   public:
    DownloadSessionTest() : EndpointFixture("ps_download_session_test") {}

    void SetUp() override {
      EndpointFixture::SetUp();
      EXPECT_OUTCOME_TRUE_1(upload(id, data, now));
    }

    PieceDownloadRequest first(int64_t limit_amount,
                               int64_t order_amount,
                               int64_t offset,
                               int64_t size) {
      limit = limitFor(id, orders::pb::GET, limit_amount);
      PieceDownloadRequest request;
      *request.mutable_limit() = limit;
      if (order_amount != 0) {
        *request.mutable_order() = uplink.order(limit, order_amount);
      }
      request.mutable_chunk()->set_offset(offset);
      request.mutable_chunk()->set_chunk_size(size);
      return request;
    }

    PieceDownloadRequest order(int64_t amount) const {
      PieceDownloadRequest request;
      *request.mutable_order() = uplink.order(limit, amount);
      return request;
    }

    /// Append chunk payloads, checking offsets are contiguous
    static void collect(const std::vector<PieceDownloadResponse> &responses,
                        Bytes &received) {
      for (const auto &response : responses) {
        if (!response.has_chunk()) {
          continue;
        }
        EXPECT_EQ(response.chunk().offset(), received.size());
        EXPECT_LE(response.chunk().data().size(), kMaxChunkSize);
        const auto &payload{response.chunk().data()};
        received.insert(received.end(), payload.begin(), payload.end());
      }
    }

    PieceID id{PieceID::generate()};
    OrderLimit limit;
    Bytes data{generator.makeRandomBuffer(1000)};
  };

  /**
   * @given stored piece
   * @when whole piece is requested and ordered in two steps
   * @then bytes are sent only as far as ordered, content matches upload
   */
  TEST_F(DownloadSessionTest, DownloadFollowsOrders) {
    auto session{endpoint->download()};
    Bytes received;

    EXPECT_OUTCOME_TRUE(head, session->onMessage(first(1000, 300, 0, 1000)));
    ASSERT_FALSE(head.empty());
    EXPECT_TRUE(head.front().has_hash());
    EXPECT_TRUE(head.front().has_limit());
    EXPECT_EQ(head.front().hash().hash(), str(hashOf(data)));
    EXPECT_EQ(head.front().hash().piece_size(), 1000);
    EXPECT_OUTCOME_EQ(orders::verifyPieceHash(
                          *crypto, head.front().hash(), uplink.keys().public_key),
                      true);
    collect(head, received);
    EXPECT_EQ(received.size(), 300);
    EXPECT_EQ(session->sent(), 300);
    EXPECT_EQ(session->pending(), 700);

    EXPECT_OUTCOME_TRUE(rest, session->onMessage(order(1000)));
    collect(rest, received);
    EXPECT_EQ(received, data);
    EXPECT_EQ(session->pending(), 0);

    EXPECT_OUTCOME_TRUE_1(session->finish());
    EXPECT_EQ(session->state(), DownloadState::kDone);
    auto unsent{ctx->unsent_orders->list(satellite.id())};
    ASSERT_EQ(unsent.size(), 2);
    EXPECT_EQ(unsent[1].order.amount(), 1000);
    EXPECT_EQ(unsent[1].limit.action(), orders::pb::GET);
  }

  /**
   * @given first message without order
   * @when processed
   * @then only header response, no payload
   */
  TEST_F(DownloadSessionTest, NothingSentWithoutOrder) {
    auto session{endpoint->download()};
    EXPECT_OUTCOME_TRUE(head, session->onMessage(first(1000, 0, 100, 200)));
    ASSERT_EQ(head.size(), 1);
    EXPECT_FALSE(head.front().has_chunk());
    EXPECT_TRUE(head.front().has_hash());
    EXPECT_EQ(session->sent(), 0);

    EXPECT_OUTCOME_TRUE(responses, session->onMessage(order(200)));
    Bytes received;
    for (const auto &response : responses) {
      const auto &payload{response.chunk().data()};
      received.insert(received.end(), payload.begin(), payload.end());
    }
    EXPECT_EQ(received, Bytes(data.begin() + 100, data.begin() + 300));
  }

  /**
   * @given limit for 500 bytes
   * @when 600 bytes are requested
   * @then order allowance exceeded
   */
  TEST_F(DownloadSessionTest, RequestBeyondLimit) {
    auto session{endpoint->download()};
    EXPECT_OUTCOME_ERROR(EndpointError::kOrderAllowanceExceeded,
                         session->onMessage(first(500, 0, 0, 600)));
    EXPECT_EQ(session->state(), DownloadState::kFailed);
  }

  /**
   * @given requests outside the piece or without chunk
   * @when processed
   * @then invalid chunk request
   */
  TEST_F(DownloadSessionTest, InvalidChunk) {
    auto outside{endpoint->download()};
    EXPECT_OUTCOME_ERROR(EndpointError::kInvalidChunkRequest,
                         outside->onMessage(first(1000, 0, 900, 200)));

    auto empty{endpoint->download()};
    EXPECT_OUTCOME_ERROR(EndpointError::kInvalidChunkRequest,
                         empty->onMessage(first(1000, 0, 0, 0)));

    auto no_chunk{endpoint->download()};
    auto request{first(1000, 0, 0, 10)};
    request.clear_chunk();
    EXPECT_OUTCOME_ERROR(EndpointError::kInvalidChunkRequest,
                         no_chunk->onMessage(request));
  }

  /**
   * @given limit for piece that is not stored
   * @when download starts
   * @then piece not found
   */
  TEST_F(DownloadSessionTest, PieceNotFound) {
    id = PieceID::generate();
    auto session{endpoint->download()};
    EXPECT_OUTCOME_ERROR(EndpointError::kPieceNotFound,
                         session->onMessage(first(10, 0, 0, 10)));
  }

  /**
   * @given session without accepted limit
   * @when finish
   * @then no transition, closed after cancel
   */
  TEST_F(DownloadSessionTest, FinishBeforeStart) {
    auto session{endpoint->download()};
    EXPECT_OUTCOME_ERROR(fsm::FsmError::kNoTransition, session->finish());
    session->cancel();
    EXPECT_EQ(session->state(), DownloadState::kFailed);
    EXPECT_OUTCOME_ERROR(EndpointError::kSessionClosed, session->finish());
  }
}  // namespace ps::piecestore::endpoint
