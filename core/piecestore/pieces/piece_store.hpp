/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>

#include "common/logger.hpp"
#include "piecestore/blobstore/blobstore.hpp"
#include "piecestore/piece_header.hpp"
#include "piecestore/pieces/piece_hasher.hpp"

namespace ps::piecestore::pieces {
  using blobstore::BlobStore;
  using blobstore::FormatVersion;
  using primitives::NodeID;
  using primitives::piece::PieceID;

  class PieceStore;

  /// Live piece as seen by walk()
  struct PieceInfo {
    PieceID id;
    FormatVersion version{FormatVersion::kV1};
    clock::Timestamp creation_time{};
    /// Payload bytes, header area excluded
    uint64_t size{};
  };

  /**
   * Payload writer, the header is written by commit()
   */
  class PieceWriter {
   public:
    PieceWriter(std::shared_ptr<blobstore::BlobWriter> blob,
                std::unique_ptr<PieceHasher> hasher,
                std::function<void(uint64_t)> on_commit);

    /// Append payload
    outcome::result<void> write(BytesIn data);

    /// Payload bytes written so far
    uint64_t size() const;

    /// Hash of the payload written so far
    outcome::result<Bytes> hash() const;

    PieceHashAlgorithm algorithm() const;

    /**
     * Write header area and make the piece visible
     * @param header - format version is set to V1
     */
    outcome::result<void> commit(PieceHeader header);

    outcome::result<void> cancel();

   private:
    std::shared_ptr<blobstore::BlobWriter> blob_;
    std::unique_ptr<PieceHasher> hasher_;
    std::function<void(uint64_t)> on_commit_;
    bool closed_{false};
  };

  class PieceReader {
   public:
    explicit PieceReader(std::shared_ptr<blobstore::BlobReader> blob);

    /// Payload size
    uint64_t size() const;

    FormatVersion formatVersion() const;

    /// Read payload starting at offset
    outcome::result<size_t> read(uint64_t offset, BytesOut buffer);

    /// kHeaderUnavailable for V0 pieces
    outcome::result<PieceHeader> header();

   private:
    uint64_t payloadOffset() const;

    std::shared_ptr<blobstore::BlobReader> blob_;
  };

  /**
   * Pieces of all satellites with headers and space accounting
   */
  class PieceStore : public std::enable_shared_from_this<PieceStore> {
   public:
    using WalkCallback =
        std::function<outcome::result<void>(const PieceInfo &)>;

    PieceStore(std::shared_ptr<BlobStore> blobs, uint64_t allocated_space);

    /// Count space used by stored pieces
    outcome::result<void> init();

    /// kPieceAlreadyExists if the piece is stored
    outcome::result<std::unique_ptr<PieceWriter>> writer(
        const NodeID &satellite,
        const PieceID &id,
        PieceHashAlgorithm algorithm);

    outcome::result<std::unique_ptr<PieceReader>> reader(
        const NodeID &satellite, const PieceID &id) const;

    outcome::result<bool> exists(const NodeID &satellite,
                                 const PieceID &id) const;

    outcome::result<void> remove(const NodeID &satellite, const PieceID &id);

    outcome::result<void> trash(const NodeID &satellite, const PieceID &id);

    /// @return number of restored pieces
    outcome::result<size_t> restoreTrash(const NodeID &satellite);

    /// @return number of deleted pieces
    outcome::result<size_t> emptyTrash(const NodeID &satellite,
                                       clock::Timestamp trashed_before);

    /**
     * Visit live pieces of the satellite, stops on callback error.
     * Pieces removed during the walk are skipped.
     */
    outcome::result<void> walk(const NodeID &satellite,
                               const WalkCallback &callback) const;

    /// Satellites with live pieces
    outcome::result<std::vector<NodeID>> satellites() const;

    /// Satellites with trashed pieces
    outcome::result<std::vector<NodeID>> trashSatellites() const;

    uint64_t usedSpace() const;

    uint64_t allocatedSpace() const;

    /// Allocated minus used, zero when overused
    uint64_t availableSpace() const;

   private:
    static uint64_t payloadSize(const blobstore::BlobInfo &info);

    /// Subtract from used space, saturating at zero
    void release(uint64_t size);

    outcome::result<clock::Timestamp> creationTime(
        const blobstore::BlobInfo &info) const;

    std::shared_ptr<BlobStore> blobs_;
    uint64_t allocated_space_;
    std::atomic<uint64_t> used_space_{0};
    common::Logger logger_;
  };

}  // namespace ps::piecestore::pieces
