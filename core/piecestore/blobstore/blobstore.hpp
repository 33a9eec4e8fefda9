/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "clock/time.hpp"
#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "primitives/node_id/node_id.hpp"
#include "primitives/piece/piece_id.hpp"

namespace ps::piecestore::blobstore {
  using primitives::NodeID;
  using primitives::piece::PieceID;

  /// Storage format of a blob file
  enum class FormatVersion : int {
    /// payload only
    kV0 = 0,
    /// fixed size header area followed by payload
    kV1 = 1,
  };

  /// Blob address: namespace of a satellite and the piece id
  struct BlobRef {
    NodeID ns;
    PieceID key;

    bool operator==(const BlobRef &other) const {
      return ns == other.ns && key == other.key;
    }
  };

  struct BlobInfo {
    BlobRef ref;
    FormatVersion version{FormatVersion::kV1};
    /// Whole file size, header area included
    uint64_t size{};
    clock::Timestamp mod_time{};
  };

  /**
   * @brief Blob being written to a temporary location
   */
  class BlobWriter {
   public:
    virtual ~BlobWriter() = default;

    /// Append bytes at the end
    virtual outcome::result<void> write(BytesIn data) = 0;

    /// Overwrite already reserved bytes
    virtual outcome::result<void> writeAt(uint64_t offset, BytesIn data) = 0;

    /// Bytes written so far
    virtual uint64_t size() const = 0;

    virtual FormatVersion formatVersion() const = 0;

    /// Sync and move blob into its final place, kBlobExists if it is taken
    virtual outcome::result<void> commit() = 0;

    /// Discard written data
    virtual outcome::result<void> cancel() = 0;
  };

  /**
   * @brief Committed blob opened for reading
   */
  class BlobReader {
   public:
    virtual ~BlobReader() = default;

    /**
     * @brief read bytes from the blob
     * @param offset start position to read from
     * @param buffer where to put the bytes
     * @return number of bytes read, less than buffer size at the end
     */
    virtual outcome::result<size_t> read(uint64_t offset,
                                         BytesOut buffer) = 0;

    virtual uint64_t size() const = 0;

    virtual FormatVersion formatVersion() const = 0;
  };

  /**
   * @brief Namespaced blob storage with trash
   */
  class BlobStore {
   public:
    using WalkCallback = std::function<outcome::result<void>(const BlobInfo &)>;

    virtual ~BlobStore() = default;

    /// New V1 blob, invisible until committed, kBlobExists for a live key
    virtual outcome::result<std::shared_ptr<BlobWriter>> create(
        const BlobRef &ref) = 0;

    /// Open V1 blob, falling back to V0
    virtual outcome::result<std::shared_ptr<BlobReader>> open(
        const BlobRef &ref) const = 0;

    virtual outcome::result<BlobInfo> stat(const BlobRef &ref) const = 0;

    /// Delete blob in any format version
    virtual outcome::result<void> remove(const BlobRef &ref) = 0;

    /// Move blob to trash, its modification time becomes the trash time
    virtual outcome::result<void> trash(const BlobRef &ref) = 0;

    /**
     * Move trashed blobs of the namespace back.
     * Blobs whose key is live again stay in trash.
     * @return restored blobs
     */
    virtual outcome::result<std::vector<BlobInfo>> restoreTrash(
        const NodeID &ns) = 0;

    /**
     * Delete trashed blobs of the namespace trashed before the time
     * @return keys of deleted blobs
     */
    virtual outcome::result<std::vector<PieceID>> emptyTrash(
        const NodeID &ns, clock::Timestamp trashed_before) = 0;

    virtual outcome::result<std::vector<NodeID>> listNamespaces() const = 0;

    virtual outcome::result<std::vector<NodeID>> listTrashNamespaces()
        const = 0;

    /// Call back for every live blob of the namespace, stops on error
    virtual outcome::result<void> walkNamespace(
        const NodeID &ns, const WalkCallback &callback) const = 0;

    /// Trashed blobs of the namespace
    virtual outcome::result<std::vector<BlobInfo>> listTrash(
        const NodeID &ns) const = 0;
  };

}  // namespace ps::piecestore::blobstore
