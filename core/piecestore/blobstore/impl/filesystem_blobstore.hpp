/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>

#include "clock/utc_clock.hpp"
#include "common/logger.hpp"
#include "piecestore/blobstore/blobstore.hpp"

namespace ps::piecestore::blobstore {

  /// File name extension of V1 blobs
  constexpr auto kV1Extension = ".sj1";

  /**
   * @brief Blob store in a directory tree
   *
   * <root>/blobs/<namespace>/<kk>/<rest>[.sj1]
   * <root>/trash/<namespace>/<kk>/<rest>[.sj1]
   * <root>/temp/blob-*.partial
   *
   * Namespace and key are lower-case unpadded base32, "kk" is the first two
   * characters of the key.
   */
  class FileSystemBlobStore : public BlobStore {
   public:
    static outcome::result<std::shared_ptr<FileSystemBlobStore>> open(
        const boost::filesystem::path &root,
        std::shared_ptr<clock::UTCClock> clock);

    outcome::result<std::shared_ptr<BlobWriter>> create(
        const BlobRef &ref) override;

    outcome::result<std::shared_ptr<BlobReader>> open(
        const BlobRef &ref) const override;

    outcome::result<BlobInfo> stat(const BlobRef &ref) const override;

    outcome::result<void> remove(const BlobRef &ref) override;

    outcome::result<void> trash(const BlobRef &ref) override;

    outcome::result<std::vector<BlobInfo>> restoreTrash(
        const NodeID &ns) override;

    outcome::result<std::vector<PieceID>> emptyTrash(
        const NodeID &ns, clock::Timestamp trashed_before) override;

    outcome::result<std::vector<NodeID>> listNamespaces() const override;

    outcome::result<std::vector<NodeID>> listTrashNamespaces() const override;

    outcome::result<void> walkNamespace(
        const NodeID &ns, const WalkCallback &callback) const override;

    outcome::result<std::vector<BlobInfo>> listTrash(
        const NodeID &ns) const override;

    /// Remove leftovers of interrupted writes
    outcome::result<void> cleanTemp();

    const boost::filesystem::path &root() const;

   private:
    FileSystemBlobStore(boost::filesystem::path root,
                        std::shared_ptr<clock::UTCClock> clock);

    boost::filesystem::path blobPath(const boost::filesystem::path &dir,
                                     const BlobRef &ref,
                                     FormatVersion version) const;

    /// Existing file of the blob under dir, V1 first
    outcome::result<std::pair<boost::filesystem::path, FormatVersion>> find(
        const boost::filesystem::path &dir, const BlobRef &ref) const;

    static outcome::result<std::vector<NodeID>> listNamespacesIn(
        const boost::filesystem::path &dir);

    static outcome::result<std::vector<BlobInfo>> listBlobsIn(
        const boost::filesystem::path &dir, const NodeID &ns);

    boost::filesystem::path root_;
    boost::filesystem::path blobs_;
    boost::filesystem::path trash_;
    boost::filesystem::path temp_;
    std::shared_ptr<clock::UTCClock> clock_;
    common::Logger logger_;
  };

}  // namespace ps::piecestore::blobstore
