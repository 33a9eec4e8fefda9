/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/blobstore/impl/filesystem_blobstore.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/optional.hpp>

#include "codec/base32/base32.hpp"
#include "piecestore/blobstore/blobstore_error.hpp"
#include "piecestore/blobstore/impl/filesystem_blob.hpp"

namespace ps::piecestore::blobstore {
  namespace fs = boost::filesystem;

  namespace {
    constexpr size_t kKeyPrefixLength = 2;

    std::string nsDirName(const NodeID &ns) {
      return codec::base32::encodeLower(ns);
    }

    clock::Timestamp modTime(const fs::path &path) {
      boost::system::error_code ec;
      const auto time{fs::last_write_time(path, ec)};
      if (ec) {
        return {};
      }
      return std::chrono::duration_cast<clock::Timestamp>(
          clock::UnixTime{time});
    }

    /// Blob of a "<kk>/<rest>[.sj1]" file, none for foreign files
    boost::optional<BlobInfo> parseBlobFile(const fs::path &path,
                                            const NodeID &ns) {
      auto name{path.filename().string()};
      auto version{FormatVersion::kV0};
      if (path.extension() == kV1Extension) {
        version = FormatVersion::kV1;
        name = path.stem().string();
      } else if (path.has_extension()) {
        return boost::none;
      }
      auto key{primitives::piece::PieceID::fromString(
          path.parent_path().filename().string() + name)};
      if (!key) {
        return boost::none;
      }
      boost::system::error_code ec;
      const auto size{fs::file_size(path, ec)};
      if (ec) {
        return boost::none;
      }
      return BlobInfo{BlobRef{ns, key.value()}, version, size, modTime(path)};
    }
  }  // namespace

  FileSystemBlobStore::FileSystemBlobStore(
      fs::path root, std::shared_ptr<clock::UTCClock> clock)
      : root_{std::move(root)},
        blobs_{root_ / "blobs"},
        trash_{root_ / "trash"},
        temp_{root_ / "temp"},
        clock_{std::move(clock)},
        logger_{common::createLogger("blobstore")} {}

  outcome::result<std::shared_ptr<FileSystemBlobStore>>
  FileSystemBlobStore::open(const fs::path &root,
                            std::shared_ptr<clock::UTCClock> clock) {
    std::shared_ptr<FileSystemBlobStore> store{
        new FileSystemBlobStore(root, std::move(clock))};
    for (const auto &dir : {store->blobs_, store->trash_, store->temp_}) {
      boost::system::error_code ec;
      fs::create_directories(dir, ec);
      if (ec) {
        store->logger_->error(
            "cannot create directory {}: {}", dir.string(), ec.message());
        return BlobStoreError::kFilesystemError;
      }
    }
    return store;
  }

  fs::path FileSystemBlobStore::blobPath(const fs::path &dir,
                                         const BlobRef &ref,
                                         FormatVersion version) const {
    const auto key{codec::base32::encodeLower(ref.key)};
    auto name{key.substr(kKeyPrefixLength)};
    if (version == FormatVersion::kV1) {
      name += kV1Extension;
    }
    return dir / nsDirName(ref.ns) / key.substr(0, kKeyPrefixLength) / name;
  }

  outcome::result<std::pair<fs::path, FormatVersion>> FileSystemBlobStore::find(
      const fs::path &dir, const BlobRef &ref) const {
    for (const auto version : {FormatVersion::kV1, FormatVersion::kV0}) {
      auto path{blobPath(dir, ref, version)};
      boost::system::error_code ec;
      if (fs::is_regular_file(path, ec)) {
        return std::make_pair(std::move(path), version);
      }
    }
    return BlobStoreError::kBlobNotFound;
  }

  outcome::result<std::shared_ptr<BlobWriter>> FileSystemBlobStore::create(
      const BlobRef &ref) {
    if (find(blobs_, ref)) {
      return BlobStoreError::kBlobExists;
    }
    auto temp_path{temp_ / fs::unique_path("blob-%%%%%%%%%%%%%%%%.partial")};
    OUTCOME_TRY(writer,
                FileSystemBlobWriter::create(
                    temp_path, blobPath(blobs_, ref, FormatVersion::kV1)));
    return writer;
  }

  outcome::result<std::shared_ptr<BlobReader>> FileSystemBlobStore::open(
      const BlobRef &ref) const {
    OUTCOME_TRY(found, find(blobs_, ref));
    OUTCOME_TRY(reader, FileSystemBlobReader::open(found.first, found.second));
    return reader;
  }

  outcome::result<BlobInfo> FileSystemBlobStore::stat(
      const BlobRef &ref) const {
    OUTCOME_TRY(found, find(blobs_, ref));
    boost::system::error_code ec;
    const auto size{fs::file_size(found.first, ec)};
    if (ec) {
      return BlobStoreError::kFilesystemError;
    }
    return BlobInfo{ref, found.second, size, modTime(found.first)};
  }

  outcome::result<void> FileSystemBlobStore::remove(const BlobRef &ref) {
    OUTCOME_TRY(found, find(blobs_, ref));
    boost::system::error_code ec;
    fs::remove(found.first, ec);
    if (ec) {
      logger_->error("cannot remove {}: {}", found.first.string(), ec.message());
      return BlobStoreError::kFilesystemError;
    }
    return outcome::success();
  }

  outcome::result<void> FileSystemBlobStore::trash(const BlobRef &ref) {
    OUTCOME_TRY(found, find(blobs_, ref));
    const auto trash_path{blobPath(trash_, ref, found.second)};
    boost::system::error_code ec;
    fs::create_directories(trash_path.parent_path(), ec);
    if (!ec) {
      fs::rename(found.first, trash_path, ec);
    }
    if (!ec) {
      fs::last_write_time(trash_path, clock_->nowUTC().count(), ec);
    }
    if (ec) {
      logger_->error("cannot trash {}: {}", found.first.string(), ec.message());
      return BlobStoreError::kFilesystemError;
    }
    return outcome::success();
  }

  outcome::result<std::vector<BlobInfo>> FileSystemBlobStore::restoreTrash(
      const NodeID &ns) {
    OUTCOME_TRY(trashed, listTrash(ns));
    std::vector<BlobInfo> restored;
    for (const auto &info : trashed) {
      const auto from{blobPath(trash_, info.ref, info.version)};
      auto moved{find(blobs_, info.ref)
                     ? outcome::result<void>{BlobStoreError::kBlobExists}
                     : moveNoReplace(
                         from, blobPath(blobs_, info.ref, info.version))};
      if (!moved) {
        if (moved.error() == BlobStoreError::kBlobExists) {
          logger_->warn("{} of {} is live again, trashed copy kept",
                        info.ref.key.toString(),
                        ns.toString());
          continue;
        }
        logger_->error("cannot restore {}: {}",
                       from.string(),
                       moved.error().message());
        return moved.error();
      }
      restored.push_back(info);
    }
    return restored;
  }

  outcome::result<std::vector<PieceID>> FileSystemBlobStore::emptyTrash(
      const NodeID &ns, clock::Timestamp trashed_before) {
    OUTCOME_TRY(trashed, listTrash(ns));
    std::vector<PieceID> deleted;
    for (const auto &info : trashed) {
      if (info.mod_time >= trashed_before) {
        continue;
      }
      const auto path{blobPath(trash_, info.ref, info.version)};
      boost::system::error_code ec;
      fs::remove(path, ec);
      if (ec) {
        logger_->error("cannot empty trash {}: {}", path.string(), ec.message());
        return BlobStoreError::kFilesystemError;
      }
      deleted.push_back(info.ref.key);
    }
    return deleted;
  }

  outcome::result<std::vector<NodeID>> FileSystemBlobStore::listNamespaces()
      const {
    return listNamespacesIn(blobs_);
  }

  outcome::result<std::vector<NodeID>>
  FileSystemBlobStore::listTrashNamespaces() const {
    return listNamespacesIn(trash_);
  }

  outcome::result<void> FileSystemBlobStore::walkNamespace(
      const NodeID &ns, const WalkCallback &callback) const {
    OUTCOME_TRY(blobs, listBlobsIn(blobs_, ns));
    for (const auto &info : blobs) {
      OUTCOME_TRY(callback(info));
    }
    return outcome::success();
  }

  outcome::result<std::vector<BlobInfo>> FileSystemBlobStore::listTrash(
      const NodeID &ns) const {
    return listBlobsIn(trash_, ns);
  }

  outcome::result<void> FileSystemBlobStore::cleanTemp() {
    boost::system::error_code ec;
    for (fs::directory_iterator it{temp_, ec}, end; !ec && it != end;
         it.increment(ec)) {
      fs::remove(it->path(), ec);
    }
    if (ec) {
      return BlobStoreError::kFilesystemError;
    }
    return outcome::success();
  }

  const fs::path &FileSystemBlobStore::root() const {
    return root_;
  }

  outcome::result<std::vector<NodeID>> FileSystemBlobStore::listNamespacesIn(
      const fs::path &dir) {
    std::vector<NodeID> namespaces;
    boost::system::error_code ec;
    for (fs::directory_iterator it{dir, ec}, end; !ec && it != end;
         it.increment(ec)) {
      boost::system::error_code type_ec;
      if (!fs::is_directory(it->path(), type_ec)) {
        continue;
      }
      if (auto ns{NodeID::fromString(it->path().filename().string())}) {
        namespaces.push_back(ns.value());
      }
    }
    if (ec) {
      return BlobStoreError::kFilesystemError;
    }
    return namespaces;
  }

  outcome::result<std::vector<BlobInfo>> FileSystemBlobStore::listBlobsIn(
      const fs::path &dir, const NodeID &ns) {
    std::vector<BlobInfo> blobs;
    const auto ns_dir{dir / nsDirName(ns)};
    boost::system::error_code ec;
    if (!fs::exists(ns_dir, ec)) {
      return blobs;
    }
    for (fs::recursive_directory_iterator it{ns_dir, ec}, end; !ec && it != end;
         it.increment(ec)) {
      boost::system::error_code type_ec;
      if (it.depth() != 1 || !fs::is_regular_file(it->path(), type_ec)) {
        continue;
      }
      if (auto info{parseBlobFile(it->path(), ns)}) {
        blobs.push_back(std::move(*info));
      }
    }
    if (ec) {
      return BlobStoreError::kFilesystemError;
    }
    return blobs;
  }

}  // namespace ps::piecestore::blobstore
