/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/pieces/piece_store.hpp"

#include <algorithm>

#include "piecestore/blobstore/blobstore_error.hpp"
#include "piecestore/pieces/piece_store_error.hpp"

namespace ps::piecestore::pieces {
  using blobstore::BlobRef;
  using blobstore::BlobStoreError;

  PieceWriter::PieceWriter(std::shared_ptr<blobstore::BlobWriter> blob,
                           std::unique_ptr<PieceHasher> hasher,
                           std::function<void(uint64_t)> on_commit)
      : blob_{std::move(blob)},
        hasher_{std::move(hasher)},
        on_commit_{std::move(on_commit)} {}

  outcome::result<void> PieceWriter::write(BytesIn data) {
    if (closed_) {
      return PieceStoreError::kWriterClosed;
    }
    OUTCOME_TRY(blob_->write(data));
    return hasher_->write(data);
  }

  uint64_t PieceWriter::size() const {
    return blob_->size() - kV1PieceHeaderReservedArea;
  }

  outcome::result<Bytes> PieceWriter::hash() const {
    return hasher_->digest();
  }

  PieceHashAlgorithm PieceWriter::algorithm() const {
    return hasher_->algorithm();
  }

  outcome::result<void> PieceWriter::commit(PieceHeader header) {
    if (closed_) {
      return PieceStoreError::kWriterClosed;
    }
    closed_ = true;
    header.set_format_version(PieceHeader::FORMAT_V1);
    auto area{encodeHeaderArea(header)};
    if (!area) {
      OUTCOME_TRY(blob_->cancel());
      return area.error();
    }
    OUTCOME_TRY(blob_->writeAt(0, area.value()));
    auto committed{blob_->commit()};
    if (!committed) {
      if (committed.error() == BlobStoreError::kBlobExists) {
        return PieceStoreError::kPieceAlreadyExists;
      }
      return committed.error();
    }
    on_commit_(size());
    return outcome::success();
  }

  outcome::result<void> PieceWriter::cancel() {
    if (closed_) {
      return PieceStoreError::kWriterClosed;
    }
    closed_ = true;
    return blob_->cancel();
  }

  PieceReader::PieceReader(std::shared_ptr<blobstore::BlobReader> blob)
      : blob_{std::move(blob)} {}

  uint64_t PieceReader::payloadOffset() const {
    return blob_->formatVersion() == FormatVersion::kV1
               ? kV1PieceHeaderReservedArea
               : 0;
  }

  uint64_t PieceReader::size() const {
    const auto offset{payloadOffset()};
    return blob_->size() > offset ? blob_->size() - offset : 0;
  }

  FormatVersion PieceReader::formatVersion() const {
    return blob_->formatVersion();
  }

  outcome::result<size_t> PieceReader::read(uint64_t offset, BytesOut buffer) {
    return blob_->read(payloadOffset() + offset, buffer);
  }

  outcome::result<PieceHeader> PieceReader::header() {
    if (blob_->formatVersion() != FormatVersion::kV1) {
      return PieceStoreError::kHeaderUnavailable;
    }
    Bytes area(kV1PieceHeaderReservedArea);
    OUTCOME_TRY(bytes_read, blob_->read(0, area));
    if (bytes_read != area.size()) {
      return PieceStoreError::kPieceTooSmall;
    }
    return decodeHeaderArea(area);
  }

  PieceStore::PieceStore(std::shared_ptr<BlobStore> blobs,
                         uint64_t allocated_space)
      : blobs_{std::move(blobs)},
        allocated_space_{allocated_space},
        logger_{common::createLogger("piecestore")} {}

  outcome::result<void> PieceStore::init() {
    uint64_t used{};
    OUTCOME_TRY(namespaces, blobs_->listNamespaces());
    for (const auto &ns : namespaces) {
      OUTCOME_TRY(blobs_->walkNamespace(
          ns, [&](const blobstore::BlobInfo &info) -> outcome::result<void> {
            used += payloadSize(info);
            return outcome::success();
          }));
    }
    used_space_ = used;
    logger_->info("{} satellites, {} bytes used of {} allocated",
                  namespaces.size(),
                  used,
                  allocated_space_);
    return outcome::success();
  }

  outcome::result<std::unique_ptr<PieceWriter>> PieceStore::writer(
      const NodeID &satellite,
      const PieceID &id,
      PieceHashAlgorithm algorithm) {
    OUTCOME_TRY(hasher, makePieceHasher(algorithm));
    auto created{blobs_->create(BlobRef{satellite, id})};
    if (!created) {
      if (created.error() == BlobStoreError::kBlobExists) {
        return PieceStoreError::kPieceAlreadyExists;
      }
      return created.error();
    }
    auto &blob{created.value()};
    const Bytes reserved(kV1PieceHeaderReservedArea, 0);
    OUTCOME_TRY(blob->write(reserved));
    return std::make_unique<PieceWriter>(
        std::move(blob),
        std::move(hasher),
        [self{shared_from_this()}](uint64_t size) {
          self->used_space_ += size;
        });
  }

  outcome::result<std::unique_ptr<PieceReader>> PieceStore::reader(
      const NodeID &satellite, const PieceID &id) const {
    OUTCOME_TRY(blob, blobs_->open(BlobRef{satellite, id}));
    return std::make_unique<PieceReader>(std::move(blob));
  }

  outcome::result<bool> PieceStore::exists(const NodeID &satellite,
                                           const PieceID &id) const {
    auto info{blobs_->stat(BlobRef{satellite, id})};
    if (info) {
      return true;
    }
    if (info.error() == BlobStoreError::kBlobNotFound) {
      return false;
    }
    return info.error();
  }

  outcome::result<void> PieceStore::remove(const NodeID &satellite,
                                           const PieceID &id) {
    const BlobRef ref{satellite, id};
    OUTCOME_TRY(info, blobs_->stat(ref));
    OUTCOME_TRY(blobs_->remove(ref));
    release(payloadSize(info));
    return outcome::success();
  }

  outcome::result<void> PieceStore::trash(const NodeID &satellite,
                                          const PieceID &id) {
    const BlobRef ref{satellite, id};
    OUTCOME_TRY(info, blobs_->stat(ref));
    OUTCOME_TRY(blobs_->trash(ref));
    release(payloadSize(info));
    return outcome::success();
  }

  outcome::result<size_t> PieceStore::restoreTrash(const NodeID &satellite) {
    OUTCOME_TRY(restored, blobs_->restoreTrash(satellite));
    for (const auto &info : restored) {
      used_space_ += payloadSize(info);
    }
    return restored.size();
  }

  outcome::result<size_t> PieceStore::emptyTrash(
      const NodeID &satellite, clock::Timestamp trashed_before) {
    OUTCOME_TRY(deleted, blobs_->emptyTrash(satellite, trashed_before));
    return deleted.size();
  }

  outcome::result<void> PieceStore::walk(const NodeID &satellite,
                                         const WalkCallback &callback) const {
    return blobs_->walkNamespace(
        satellite,
        [&](const blobstore::BlobInfo &info) -> outcome::result<void> {
          auto creation_time{creationTime(info)};
          if (!creation_time) {
            if (creation_time.error() == BlobStoreError::kBlobNotFound) {
              return outcome::success();
            }
            return creation_time.error();
          }
          return callback(PieceInfo{info.ref.key,
                                    info.version,
                                    creation_time.value(),
                                    payloadSize(info)});
        });
  }

  outcome::result<std::vector<NodeID>> PieceStore::satellites() const {
    return blobs_->listNamespaces();
  }

  outcome::result<std::vector<NodeID>> PieceStore::trashSatellites() const {
    return blobs_->listTrashNamespaces();
  }

  uint64_t PieceStore::usedSpace() const {
    return used_space_;
  }

  uint64_t PieceStore::allocatedSpace() const {
    return allocated_space_;
  }

  uint64_t PieceStore::availableSpace() const {
    const uint64_t used{used_space_};
    return used < allocated_space_ ? allocated_space_ - used : 0;
  }

  void PieceStore::release(uint64_t size) {
    auto used{used_space_.load()};
    while (!used_space_.compare_exchange_weak(
        used, used > size ? used - size : 0)) {
    }
  }

  uint64_t PieceStore::payloadSize(const blobstore::BlobInfo &info) {
    if (info.version != FormatVersion::kV1) {
      return info.size;
    }
    return info.size > kV1PieceHeaderReservedArea
               ? info.size - kV1PieceHeaderReservedArea
               : 0;
  }

  outcome::result<clock::Timestamp> PieceStore::creationTime(
      const blobstore::BlobInfo &info) const {
    if (info.version != FormatVersion::kV1) {
      return info.mod_time;
    }
    OUTCOME_TRY(blob, blobs_->open(info.ref));
    auto header{PieceReader{blob}.header()};
    if (!header) {
      logger_->warn("piece {} of {} has unreadable header ({}), using mtime",
                    info.ref.key.toString(),
                    info.ref.ns.toString(),
                    header.error().message());
      return info.mod_time;
    }
    return orders::fromProto(header.value().creation_time());
  }

}  // namespace ps::piecestore::pieces
