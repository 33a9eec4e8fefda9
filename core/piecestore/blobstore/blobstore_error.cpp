/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/blobstore/blobstore_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ps::piecestore::blobstore, BlobStoreError, e) {
  using ps::piecestore::blobstore::BlobStoreError;

  switch (e) {
    case (BlobStoreError::kBlobNotFound):
      return "BlobStore: blob not found";
    case (BlobStoreError::kCannotOpen):
      return "BlobStore: cannot open blob";
    case (BlobStoreError::kCannotCreate):
      return "BlobStore: cannot create blob";
    case (BlobStoreError::kReadError):
      return "BlobStore: read failed";
    case (BlobStoreError::kWriteError):
      return "BlobStore: write failed";
    case (BlobStoreError::kSyncError):
      return "BlobStore: fsync failed";
    case (BlobStoreError::kBlobClosed):
      return "BlobStore: blob closed";
    case (BlobStoreError::kAlreadyCommitted):
      return "BlobStore: blob is already committed or cancelled";
    case (BlobStoreError::kInvalidName):
      return "BlobStore: file name is not a blob name";
    case (BlobStoreError::kFilesystemError):
      return "BlobStore: filesystem error";
    case (BlobStoreError::kBlobExists):
      return "BlobStore: blob already exists";
  }
  return "BlobStore: unknown error";
}
