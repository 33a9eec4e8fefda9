/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ps::piecestore::blobstore {

  /**
   * @brief BlobStore returns these types of errors
   */
  enum class BlobStoreError {
    kBlobNotFound = 1,
    kCannotOpen,
    kCannotCreate,
    kReadError,
    kWriteError,
    kSyncError,
    kBlobClosed,
    kAlreadyCommitted,
    kInvalidName,
    kFilesystemError,
    kBlobExists,
  };

}  // namespace ps::piecestore::blobstore

OUTCOME_HPP_DECLARE_ERROR(ps::piecestore::blobstore, BlobStoreError);
