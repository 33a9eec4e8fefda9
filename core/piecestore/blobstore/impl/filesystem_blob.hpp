/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>

#include "common/logger.hpp"
#include "piecestore/blobstore/blobstore.hpp"

namespace ps::piecestore::blobstore {

  const int kUnopenedFileDescriptor = -1;

  /**
   * Move file, never replacing an existing destination
   * @return kBlobExists if destination exists
   */
  outcome::result<void> moveNoReplace(const boost::filesystem::path &from,
                                      const boost::filesystem::path &to);

  /// Owned POSIX file descriptor
  class FileDescriptor {
   public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd);

    FileDescriptor(const FileDescriptor &) = delete;
    FileDescriptor &operator=(const FileDescriptor &) = delete;
    FileDescriptor(FileDescriptor &&other) noexcept;
    FileDescriptor &operator=(FileDescriptor &&other) noexcept;

    ~FileDescriptor();

    int get() const;

    bool isOpened() const;

    outcome::result<void> close();

   private:
    int fd_{kUnopenedFileDescriptor};
  };

  /**
   * Blob written to a temporary file and renamed into place on commit
   */
  class FileSystemBlobWriter : public BlobWriter {
   public:
    static outcome::result<std::shared_ptr<FileSystemBlobWriter>> create(
        boost::filesystem::path temp_path, boost::filesystem::path final_path);

    /// Unfinished blob is cancelled
    ~FileSystemBlobWriter() override;

    outcome::result<void> write(BytesIn data) override;

    outcome::result<void> writeAt(uint64_t offset, BytesIn data) override;

    uint64_t size() const override;

    FormatVersion formatVersion() const override;

    outcome::result<void> commit() override;

    outcome::result<void> cancel() override;

   private:
    FileSystemBlobWriter(FileDescriptor fd,
                         boost::filesystem::path temp_path,
                         boost::filesystem::path final_path);

    outcome::result<void> cancelFile();

    FileDescriptor fd_;
    boost::filesystem::path temp_path_;
    boost::filesystem::path final_path_;
    uint64_t size_{};
    bool finished_{false};
    common::Logger logger_;
  };

  class FileSystemBlobReader : public BlobReader {
   public:
    static outcome::result<std::shared_ptr<FileSystemBlobReader>> open(
        const boost::filesystem::path &path, FormatVersion version);

    outcome::result<size_t> read(uint64_t offset, BytesOut buffer) override;

    uint64_t size() const override;

    FormatVersion formatVersion() const override;

   private:
    FileSystemBlobReader(FileDescriptor fd,
                         uint64_t size,
                         FormatVersion version);

    FileDescriptor fd_;
    uint64_t size_;
    FormatVersion version_;
  };

}  // namespace ps::piecestore::blobstore
