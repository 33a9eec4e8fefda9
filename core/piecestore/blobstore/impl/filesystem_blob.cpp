/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/blobstore/impl/filesystem_blob.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>

#include <boost/filesystem/operations.hpp>

#include "piecestore/blobstore/blobstore_error.hpp"

namespace ps::piecestore::blobstore {
  namespace fs = boost::filesystem;

  FileDescriptor::FileDescriptor(int fd) : fd_{fd} {}

  FileDescriptor::FileDescriptor(FileDescriptor &&other) noexcept
      : fd_{other.fd_} {
    other.fd_ = kUnopenedFileDescriptor;
  }

  FileDescriptor &FileDescriptor::operator=(FileDescriptor &&other) noexcept {
    if (this != &other) {
      if (isOpened()) {
        ::close(fd_);
      }
      fd_ = other.fd_;
      other.fd_ = kUnopenedFileDescriptor;
    }
    return *this;
  }

  FileDescriptor::~FileDescriptor() {
    if (isOpened()) {
      ::close(fd_);
    }
  }

  int FileDescriptor::get() const {
    return fd_;
  }

  bool FileDescriptor::isOpened() const {
    return fd_ != kUnopenedFileDescriptor;
  }

  outcome::result<void> FileDescriptor::close() {
    if (!isOpened()) {
      return BlobStoreError::kBlobClosed;
    }
    const auto res{::close(fd_)};
    fd_ = kUnopenedFileDescriptor;
    if (res != 0) {
      return BlobStoreError::kWriteError;
    }
    return outcome::success();
  }

  outcome::result<void> moveNoReplace(const fs::path &from,
                                      const fs::path &to) {
    boost::system::error_code ec;
    fs::create_directories(to.parent_path(), ec);
    if (!ec) {
      fs::create_hard_link(from, to, ec);
    }
    if (ec == boost::system::errc::file_exists) {
      return BlobStoreError::kBlobExists;
    }
    if (!ec) {
      fs::remove(from, ec);
    }
    if (ec) {
      return BlobStoreError::kFilesystemError;
    }
    return outcome::success();
  }

  namespace {
    outcome::result<void> writeAll(int fd, uint64_t offset, BytesIn data) {
      while (!data.empty()) {
        const auto written{
            ::pwrite(fd, data.data(), data.size(), static_cast<off_t>(offset))};
        if (written < 0) {
          if (errno == EINTR) {
            continue;
          }
          return BlobStoreError::kWriteError;
        }
        offset += written;
        data = data.subspan(written);
      }
      return outcome::success();
    }
  }  // namespace

  outcome::result<std::shared_ptr<FileSystemBlobWriter>>
  FileSystemBlobWriter::create(fs::path temp_path, fs::path final_path) {
    FileDescriptor fd{
        ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644)};
    if (!fd.isOpened()) {
      return BlobStoreError::kCannotCreate;
    }
    return std::shared_ptr<FileSystemBlobWriter>(new FileSystemBlobWriter(
        std::move(fd), std::move(temp_path), std::move(final_path)));
  }

  FileSystemBlobWriter::FileSystemBlobWriter(FileDescriptor fd,
                                             fs::path temp_path,
                                             fs::path final_path)
      : fd_{std::move(fd)},
        temp_path_{std::move(temp_path)},
        final_path_{std::move(final_path)},
        logger_{common::createLogger("blobstore")} {}

  FileSystemBlobWriter::~FileSystemBlobWriter() {
    if (!finished_) {
      if (auto res{cancel()}; !res) {
        logger_->warn("cannot cancel blob {}: {}",
                      temp_path_.string(),
                      res.error().message());
      }
    }
  }

  outcome::result<void> FileSystemBlobWriter::write(BytesIn data) {
    if (finished_) {
      return BlobStoreError::kAlreadyCommitted;
    }
    OUTCOME_TRY(writeAll(fd_.get(), size_, data));
    size_ += data.size();
    return outcome::success();
  }

  outcome::result<void> FileSystemBlobWriter::writeAt(uint64_t offset,
                                                      BytesIn data) {
    if (finished_) {
      return BlobStoreError::kAlreadyCommitted;
    }
    OUTCOME_TRY(writeAll(fd_.get(), offset, data));
    size_ = std::max<uint64_t>(size_, offset + data.size());
    return outcome::success();
  }

  uint64_t FileSystemBlobWriter::size() const {
    return size_;
  }

  FormatVersion FileSystemBlobWriter::formatVersion() const {
    return FormatVersion::kV1;
  }

  outcome::result<void> FileSystemBlobWriter::commit() {
    if (finished_) {
      return BlobStoreError::kAlreadyCommitted;
    }
    finished_ = true;
    if (::fsync(fd_.get()) != 0) {
      OUTCOME_TRY(cancelFile());
      return BlobStoreError::kSyncError;
    }
    OUTCOME_TRY(fd_.close());

    auto moved{moveNoReplace(temp_path_, final_path_)};
    if (!moved) {
      logger_->error("cannot commit blob {}: {}",
                     final_path_.string(),
                     moved.error().message());
      boost::system::error_code ec;
      fs::remove(temp_path_, ec);
      return moved.error();
    }
    return outcome::success();
  }

  outcome::result<void> FileSystemBlobWriter::cancel() {
    if (finished_) {
      return BlobStoreError::kAlreadyCommitted;
    }
    finished_ = true;
    return cancelFile();
  }

  outcome::result<void> FileSystemBlobWriter::cancelFile() {
    if (fd_.isOpened()) {
      OUTCOME_TRY(fd_.close());
    }
    boost::system::error_code ec;
    fs::remove(temp_path_, ec);
    if (ec) {
      return BlobStoreError::kFilesystemError;
    }
    return outcome::success();
  }

  outcome::result<std::shared_ptr<FileSystemBlobReader>>
  FileSystemBlobReader::open(const fs::path &path, FormatVersion version) {
    FileDescriptor fd{::open(path.c_str(), O_RDONLY)};
    if (!fd.isOpened()) {
      if (errno == ENOENT) {
        return BlobStoreError::kBlobNotFound;
      }
      return BlobStoreError::kCannotOpen;
    }
    struct stat st {};
    if (::fstat(fd.get(), &st) != 0) {
      return BlobStoreError::kCannotOpen;
    }
    return std::shared_ptr<FileSystemBlobReader>(new FileSystemBlobReader(
        std::move(fd), static_cast<uint64_t>(st.st_size), version));
  }

  FileSystemBlobReader::FileSystemBlobReader(FileDescriptor fd,
                                             uint64_t size,
                                             FormatVersion version)
      : fd_{std::move(fd)}, size_{size}, version_{version} {}

  outcome::result<size_t> FileSystemBlobReader::read(uint64_t offset,
                                                     BytesOut buffer) {
    size_t total{};
    while (total < static_cast<size_t>(buffer.size())) {
      const auto n{::pread(fd_.get(),
                           buffer.data() + total,
                           buffer.size() - total,
                           static_cast<off_t>(offset + total))};
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        return BlobStoreError::kReadError;
      }
      if (n == 0) {
        break;
      }
      total += n;
    }
    return total;
  }

  uint64_t FileSystemBlobReader::size() const {
    return size_;
  }

  FormatVersion FileSystemBlobReader::formatVersion() const {
    return version_;
  }

}  // namespace ps::piecestore::blobstore
