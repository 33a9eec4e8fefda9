/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <spdlog/spdlog.h>

#include "cli/cli.hpp"
#include "clock/impl/utc_clock_impl.hpp"
#include "common/logger.hpp"
#include "piecestore/blobstore/impl/filesystem_blobstore.hpp"
#include "piecestore/config.hpp"
#include "piecestore/pieces/piece_store.hpp"

namespace ps::cli::_piecestore {
  using piecestore::Config;
  using piecestore::blobstore::FileSystemBlobStore;
  using piecestore::pieces::PieceStore;

  struct Piecestore {
    struct Args {
      char log_level{};

      CLI_OPTS() {
        Opts opts{"piecestore options"};
        auto opt{opts.add_options()};
        opt("log,l",
            po::value(&log_level)->default_value('i')->notifier([](char level) {
              spdlog::set_level(common::logLevelFromChar(level));
            }),
            "log level, [e,w,i,d,t]");
        return opts;
      }
    };
    CLI_RUN() {
      throw ShowHelp{};
    }
  };

  /// Required --storage option
  struct StorageArgs {
    boost::filesystem::path storage;

    void add(Opts &opts) {
      opts.add_options()("storage,s",
                         po::value(&storage)->required(),
                         "piece storage directory");
    }
  };

  /// Piece store opened from --storage directory
  struct Storage {
    Config config;
    std::shared_ptr<clock::UTCClock> utc_clock;
    std::shared_ptr<PieceStore> store;

    explicit Storage(const boost::filesystem::path &path)
        : config{cliTry(
            Config::read(path), "reading config in {}", path.string())},
          utc_clock{std::make_shared<clock::UTCClockImpl>()} {
      auto blobs{cliTry(FileSystemBlobStore::open(path, utc_clock),
                        "opening storage {}",
                        path.string())};
      store = std::make_shared<PieceStore>(blobs, config.allocated_space);
      cliTry(store->init(), "counting used space");
    }
  };
}  // namespace ps::cli::_piecestore
