/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "cli/piecestore/piecestore.hpp"
#include "clock/time.hpp"

namespace ps::cli::_piecestore {
  struct Piecestore_trash_restore {
    struct Args {
      StorageArgs storage;

      CLI_OPTS() {
        Opts opts;
        storage.add(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const Storage storage{args.storage.storage};
      const auto satellites{cliTry(storage.store->trashSatellites(),
                                   "listing trash")};
      size_t restored{};
      for (const auto &satellite : satellites) {
        restored += cliTry(storage.store->restoreTrash(satellite),
                           "restoring trash of {}",
                           satellite.toString());
      }
      fmt::print("restored {} pieces\n", restored);
    }
  };

  struct Piecestore_trash_empty {
    struct Args {
      StorageArgs storage;
      boost::optional<int64_t> older_than;
      boost::optional<std::string> before;

      CLI_OPTS() {
        Opts opts;
        storage.add(opts);
        auto opt{opts.add_options()};
        opt("older-than",
            po::value(&older_than),
            "delete pieces trashed more than given hours ago, "
            "trash expiry of config by default");
        opt("before",
            po::value(&before),
            "delete pieces trashed before UTC time, YYYY-MM-DDTHH:MM:SSZ");
        return opts;
      }
    };
    CLI_RUN() {
      if (args.older_than && args.before) {
        throw CliError{"--older-than and --before are exclusive"};
      }
      const Storage storage{args.storage.storage};
      auto before{storage.utc_clock->nowMicro()
                  - std::chrono::hours{args.older_than.value_or(
                      storage.config.trash_expiry.count())}};
      if (args.before) {
        before = cliTry(clock::timestampFromString(*args.before),
                        "parsing --before");
      }
      const auto satellites{cliTry(storage.store->trashSatellites(),
                                   "listing trash")};
      size_t deleted{};
      for (const auto &satellite : satellites) {
        deleted += cliTry(storage.store->emptyTrash(satellite, before),
                          "emptying trash of {}",
                          satellite.toString());
      }
      fmt::print("deleted {} pieces trashed before {}\n",
                 deleted,
                 clock::timestampToString(before));
    }
  };
}  // namespace ps::cli::_piecestore
