/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/piecestore/piecestore.hpp"
#include "cli/validate/ids.hpp"
#include "clock/time.hpp"
#include "common/hexutil.hpp"
#include "common/span.hpp"

namespace ps::cli::_piecestore {
  using common::hex_lower;
  using common::span::cbytes;

  struct Piecestore_header {
    struct Args {
      StorageArgs storage;

      CLI_OPTS() {
        Opts opts;
        storage.add(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const auto satellite{
          cliArgv<primitives::NodeID>(argv, 0, "satellite-id")};
      const auto id{cliArgv<primitives::piece::PieceID>(argv, 1, "piece-id")};
      const Storage storage{args.storage.storage};
      auto reader{cliTry(storage.store->reader(satellite, id),
                         "opening piece {}",
                         id.toString())};
      fmt::print("size: {}\n", reader->size());
      const auto header{cliTry(reader->header(), "reading header")};
      const auto &limit{header.order_limit()};
      fmt::print("format: {}\n",
                 piecestore::pb::PieceHeader::FormatVersion_Name(
                     header.format_version()));
      fmt::print("hash: {}\n", hex_lower(cbytes(header.hash())));
      fmt::print("hash algorithm: {}\n",
                 orders::pb::PieceHashAlgorithm_Name(header.hash_algorithm()));
      fmt::print(
          "created: {}\n",
          clock::timestampToString(orders::fromProto(header.creation_time())));
      fmt::print("uplink signature: {}\n",
                 hex_lower(cbytes(header.signature())));
      fmt::print("order limit:\n");
      fmt::print("  serial: {}\n", hex_lower(cbytes(limit.serial_number())));
      fmt::print("  action: {}\n", orders::pb::PieceAction_Name(limit.action()));
      fmt::print("  limit: {}\n", limit.limit());
      fmt::print("  uplink key: {}\n",
                 hex_lower(cbytes(limit.uplink_public_key())));
      if (orders::isSet(limit.piece_expiration())) {
        fmt::print("  piece expiration: {}\n",
                   clock::timestampToString(
                       orders::fromProto(limit.piece_expiration())));
      }
      fmt::print("  satellite address: {}\n", limit.satellite_address());
    }
  };
}  // namespace ps::cli::_piecestore
