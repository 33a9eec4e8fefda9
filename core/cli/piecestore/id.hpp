/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>

#include "cli/piecestore/piecestore.hpp"
#include "cli/validate/ids.hpp"
#include "common/hexutil.hpp"

namespace ps::cli::_piecestore {
  using crypto::secp256k1::kPublicKeyLength;
  using crypto::secp256k1::PublicKey;
  using primitives::NodeID;
  using primitives::piece::PieceID;

  struct Piecestore_id_new {
    struct Args {
      size_t count{};

      CLI_OPTS() {
        Opts opts;
        opts.add_options()(
            "count,n", po::value(&count)->default_value(1), "number of ids");
        return opts;
      }
    };
    CLI_RUN() {
      for (size_t i{0}; i < args.count; ++i) {
        fmt::print("{}\n", PieceID::generate().toString());
      }
    }
  };

  struct Piecestore_id_derive {
    using Args = Group::Args;
    CLI_RUN() {
      const auto root{cliArgv<PieceID>(argv, 0, "piece-id")};
      const auto node{cliArgv<NodeID>(argv, 1, "node-id")};
      const auto piece_num{cliArgv<uint32_t>(argv, 2, "piece-num")};
      fmt::print("{}\n", root.derive(node, piece_num).toString());
    }
  };

  struct Piecestore_id_node {
    using Args = Group::Args;
    CLI_RUN() {
      const auto &hex{cliArgv(argv, 0, "public-key-hex")};
      const auto bytes{cliTry(common::unhex(hex), "decoding public key")};
      if (bytes.size() != kPublicKeyLength) {
        throw CliError{"public key must be {} bytes, got {}",
                       kPublicKeyLength,
                       bytes.size()};
      }
      PublicKey key{};
      std::copy(bytes.begin(), bytes.end(), key.begin());
      fmt::print("{}\n", NodeID::fromPublicKey(key).toString());
    }
  };
}  // namespace ps::cli::_piecestore
