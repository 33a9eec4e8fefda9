/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/command.hpp"
#include "cli/piecestore/header.hpp"
#include "cli/piecestore/id.hpp"
#include "cli/piecestore/trash.hpp"

namespace ps::cli::_piecestore {
  inline Command commands() {
    return command<Piecestore>(
        "storage node piece store tool",
        {
            {"id",
             command<Group>(
                 "piece ids",
                 {
                     {"new", command<Piecestore_id_new>("random root ids")},
                     {"derive",
                      command<Piecestore_id_derive>(
                          "<piece-id> <node-id> <piece-num>, id of erasure "
                          "share stored by node")},
                     {"node",
                      command<Piecestore_id_node>(
                          "<public-key-hex>, node id of public key")},
                 })},
            {"header",
             command<Piecestore_header>(
                 "<satellite-id> <piece-id>, print stored piece header")},
            {"trash",
             command<Group>(
                 "trashed pieces",
                 {
                     {"restore",
                      command<Piecestore_trash_restore>(
                          "restore trash of every satellite")},
                     {"empty",
                      command<Piecestore_trash_empty>(
                          "delete expired trash")},
                 })},
        });
  }
}  // namespace ps::cli::_piecestore
