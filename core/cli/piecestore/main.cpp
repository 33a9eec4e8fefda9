/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cli/piecestore/commands.hpp"

int main(int argc, const char *argv[]) {
  return ps::cli::run("piecestore", ps::cli::_piecestore::commands(), argc, argv);
}
