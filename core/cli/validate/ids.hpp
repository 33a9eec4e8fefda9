/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>

#include "primitives/node_id/node_id.hpp"
#include "primitives/piece/piece_id.hpp"

namespace ps::cli {
  /// program_options validator of base32 identifiers
  template <typename Id>
  void validateId(boost::any &out, const std::vector<std::string> &values) {
    namespace po = boost::program_options;
    po::validators::check_first_occurrence(out);
    const auto &value{po::validators::get_single_string(values)};
    auto id{Id::fromString(value)};
    if (!id) {
      boost::throw_exception(po::invalid_option_value{value});
    }
    out = id.value();
  }
}  // namespace ps::cli

namespace ps::primitives {
  inline void validate(boost::any &out,
                       const std::vector<std::string> &values,
                       NodeID *,
                       int) {
    cli::validateId<NodeID>(out, values);
  }
}  // namespace ps::primitives

namespace ps::primitives::piece {
  inline void validate(boost::any &out,
                       const std::vector<std::string> &values,
                       PieceID *,
                       int) {
    cli::validateId<PieceID>(out, values);
  }
}  // namespace ps::primitives::piece
