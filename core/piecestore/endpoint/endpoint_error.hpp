/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/logger.hpp"
#include "common/outcome.hpp"

namespace ps::piecestore::endpoint {
  enum class EndpointError {
    kOrderAllowanceExceeded = 1,
    kUntrustedSatellite,
    kNotLimitSatellite,

    kHashMismatch,
    kInvalidPieceHashSignature,
    kPieceIdMismatch,
    kPieceSizeMismatch,
    kHashAlgorithmMismatch,

    kChunkOutOfOrder,
    kMissingOrderLimit,
    kUnexpectedMessage,
    kSessionClosed,

    kPieceNotFound,
    kInvalidChunkRequest,
    kInvalidFilter,
  };

  /// How a failed request is reported and logged
  enum class ErrorClass {
    kAuthorization,
    kIntegrity,
    kSequencing,
    kInvalidArgument,
    kResource,
  };

  ErrorClass classify(const std::error_code &error);

  /**
   * Authorization failures are logged at info, integrity failures at warn
   * with "integrity" prefix, resource failures at error.
   */
  void logFailure(const common::Logger &log,
                  const std::string &rpc,
                  const std::error_code &error);
}  // namespace ps::piecestore::endpoint

OUTCOME_HPP_DECLARE_ERROR(ps::piecestore::endpoint, EndpointError);
