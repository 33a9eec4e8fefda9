/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/endpoint/endpoint_error.hpp"

#include "orders/order_error.hpp"
#include "piecestore/bloom/bloom_filter.hpp"
#include "piecestore/pieces/piece_store_error.hpp"
#include "primitives/piece/piece_id.hpp"

namespace ps::piecestore::endpoint {
  ErrorClass classify(const std::error_code &error) {
    if (error.category() == make_error_code(orders::OrderError{}).category()) {
      return ErrorClass::kAuthorization;
    }
    if (error.category() == make_error_code(EndpointError{}).category()) {
      switch (static_cast<EndpointError>(error.value())) {
        case EndpointError::kOrderAllowanceExceeded:
        case EndpointError::kUntrustedSatellite:
        case EndpointError::kNotLimitSatellite:
          return ErrorClass::kAuthorization;
        case EndpointError::kHashMismatch:
        case EndpointError::kInvalidPieceHashSignature:
        case EndpointError::kPieceIdMismatch:
        case EndpointError::kPieceSizeMismatch:
        case EndpointError::kHashAlgorithmMismatch:
          return ErrorClass::kIntegrity;
        case EndpointError::kChunkOutOfOrder:
        case EndpointError::kMissingOrderLimit:
        case EndpointError::kUnexpectedMessage:
        case EndpointError::kSessionClosed:
          return ErrorClass::kSequencing;
        case EndpointError::kPieceNotFound:
        case EndpointError::kInvalidChunkRequest:
        case EndpointError::kInvalidFilter:
          return ErrorClass::kInvalidArgument;
      }
    }
    if (error == pieces::PieceStoreError::kPieceAlreadyExists) {
      return ErrorClass::kInvalidArgument;
    }
    if (error.category()
            == make_error_code(primitives::piece::PieceIdError{}).category()
        || error.category()
               == make_error_code(bloom::BloomFilterError{}).category()) {
      return ErrorClass::kInvalidArgument;
    }
    return ErrorClass::kResource;
  }

  void logFailure(const common::Logger &log,
                  const std::string &rpc,
                  const std::error_code &error) {
    switch (classify(error)) {
      case ErrorClass::kAuthorization:
        log->info("{} unauthorized: {}", rpc, error.message());
        return;
      case ErrorClass::kIntegrity:
        log->warn("{} integrity failure: {}", rpc, error.message());
        return;
      case ErrorClass::kSequencing:
      case ErrorClass::kInvalidArgument:
        log->info("{} rejected: {}", rpc, error.message());
        return;
      case ErrorClass::kResource:
        log->error("{} failed: {}", rpc, error.message());
        return;
    }
  }
}  // namespace ps::piecestore::endpoint

OUTCOME_CPP_DEFINE_CATEGORY(ps::piecestore::endpoint, EndpointError, e) {
  using ps::piecestore::endpoint::EndpointError;
  switch (e) {
    case EndpointError::kOrderAllowanceExceeded:
      return "EndpointError: transfer exceeds ordered bytes";
    case EndpointError::kUntrustedSatellite:
      return "EndpointError: caller is not a trusted satellite";
    case EndpointError::kNotLimitSatellite:
      return "EndpointError: caller is not the satellite of the order limit";
    case EndpointError::kHashMismatch:
      return "EndpointError: piece hash does not match received data";
    case EndpointError::kInvalidPieceHashSignature:
      return "EndpointError: invalid piece hash signature";
    case EndpointError::kPieceIdMismatch:
      return "EndpointError: piece hash is for another piece";
    case EndpointError::kPieceSizeMismatch:
      return "EndpointError: piece hash size does not match received data";
    case EndpointError::kHashAlgorithmMismatch:
      return "EndpointError: piece hash algorithm differs from session";
    case EndpointError::kChunkOutOfOrder:
      return "EndpointError: chunk offset does not match written bytes";
    case EndpointError::kMissingOrderLimit:
      return "EndpointError: first message must contain order limit";
    case EndpointError::kUnexpectedMessage:
      return "EndpointError: unexpected message";
    case EndpointError::kSessionClosed:
      return "EndpointError: session is closed";
    case EndpointError::kPieceNotFound:
      return "EndpointError: piece not found";
    case EndpointError::kInvalidChunkRequest:
      return "EndpointError: requested range is outside of the piece";
    case EndpointError::kInvalidFilter:
      return "EndpointError: invalid retain filter";
  }
  return "EndpointError: unknown error";
}
