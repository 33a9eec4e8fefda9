/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ps::common, BlobError, e) {
  using ps::common::BlobError;

  switch (e) {
    case BlobError::kIncorrectLength:
      return "Input has incorrect length, not matching the blob size";
  }

  return "Unknown error";
}

namespace ps::common {

  // explicit instantiations for the most frequently used blobs
  template class Blob<16ul>;
  template class Blob<32ul>;

}  // namespace ps::common
